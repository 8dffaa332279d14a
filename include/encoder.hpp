#pragma once
#include "isa.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace cpu16 {

// Empaquetado de la palabra de 16 bits:
//   [opcode:4][f0:4][f1:4][f2:4]
// Registro i va en el campo i; el inmediato ocupa los bits bajos que quedan
// libres después del último registro (12, 8 o 4 bits).
// Cada operando se valida contra el ancho de su campo (EncodeError).
Word encode(OpCode op, const std::vector<Operand>& args);

// Bits disponibles para el inmediato con 'registers' campos ocupados.
constexpr unsigned immediate_bits(unsigned registers) {
  return cfg::kFieldBits * (cfg::kNumFields - registers);
}

// Decimal -> hex en mayúscula con 'digits' dígitos (padding con ceros).
// Lanza EncodeError si el valor no entra.
std::string to_hex(std::uint64_t value, std::size_t digits);

// Número de opcode contenido en los 4 bits altos de la palabra.
constexpr unsigned opcode_field(Word w) {
  return static_cast<unsigned>(w) >> (cfg::kWordBits - cfg::kOpcodeBits);
}

} // namespace cpu16
