#pragma once
#include "config.hpp"
#include "types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cpu16 {

// ISA: 11 instrucciones, opcode de 4 bits.
enum class OpCode : std::uint8_t {
  MOV1,   // mov1 Rn addr   RF[rn] <= mem[addr]
  MOV2,   // mov2 Rn addr   mem[addr] <= RF[rn]
  MOV3,   // mov3 Rn Rm     mem[RF[rn]] <= RF[rm]
  MOV4,   // mov4 Rn imm    mem[n] <= imm  (escribe memoria, no el registro)
  ADD,    // add  Rd Ra Rb  RF[rd] <= RF[ra] + RF[rb]
  SUBT,   // subt Rd Ra Rb  RF[rd] <= RF[ra] - RF[rb]
  JZ,     // jz   Rn target salta si RF[rn] != 0
  HALT,   // halt
  MUL,    // mul  Rd Ra Rb  RF[rd] <= RF[ra] * RF[rb]
  LOAD,   // load Rd Rs     RF[rd] <= mem[RF[rs]]
  READM   // readm imm      out[time] <= imm
};

inline constexpr std::size_t kNumOpCodes = 11;

// Forma de los operandos: cantidad de registros + inmediato final opcional.
struct Shape {
  unsigned registers = 0;
  bool     immediate = false;

  constexpr unsigned count() const { return registers + (immediate ? 1u : 0u); }
  friend constexpr bool operator==(const Shape&, const Shape&) = default;
};

struct OpInfo {
  OpCode           op;
  std::string_view mnemonic;
  std::uint8_t     code;   // número que va en los 4 bits altos
  Shape            shape;
};

inline constexpr std::array<OpInfo, kNumOpCodes> kOpTable{{
  {OpCode::MOV1,  "mov1",  0,  {1, true}},
  {OpCode::MOV2,  "mov2",  1,  {1, true}},
  {OpCode::MOV3,  "mov3",  2,  {2, false}},
  {OpCode::MOV4,  "mov4",  3,  {1, true}},
  {OpCode::ADD,   "add",   4,  {3, false}},
  {OpCode::SUBT,  "subt",  5,  {3, false}},
  {OpCode::JZ,    "jz",    6,  {1, true}},
  {OpCode::HALT,  "halt",  15, {0, false}},
  {OpCode::MUL,   "mul",   8,  {3, false}},
  {OpCode::LOAD,  "load",  10, {2, false}},
  {OpCode::READM, "readm", 7,  {0, true}},
}};

// Validación de la tabla en compilación: índice == enum, códigos de 4 bits
// únicos, mnemónicos únicos y como mucho 3 registros.
constexpr bool op_table_is_valid() {
  for (std::size_t i = 0; i < kOpTable.size(); ++i) {
    const auto& a = kOpTable[i];
    if (static_cast<std::size_t>(a.op) != i) return false;
    if (a.code >= (1u << cfg::kOpcodeBits)) return false;
    if (a.shape.registers > cfg::kNumFields) return false;
    if (a.mnemonic.empty()) return false;
    for (std::size_t j = i + 1; j < kOpTable.size(); ++j) {
      if (a.code == kOpTable[j].code) return false;
      if (a.mnemonic == kOpTable[j].mnemonic) return false;
    }
  }
  return true;
}
static_assert(op_table_is_valid(), "tabla de opcodes inválida");

inline constexpr const OpInfo& op_info(OpCode op) {
  return kOpTable[static_cast<std::size_t>(op)];
}

inline constexpr std::string_view mnemonic(OpCode op) { return op_info(op).mnemonic; }

// Búsqueda por mnemónico (sensible a mayúsculas).
std::optional<OpCode> find_opcode(std::string_view mnemonic);

// ---- Operandos tipados por instrucción ----
struct Mov1  { unsigned rn;  Addr addr; };
struct Mov2  { unsigned rn;  Addr addr; };
struct Mov3  { unsigned rn;  unsigned rm; };
struct Mov4  { Addr addr;    Value imm; };
struct Add   { unsigned rd;  unsigned ra; unsigned rb; };
struct Subt  { unsigned rd;  unsigned ra; unsigned rb; };
struct Jz    { unsigned rn;  std::size_t target; };
struct Halt  {};
struct Mul   { unsigned rd;  unsigned ra; unsigned rb; };
struct Load  { unsigned rd;  unsigned rs; };
struct Readm { Value imm; };

using Operation = std::variant<Mov1, Mov2, Mov3, Mov4, Add, Subt, Jz, Halt, Mul, Load, Readm>;

// Arma la variante a partir del opcode y los operandos ya validados.
Operation make_operation(OpCode op, const std::vector<Operand>& args);

// Instrucción decodificada (inmutable una vez creada).
struct Instr {
  OpCode               op{};
  std::vector<Operand> args;       // registros primero, inmediato al final
  Operation            operation;  // acción semántica
  Word                 word = 0;
  std::string          hex;        // 4 dígitos hex en mayúscula
};

// Programa = lista plana de instrucciones.
struct Program {
  std::vector<Instr> code;
};

} // namespace cpu16
