#pragma once
#include "isa.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpu16 {

/**
 * Matcher de operandos para una forma {registros, inmediato}.
 * Acepta exactamente:  R<n>( +R<n>)*( +<imm>)?
 * - registros con 'R' pegado a los dígitos, inmediato decimal sin prefijo
 * - uno o más espacios entre operandos, nada antes ni después
 * - forma vacía (halt) solo acepta ""
 * match() devuelve los valores en orden (registros primero) o nullopt.
 */
class OperandMatcher {
public:
  constexpr explicit OperandMatcher(Shape shape) : shape_(shape) {}

  std::optional<std::vector<Operand>> match(std::string_view text) const;

  constexpr Shape shape() const { return shape_; }

  // Patrón legible para mensajes de error, ej. "R<n> R<n> <imm>".
  std::string pattern() const;

private:
  Shape shape_;
};

// Matcher precomputado para la forma dada (tabla estática, no se reconstruye).
const OperandMatcher& matcher_for(Shape shape);

} // namespace cpu16
