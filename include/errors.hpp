#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace cpu16 {

/**
 * Errores del ensamblador. Todos terminan la línea que se está parseando.
 * - SyntaxError:             no se encontró el mnemónico
 * - UnknownInstructionError: mnemónico fuera de la tabla de opcodes
 * - OperandError:            los operandos no cumplen la forma del opcode
 * - EncodeError:             la palabra no entra en el ancho fijo
 * line() queda vacío hasta que el ensamblador de programa lo completa.
 */
class AsmError : public std::runtime_error {
public:
  explicit AsmError(const std::string& msg, std::optional<std::size_t> line = std::nullopt)
    : std::runtime_error(line ? "linea " + std::to_string(*line) + ": " + msg : msg),
      detail_(msg), line_(line) {}

  const std::string&         detail() const { return detail_; }
  std::optional<std::size_t> line()   const { return line_; }

private:
  std::string                detail_;
  std::optional<std::size_t> line_;
};

class SyntaxError : public AsmError {
public:
  using AsmError::AsmError;
};

class UnknownInstructionError : public AsmError {
public:
  using AsmError::AsmError;
};

class OperandError : public AsmError {
public:
  using AsmError::AsmError;
};

class EncodeError : public AsmError {
public:
  using AsmError::AsmError;
};

} // namespace cpu16
