#include "isa.hpp"
#include "errors.hpp"
#include <string>

namespace cpu16
{

std::optional<OpCode> find_opcode(std::string_view name) {
  for (const auto& e : kOpTable) {
    if (e.mnemonic == name) return e.op;
  }
  return std::nullopt;
}

Operation make_operation(OpCode op, const std::vector<Operand>& a) {
  const auto& info = op_info(op);
  if (a.size() != info.shape.count())
    throw OperandError("Cantidad de operandos inválida para " + std::string(info.mnemonic) +
                       ": " + std::to_string(a.size()) + " (esperado " +
                       std::to_string(info.shape.count()) + ")");

  switch (op) {
    case OpCode::MOV1:  return Mov1{a[0], a[1]};
    case OpCode::MOV2:  return Mov2{a[0], a[1]};
    case OpCode::MOV3:  return Mov3{a[0], a[1]};
    case OpCode::MOV4:  return Mov4{a[0], static_cast<Value>(a[1])};
    case OpCode::ADD:   return Add{a[0], a[1], a[2]};
    case OpCode::SUBT:  return Subt{a[0], a[1], a[2]};
    case OpCode::JZ:    return Jz{a[0], a[1]};
    case OpCode::HALT:  return Halt{};
    case OpCode::MUL:   return Mul{a[0], a[1], a[2]};
    case OpCode::LOAD:  return Load{a[0], a[1]};
    case OpCode::READM: return Readm{static_cast<Value>(a[0])};
  }
  throw std::logic_error("OpCode sin operación: " + std::to_string(static_cast<int>(op)));
}

} // namespace cpu16
