#include "encoder.hpp"
#include "errors.hpp"
#include <iomanip>
#include <sstream>

namespace cpu16
{

Word encode(OpCode op, const std::vector<Operand>& args) {
  const auto& info = op_info(op);
  const auto  name = std::string(info.mnemonic);

  if (info.code >= (1u << cfg::kOpcodeBits))
    throw EncodeError("Número de instrucción inválido: " + std::to_string(info.code));
  if (args.size() != info.shape.count())
    throw EncodeError("Operandos incompletos para " + name);

  // opcode a los bits más significativos
  std::uint64_t word = static_cast<std::uint64_t>(info.code) << (cfg::kWordBits - cfg::kOpcodeBits);

  const unsigned regs = info.shape.registers;
  for (unsigned i = 0; i < regs; ++i) {
    if (args[i] >= (1u << cfg::kFieldBits))
      throw EncodeError("Registro R" + std::to_string(args[i]) + " no entra en " +
                        std::to_string(cfg::kFieldBits) + " bits (" + name + ")");
    // 1er registro -> f0, 2do -> f1, 3ro -> f2
    word += static_cast<std::uint64_t>(args[i]) << (cfg::kFieldBits * (cfg::kNumFields - 1 - i));
  }

  if (info.shape.immediate) {
    const unsigned bits = immediate_bits(regs);
    const Operand  imm  = args.back();
    if (static_cast<std::uint64_t>(imm) >= (std::uint64_t{1} << bits))
      throw EncodeError("Inmediato " + std::to_string(imm) + " no entra en " +
                        std::to_string(bits) + " bits (" + name + ")");
    word += imm;
  }

  // No debería fallar si lo anterior pasó
  if (word >> cfg::kWordBits)
    throw EncodeError("Palabra de " + name + " excede " + std::to_string(cfg::kWordBits) + " bits");
  return static_cast<Word>(word);
}

std::string to_hex(std::uint64_t value, std::size_t digits) {
  // 16^digits sin overflow para digits < 16
  if (digits < 16 && value >= (std::uint64_t{1} << (4 * digits)))
    throw EncodeError("No se puede convertir " + std::to_string(value) +
                      " a HEX: es demasiado grande para " + std::to_string(digits) + " dígitos");

  std::ostringstream os;
  os << std::uppercase << std::hex << std::setw(static_cast<int>(digits))
     << std::setfill('0') << value;
  return os.str();
}

} // namespace cpu16
