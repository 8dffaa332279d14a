#include "assembler.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "operand_grammar.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace cpu16
{

// ===== Helpers privados de Assembler =====
std::string Assembler::trim(const std::string& s) {
  std::size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

std::string Assembler::strip_comment(const std::string& line) {
  auto pos = line.find(cfg::kCommentChar);
  if (pos == std::string::npos) return line;
  return line.substr(0, pos);
}

// ===== Utilidades locales =====

// Largo de la primera corrida alfanumérica (el mnemónico)
static std::size_t mnemonic_length(const std::string& s) {
  std::size_t n = 0;
  while (n < s.size() && std::isalnum(static_cast<unsigned char>(s[n]))) ++n;
  return n;
}

// Agrega el número de línea conservando el tipo del error
template <class E>
[[noreturn]] static void rethrow_at(const E& e, std::size_t line_no) {
  throw E(e.detail(), line_no);
}

// ===== Parseo de una línea =====

std::optional<Instr> Assembler::parse_line(const std::string& raw) {
  // 1) Comentario fuera y trim
  const std::string line = trim(strip_comment(raw));
  if (line.empty()) return std::nullopt;

  // 2) Mnemónico + resto
  const std::size_t n = mnemonic_length(line);
  if (n == 0)
    throw SyntaxError("No se pudo leer el nombre de instrucción en: " + line);

  const std::string name = line.substr(0, n);
  const std::string rest = trim(line.substr(n));

  // 3) Buscar en la tabla
  auto op = find_opcode(name);
  if (!op)
    throw UnknownInstructionError("Instrucción desconocida: " + name);

  // 4) Operandos según la forma del opcode
  const auto& info    = op_info(*op);
  const auto& matcher = matcher_for(info.shape);
  auto args = matcher.match(rest);
  if (!args)
    throw OperandError("No se pudieron parsear los argumentos de \"" + name + "\": \"" + rest +
                       "\" (esperado: " + matcher.pattern() + ")");

  // 5-6) Codificar y armar la instrucción
  Instr ins{};
  ins.op        = *op;
  ins.word      = encode(*op, *args);
  ins.hex       = to_hex(ins.word, cfg::kWordHexDigits);
  ins.operation = make_operation(*op, *args);
  ins.args      = std::move(*args);

  LOG_IF(cfg::kLogAsm, "[ASM] " << name << " " << rest << " -> " << ins.hex);
  return ins;
}

// ===== Ensamblado =====

Program Assembler::assemble_from_string(const std::string& src) {
  Program p;
  p.code.reserve(64);

  std::istringstream is(src);
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(is, line)) {
    ++line_no;
    try {
      auto ins = parse_line(line);
      if (ins) p.code.push_back(std::move(*ins));
    } catch (const SyntaxError& e) {
      rethrow_at(e, line_no);
    } catch (const UnknownInstructionError& e) {
      rethrow_at(e, line_no);
    } catch (const OperandError& e) {
      rethrow_at(e, line_no);
    } catch (const EncodeError& e) {
      rethrow_at(e, line_no);
    }
  }

  LOG_IF(cfg::kLogAsm, "[ASM] " << p.code.size() << " instrucciones en " << line_no << " lineas");
  return p;
}

// Ensambla desde archivo (lee todo y delega)
Program Assembler::assemble_from_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("No se puede abrir ASM: " + path);
  std::string src((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return assemble_from_string(src);
}

} // namespace cpu16
