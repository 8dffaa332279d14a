#include "operand_grammar.hpp"
#include "config.hpp"
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace cpu16
{

// Lee una corrida de dígitos [0-9]+ desde pos. Avanza pos.
// nullopt si no hay dígitos o si el número no entra en Operand.
static std::optional<Operand> read_number(std::string_view s, std::size_t& pos) {
  const std::size_t start = pos;
  std::uint64_t v = 0;
  while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
    v = v * 10 + static_cast<std::uint64_t>(s[pos] - '0');
    if (v > std::numeric_limits<Operand>::max()) return std::nullopt;
    ++pos;
  }
  if (pos == start) return std::nullopt;
  return static_cast<Operand>(v);
}

// Separador: uno o más espacios.
static bool skip_separator(std::string_view s, std::size_t& pos) {
  const std::size_t start = pos;
  while (pos < s.size() && s[pos] == ' ') ++pos;
  return pos > start;
}

std::optional<std::vector<Operand>> OperandMatcher::match(std::string_view text) const {
  std::vector<Operand> out;
  out.reserve(shape_.count());

  std::size_t pos = 0;
  for (unsigned i = 0; i < shape_.count(); ++i) {
    if (i > 0 && !skip_separator(text, pos)) return std::nullopt;

    const bool is_reg = i < shape_.registers;
    if (is_reg) {
      if (pos >= text.size() || text[pos] != cfg::kRegisterMark) return std::nullopt;
      ++pos;
    }
    auto v = read_number(text, pos);
    if (!v) return std::nullopt;
    out.push_back(*v);
  }

  // Total y estricto: no puede sobrar nada
  if (pos != text.size()) return std::nullopt;
  return out;
}

std::string OperandMatcher::pattern() const {
  std::string p;
  for (unsigned i = 0; i < shape_.registers; ++i) {
    if (!p.empty()) p += ' ';
    p += cfg::kRegisterMark;
    p += "<n>";
  }
  if (shape_.immediate) {
    if (!p.empty()) p += ' ';
    p += "<imm>";
  }
  return p.empty() ? "(sin operandos)" : p;
}

// Índice en la tabla: registers * 2 + immediate
static constexpr std::size_t shape_index(Shape s) {
  return s.registers * 2 + (s.immediate ? 1 : 0);
}

static constexpr std::array<OperandMatcher, (cfg::kNumFields + 1) * 2> kMatchers{{
  OperandMatcher{{0, false}}, OperandMatcher{{0, true}},
  OperandMatcher{{1, false}}, OperandMatcher{{1, true}},
  OperandMatcher{{2, false}}, OperandMatcher{{2, true}},
  OperandMatcher{{3, false}}, OperandMatcher{{3, true}},
}};

const OperandMatcher& matcher_for(Shape shape) {
  const auto idx = shape_index(shape);
  if (idx >= kMatchers.size())
    throw std::out_of_range("Forma de operandos fuera de rango: " +
                            std::to_string(shape.registers) + " registros");
  return kMatchers[idx];
}

} // namespace cpu16
