#pragma once
// Utilidades de impresión compactas para registros, memoria, salida y listados.
// Pensado para dumps de stepping y resúmenes.

#include "config.hpp"
#include "isa.hpp"
#include "types.hpp"
#include <array>
#include <cstddef>
#include <iomanip>
#include <ostream>
#include <vector>

namespace cpu16::dbg {

inline void print_reg(std::ostream& os, std::size_t r, Value v) {
  os << "R" << std::setw(2) << std::left << r << std::right << " = " << v;
  if (v < 0) os << " (0x" << std::hex << static_cast<std::uint64_t>(v) << std::dec << ")";
}

inline void print_reg_diff(std::ostream& os, std::size_t r, Value before, Value after) {
  if (before == after) return;
  os << "  R" << r << ": " << before << " -> " << after << "\n";
}

inline void print_nonzero_memory(std::ostream& os, const std::array<Value, cfg::kMemWords>& mem) {
  bool any = false;
  for (std::size_t a = 0; a < mem.size(); ++a) {
    if (mem[a] == 0) continue;
    any = true;
    os << "  [0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << a
       << std::dec << std::nouppercase << std::setfill(' ') << "] = " << mem[a] << "\n";
  }
  if (!any) os << "  (vacía)\n";
}

inline void print_output(std::ostream& os, const std::vector<Value>& out) {
  if (out.empty()) { os << "  (sin salida)\n"; return; }
  for (std::size_t t = 0; t < out.size(); ++t)
    os << "  t=" << t << ": " << out[t] << "\n";
}

// Una línea por instrucción: índice, palabra y forma textual normalizada.
inline void print_instr(std::ostream& os, std::size_t idx, const Instr& ins) {
  const auto& shape = op_info(ins.op).shape;
  os << std::setw(4) << idx << "  " << ins.hex << "  " << mnemonic(ins.op);
  for (std::size_t i = 0; i < ins.args.size(); ++i) {
    os << " ";
    if (i < shape.registers) os << cfg::kRegisterMark;
    os << ins.args[i];
  }
  os << "\n";
}

inline void print_listing(std::ostream& os, const Program& p) {
  for (std::size_t i = 0; i < p.code.size(); ++i) print_instr(os, i, p.code[i]);
}

} // namespace cpu16::dbg
