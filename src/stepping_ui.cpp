#include "runner.hpp"
#include "config.hpp"
#include "debug_io.hpp"
#include <array>
#include <iostream>
#include <sstream>
#include <string>

namespace cpu16 {

using dbg::print_instr;
using dbg::print_reg_diff;

void Runner::run_stepping() {
  SOUT << "\n===================== STEPPING INTERACTIVO =====================\n"
       << "ENTER=step | c=continuar | r=regs | m=memoria | q=salir\n";

  bool auto_run = false;

  while (!is_done()) {
    if (!auto_run) {
      SOUT << "\n[step " << steps_ << " | pc=" << state_.pc() << "] > ";
      std::string line;
      if (!std::getline(std::cin, line)) { SOUT << "\n[Stepping] stdin cerrado. Saliendo.\n"; break; }
      if (line == "q" || line == "Q") { SOUT << "[Stepping] Salir.\n"; break; }
      if (line == "c" || line == "C") { auto_run = true; SOUT << "[Stepping] Continuación automática habilitada.\n"; }
      else if (line == "r" || line == "R") { dump_regs(); continue; }
      else if (line == "m" || line == "M") { dump_memory(); dump_output(); continue; }
    }

    // Snapshot BEFORE
    const std::array<Value, cfg::kNumRegs> before = state_.regs();
    {
      std::ostringstream oss;
      print_instr(oss, state_.pc(), prog_.code[state_.pc()]);
      SOUT << "\n===== STEP " << steps_ << " =====\n" << oss.str();
    }

    if (steps_ >= cfg::kMaxSteps) {
      SOUT << "[Stepping] Límite de pasos alcanzado.\n";
      break;
    }
    step();

    // Diffs AFTER
    std::ostringstream oss;
    for (std::size_t r = 0; r < cfg::kNumRegs; ++r)
      print_reg_diff(oss, r, before[r], state_.regs()[r]);
    if (!oss.str().empty()) SOUT << oss.str();
    else                    SOUT << "  (sin cambios en registros)\n";
    SOUT << "  pc=" << state_.pc() << "\n";
  }

  SOUT << "\n[Stepping] Terminado (pasos=" << steps_ << ", halt=" << (halted_ ? "true" : "false") << ").\n";
}

} // namespace cpu16
