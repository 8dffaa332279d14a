#include "runner.hpp"
#include "assembler.hpp"
#include "debug_io.hpp"
#include "executor.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cpu16
{

  // Driver del programa ensamblado.
  // - load_*: carga programa y limpia el estado
  // - step(): avanza 1 instrucción
  // - run_until_halt(): loop completo con límite de pasos
  void Runner::load_program(const Program &p)
  {
    prog_ = p;
    state_.reset();
    steps_ = 0;
    halted_ = false;
  }

  void Runner::load_program_from_string(const std::string &asm_source)
  {
    auto p = Assembler::assemble_from_string(asm_source);
    load_program(p);
  }

  void Runner::load_program_from_file(const std::string &path)
  {
    auto p = Assembler::assemble_from_file(path);
    load_program(p);
  }

  bool Runner::step()
  {
    if (is_done())
      return false;

    const std::size_t pc = state_.pc();
    const Instr &ins = prog_.code[pc];

    // pc avanza antes de ejecutar: jz lo sobrescribe si salta
    state_.set_pc(pc + 1);
    const Effect e = execute(ins, state_);
    state_.tick();
    ++steps_;

    if (e == Effect::Halt)
      halted_ = true;
    return true;
  }

  void Runner::run_until_halt(std::size_t max_steps)
  {
    LOG_IF(cfg::kLogRun, "[Runner] inicio: " << prog_.code.size() << " instrucciones");
    std::size_t n = 0;
    while (!is_done()) {
      if (n >= max_steps)
        throw std::runtime_error("Límite de pasos alcanzado (" + std::to_string(max_steps) +
                                 "), pc=" + std::to_string(state_.pc()));
      step();
      ++n;
    }
    LOG_IF(cfg::kLogRun, "[Runner] fin tras " << steps_ << " pasos ("
                                              << (halted_ ? "halt" : "fin de programa") << ")");
  }

  bool Runner::is_done() const
  {
    return halted_ || state_.pc() >= prog_.code.size();
  }

  void Runner::dump_regs() const
  {
    SOUT << "REGISTROS:\n";
    for (std::size_t r = 0; r < cfg::kNumRegs; ++r) {
      std::ostringstream line;
      dbg::print_reg(line, r, state_.regs()[r]);
      SOUT << "  " << line.str() << "\n";
    }
  }

  void Runner::dump_memory() const
  {
    std::ostringstream os;
    dbg::print_nonzero_memory(os, state_.memory());
    SOUT << "MEMORIA (no nula):\n" << os.str();
  }

  void Runner::dump_output() const
  {
    std::ostringstream os;
    dbg::print_output(os, state_.output());
    SOUT << "SALIDA:\n" << os.str();
  }

} // namespace cpu16
