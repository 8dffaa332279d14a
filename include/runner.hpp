#pragma once
#include "config.hpp"
#include "isa.hpp"
#include "machine_state.hpp"
#include <cstddef>
#include <string>

namespace cpu16 {

/**
 * Runner: driver del fetch-execute loop.
 * Por paso: fetch prog[pc] -> pc = pc+1 -> ejecuta (jz puede pisar pc) -> time++.
 * Termina con halt o cuando pc sale del programa.
 */
class Runner {
public:
  Runner() = default;

  // Carga de trabajo (reinicia el estado)
  void load_program(const Program& p);
  void load_program_from_string(const std::string& asm_source);
  void load_program_from_file(const std::string& path);

  // Un paso de CPU (una instrucción). Devuelve false si ya había terminado.
  bool step();

  // Corre hasta halt / fin de programa; lanza runtime_error si pasa max_steps.
  void run_until_halt(std::size_t max_steps = cfg::kMaxSteps);

  // Stepping interactivo (implementado en stepping_ui.cpp)
  void run_stepping();  // ENTER=step | c=continuar | r=regs | m=memoria | q=salir

  // ¿Ya terminó? (halt o pc fuera de rango)
  bool is_done() const;
  bool halted()  const { return halted_; }

  std::size_t         steps() const { return steps_; }
  const Program&      program() const { return prog_; }
  MachineState&       state() { return state_; }
  const MachineState& state() const { return state_; }

  // ---- Dumps
  void dump_regs() const;
  void dump_memory() const;
  void dump_output() const;

private:
  Program      prog_{};
  MachineState state_{};
  std::size_t  steps_  = 0;
  bool         halted_ = false;
};

} // namespace cpu16
