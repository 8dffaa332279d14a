#pragma once
#include "config.hpp"
#include "types.hpp"
#include <array>
#include <cstddef>
#include <vector>

namespace cpu16 {

/**
 * Estado de ejecución: banco de registros, memoria, log de salida y PC.
 * Lo crea y lo maneja el driver (Runner); cada acción lo recibe por referencia.
 * - reg/mem: acceso con chequeo de rango (std::out_of_range fuera de 0..15 / 0..255)
 * - record_output: out[time] <= v, el log crece si hace falta (huecos en 0)
 * - pc: próxima instrucción; solo jz lo escribe
 */
class MachineState {
public:
  MachineState() = default;

  Value reg(std::size_t idx) const;
  void  set_reg(std::size_t idx, Value v);

  Value mem(Addr addr) const;
  void  set_mem(Addr addr, Value v);

  void record_output(Value v);
  const std::vector<Value>& output() const { return out_; }

  std::size_t pc() const { return pc_; }
  void        set_pc(std::size_t pc) { pc_ = pc; }

  std::size_t time() const { return time_; }
  void        tick() { ++time_; }

  // Vuelve todo a cero (registros, memoria, salida, pc y tiempo)
  void reset();

  const std::array<Value, cfg::kNumRegs>&  regs()   const { return reg_; }
  const std::array<Value, cfg::kMemWords>& memory() const { return mem_; }

private:
  std::array<Value, cfg::kNumRegs>  reg_{};
  std::array<Value, cfg::kMemWords> mem_{};
  std::vector<Value> out_;
  std::size_t pc_   = 0;
  std::size_t time_ = 0;
};

} // namespace cpu16
