#include "machine_state.hpp"
#include <stdexcept>
#include <string>

namespace cpu16 {

Value MachineState::reg(std::size_t idx) const {
  if (idx >= reg_.size())
    throw std::out_of_range("REG idx " + std::to_string(idx));
  return reg_[idx];
}

void MachineState::set_reg(std::size_t idx, Value v) {
  if (idx >= reg_.size())
    throw std::out_of_range("REG idx " + std::to_string(idx));
  reg_[idx] = v;
}

Value MachineState::mem(Addr addr) const {
  if (addr >= mem_.size())
    throw std::out_of_range("MEM addr " + std::to_string(addr));
  return mem_[addr];
}

void MachineState::set_mem(Addr addr, Value v) {
  if (addr >= mem_.size())
    throw std::out_of_range("MEM addr " + std::to_string(addr));
  mem_[addr] = v;
}

void MachineState::record_output(Value v) {
  if (out_.size() <= time_) out_.resize(time_ + 1, 0);
  out_[time_] = v;
}

void MachineState::reset() {
  reg_.fill(0);
  mem_.fill(0);
  out_.clear();
  pc_   = 0;
  time_ = 0;
}

} // namespace cpu16
