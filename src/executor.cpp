#include "executor.hpp"
#include "config.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpu16
{

// Valor de registro usado como dirección (mov3/load): tiene que caer en 0..255
static Addr as_addr(Value v) {
  if (v < 0 || static_cast<std::uint64_t>(v) >= cfg::kMemWords)
    throw std::out_of_range("Dirección indirecta fuera de memoria: " + std::to_string(v));
  return static_cast<Addr>(v);
}

// Aritmética en complemento a dos (sin UB por overflow)
static Value wrap_add(Value a, Value b) {
  return static_cast<Value>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}
static Value wrap_sub(Value a, Value b) {
  return static_cast<Value>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}
static Value wrap_mul(Value a, Value b) {
  return static_cast<Value>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}

Effect exec(const Mov1& o, MachineState& st) {
  st.set_reg(o.rn, st.mem(o.addr));
  LOG_IF(cfg::kLogExec, "[EXEC] mov1 R" << o.rn << " <- MEM[" << o.addr << "]");
  return Effect::Continue;
}

Effect exec(const Mov2& o, MachineState& st) {
  st.set_mem(o.addr, st.reg(o.rn));
  LOG_IF(cfg::kLogExec, "[EXEC] mov2 MEM[" << o.addr << "] <- R" << o.rn);
  return Effect::Continue;
}

Effect exec(const Mov3& o, MachineState& st) {
  const Addr addr = as_addr(st.reg(o.rn));
  st.set_mem(addr, st.reg(o.rm));
  LOG_IF(cfg::kLogExec, "[EXEC] mov3 MEM[R" << o.rn << "=" << addr << "] <- R" << o.rm);
  return Effect::Continue;
}

// Escribe memoria en la dirección literal, no el registro
Effect exec(const Mov4& o, MachineState& st) {
  st.set_mem(o.addr, o.imm);
  LOG_IF(cfg::kLogExec, "[EXEC] mov4 MEM[" << o.addr << "] <- " << o.imm);
  return Effect::Continue;
}

Effect exec(const Add& o, MachineState& st) {
  st.set_reg(o.rd, wrap_add(st.reg(o.ra), st.reg(o.rb)));
  LOG_IF(cfg::kLogExec, "[EXEC] add R" << o.rd << ", R" << o.ra << ", R" << o.rb);
  return Effect::Continue;
}

Effect exec(const Subt& o, MachineState& st) {
  st.set_reg(o.rd, wrap_sub(st.reg(o.ra), st.reg(o.rb)));
  LOG_IF(cfg::kLogExec, "[EXEC] subt R" << o.rd << ", R" << o.ra << ", R" << o.rb);
  return Effect::Continue;
}

// Salta cuando el registro es distinto de cero (a pesar del nombre)
Effect exec(const Jz& o, MachineState& st) {
  if (st.reg(o.rn) != 0) {
    st.set_pc(o.target);
    LOG_IF(cfg::kLogExec, "[EXEC] jz R" << o.rn << " -> pc=" << o.target);
  } else {
    LOG_IF(cfg::kLogExec, "[EXEC] jz R" << o.rn << " (no salta)");
  }
  return Effect::Continue;
}

Effect exec(const Halt&, MachineState&) {
  LOG_IF(cfg::kLogExec, "[EXEC] halt");
  return Effect::Halt;
}

Effect exec(const Mul& o, MachineState& st) {
  st.set_reg(o.rd, wrap_mul(st.reg(o.ra), st.reg(o.rb)));
  LOG_IF(cfg::kLogExec, "[EXEC] mul R" << o.rd << ", R" << o.ra << ", R" << o.rb);
  return Effect::Continue;
}

Effect exec(const Load& o, MachineState& st) {
  const Addr addr = as_addr(st.reg(o.rs));
  st.set_reg(o.rd, st.mem(addr));
  LOG_IF(cfg::kLogExec, "[EXEC] load R" << o.rd << ", [R" << o.rs << "=" << addr << "]");
  return Effect::Continue;
}

Effect exec(const Readm& o, MachineState& st) {
  st.record_output(o.imm);
  LOG_IF(cfg::kLogExec, "[EXEC] readm out[" << st.time() << "] <- " << o.imm);
  return Effect::Continue;
}

Effect execute(const Operation& op, MachineState& st) {
  return std::visit([&](const auto& o) { return exec(o, st); }, op);
}

} // namespace cpu16
