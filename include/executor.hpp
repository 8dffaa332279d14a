#pragma once
#include "isa.hpp"
#include "machine_state.hpp"

namespace cpu16 {

// Acciones semánticas: una por alternativa de Operation.
// Mutan el estado recibido; nunca hay estado global.
Effect exec(const Mov1& o,  MachineState& st);
Effect exec(const Mov2& o,  MachineState& st);
Effect exec(const Mov3& o,  MachineState& st);
Effect exec(const Mov4& o,  MachineState& st);
Effect exec(const Add& o,   MachineState& st);
Effect exec(const Subt& o,  MachineState& st);
Effect exec(const Jz& o,    MachineState& st);
Effect exec(const Halt& o,  MachineState& st);
Effect exec(const Mul& o,   MachineState& st);
Effect exec(const Load& o,  MachineState& st);
Effect exec(const Readm& o, MachineState& st);

// Despacho por std::visit sobre la variante.
Effect execute(const Operation& op, MachineState& st);

inline Effect execute(const Instr& ins, MachineState& st) { return execute(ins.operation, st); }

} // namespace cpu16
