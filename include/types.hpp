#pragma once
#include <cstddef>
#include <cstdint>

namespace cpu16 {

using Word    = std::uint16_t;  // palabra de instrucción ya codificada
using Operand = std::uint32_t;  // valor numérico de un operando (registro o inmediato)
using Value   = std::int64_t;   // contenido de registros / memoria / salida
using Addr    = std::size_t;    // índice en memoria (0..255)

// Resultado de ejecutar una acción: seguir o detener el fetch loop.
enum class Effect : std::uint8_t { Continue, Halt };

} // namespace cpu16
