#pragma once
#include <cstddef>
#include <iostream> // logs
#include <syncstream>

namespace cfg
{
    // Stdout/stderr sincronizados para logs
    #define SOUT  std::osyncstream(std::cout)
    #define SERR  std::osyncstream(std::cerr)

    // --- Estado de la máquina ---
    inline constexpr std::size_t kNumRegs  = 16;  // R0..R15
    inline constexpr std::size_t kMemWords = 256; // direccionable con 1 byte

    // --- Formato de la palabra de instrucción ---
    // [opcode:4][f0:4][f1:4][f2:4]
    inline constexpr unsigned kWordBits     = 16;
    inline constexpr unsigned kOpcodeBits   = 4;
    inline constexpr unsigned kFieldBits    = 4;
    inline constexpr unsigned kNumFields    = 3;
    inline constexpr std::size_t kWordHexDigits = 4;

    // Sintaxis del fuente
    inline constexpr char kCommentChar  = '#';
    inline constexpr char kRegisterMark = 'R';

    // Límite de pasos del runner (evita loops infinitos con jz)
    inline constexpr std::size_t kMaxSteps = 100000;

    // --- Flags de log rápidos ---
    inline constexpr bool kLogAsm  = false; // cada línea ensamblada
    inline constexpr bool kLogExec = false; // cada acción ejecutada
    inline constexpr bool kLogRun  = true;  // inicio/fin del runner

    // Macro simple de logging condicional
    #define LOG_IF(flag, msg)        \
        do {                         \
            if (flag) {              \
                SERR << msg << '\n'; \
            }                        \
        } while (0)
} // namespace cfg
