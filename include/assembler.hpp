#pragma once
#include "isa.hpp"
#include <optional>
#include <string>

//
// Ensamblador de la CPU de 16 bits.
// Toma texto (string o archivo) y lo convierte en un Program.
//
// Sintaxis por línea:
//   mov1  Rn addr     mov2 Rn addr     mov3 Rn Rm      mov4 Rn imm
//   add   Rd Ra Rb    subt Rd Ra Rb    mul  Rd Ra Rb
//   jz    Rn target   load Rd Rs       readm imm       halt
//
// Notas rápidas:
// - Registros con 'R' pegado al número (R0..R15), inmediatos en decimal
// - Los operandos se separan con uno o más espacios (sin comas)
// - Los comentarios empiezan con '#'; líneas vacías se ignoran
// - No hay labels: cada línea se entiende sola
// - Si hay un error se lanza una subclase de AsmError (errors.hpp)
//

namespace cpu16 {

class Assembler {
public:
  // Parsea una línea. nullopt si queda vacía tras quitar comentario/espacios.
  static std::optional<Instr> parse_line(const std::string& line);

  // Ensambla directamente desde una cadena completa.
  static Program assemble_from_string(const std::string& src);

  // Lee el archivo y ensambla su contenido.
  static Program assemble_from_file(const std::string& path);

private:
  // Quita espacios al inicio y al final.
  static std::string trim(const std::string& s);

  // Corta desde el primer '#' hasta el final.
  static std::string strip_comment(const std::string& line);
};

} // namespace cpu16
