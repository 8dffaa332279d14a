#include "assembler.hpp"
#include "config.hpp"
#include "debug_io.hpp"
#include "errors.hpp"
#include "runner.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

/**
 * Uso: cpu16 <archivo.asm> [--hex] [--run] [--step|-s]
 *   - sin flags: ensambla e imprime el listado (índice, HEX, instrucción)
 *   - --hex:     solo las palabras, una por línea
 *   - --run:     ensambla, corre hasta halt y vuelca registros/memoria/salida
 *   - --step:    stepping interactivo (ENTER=step, c=continuar, r=regs, m=memoria, q=salir)
 */
int main(int argc, char **argv)
{
  bool hex_only = false;
  bool run = false;
  bool stepping = false;
  std::string filePath;

  // Parse simple de argumentos: el primer no-flag es el path del asm
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--hex") {
      hex_only = true;
    } else if (a == "--run") {
      run = true;
    } else if (a == "--step" || a == "-s") {
      stepping = true;
    } else {
      filePath = a;
    }
  }

  if (filePath.empty()) {
    SERR << "Uso: " << argv[0] << " <archivo.asm> [--hex] [--run] [--step|-s]\n";
    return 2;
  }

  try {
    cpu16::Program prog = cpu16::Assembler::assemble_from_file(filePath);

    if (hex_only) {
      for (const auto& ins : prog.code) SOUT << ins.hex << "\n";
    } else {
      std::ostringstream os;
      cpu16::dbg::print_listing(os, prog);
      SOUT << os.str();
    }

    if (!run && !stepping) return 0;

    cpu16::Runner runner;
    runner.load_program(prog);
    if (stepping) runner.run_stepping();
    else          runner.run_until_halt();

    runner.dump_regs();
    runner.dump_memory();
    runner.dump_output();
  } catch (const cpu16::AsmError& e) {
    SERR << "[Main] Error de ensamblado: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    SERR << "[Main] Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
