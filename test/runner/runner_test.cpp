#include "runner.hpp"
#include "errors.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

using namespace cpu16;

// Cuenta regresiva: suma 5 a R3 mientras R1 != 0, R1 arranca en 3
static const char* kLoopProgram =
    "mov4 R0 3        # MEM[0] = 3\n"
    "mov4 R1 1        # MEM[1] = 1\n"
    "mov4 R2 5        # MEM[2] = 5\n"
    "mov1 R1 0        # R1 = 3\n"
    "mov1 R4 1        # R4 = 1\n"
    "mov1 R5 2        # R5 = 5\n"
    "add R3 R3 R5     # pc 6\n"
    "subt R1 R1 R4\n"
    "jz R1 6          # vuelve mientras R1 != 0\n"
    "mov2 R3 10       # MEM[10] = R3\n"
    "readm 99\n"
    "halt\n"
    "readm 1          # no se ejecuta\n";

void test_loop_program(bool& success) {
    std::cout << "Testing loop program..." << std::endl;

    Runner r;
    r.load_program_from_string(kLoopProgram);
    success &= r.program().code.size() == 13;

    r.run_until_halt();
    success &= r.halted();
    success &= r.is_done();
    success &= r.state().reg(3) == 15;
    success &= r.state().reg(1) == 0;
    success &= r.state().mem(10) == 15;
    // 6 de inicio + 3 vueltas de 3 + mov2 + readm + halt
    success &= r.steps() == 18;
    success &= r.state().time() == 18;
    // readm corre en el paso 17 (time=16)
    success &= r.state().output().size() == 17;
    success &= r.state().output().back() == 99;
    success &= r.state().pc() == 12;

    // Ya terminado: step no hace nada
    success &= !r.step();

    std::cout << "Loop program test done" << std::endl;
}

void test_runs_off_end(bool& success) {
    std::cout << "Testing program without halt..." << std::endl;

    Runner r;
    r.load_program_from_string("mov4 R7 1\nmov1 R2 7\n");
    r.run_until_halt();
    success &= !r.halted();
    success &= r.is_done();
    success &= r.steps() == 2;
    success &= r.state().reg(2) == 1;

    std::cout << "No-halt test done" << std::endl;
}

void test_step_limit(bool& success) {
    std::cout << "Testing step limit..." << std::endl;

    Runner r;
    // R1 != 0 para siempre -> loop infinito
    r.load_program_from_string("mov4 R0 1\nmov1 R1 0\njz R1 2\n");
    try {
        r.run_until_halt(50);
        std::cout << "run_until_halt should stop at the step limit\n";
        success = false;
    } catch (const std::runtime_error& e) {
        success &= std::string(e.what()).find("Límite") != std::string::npos;
        success &= r.steps() == 50;
    }

    std::cout << "Step limit test done" << std::endl;
}

void test_reload_resets_state(bool& success) {
    std::cout << "Testing reload..." << std::endl;

    Runner r;
    r.load_program_from_string("mov4 R0 9\nreadm 3\nhalt\n");
    r.run_until_halt();
    success &= r.state().mem(0) == 9;

    r.load_program_from_string("halt\n");
    success &= r.state().mem(0) == 0;
    success &= r.state().output().empty();
    success &= r.steps() == 0 && !r.halted() && r.state().pc() == 0;

    // Programa vacío: terminado de entrada
    r.load_program(Program{});
    success &= r.is_done();
    r.run_until_halt();
    success &= r.steps() == 0;

    std::cout << "Reload test done" << std::endl;
}

void test_assembly_errors_propagate(bool& success) {
    std::cout << "Testing assembly errors through the runner..." << std::endl;

    Runner r;
    try {
        r.load_program_from_string("halt\nfoo\n");
        success = false;
    } catch (const UnknownInstructionError& e) {
        success &= e.line().has_value() && *e.line() == 2;
    }

    std::cout << "Assembly errors test done" << std::endl;
}

int main() {
    std::cout << "\nStarting runner tests...\n";
    bool success = true;
    try {
        test_loop_program(success);
        test_runs_off_end(success);
        test_step_limit(success);
        test_reload_resets_state(success);
        test_assembly_errors_propagate(success);
    } catch (const std::exception& e) {
        std::cout << "Runner tests failed with exception: " << e.what() << "\n";
        success = false;
    }
    std::cout << (success ? "All runner tests passed!\n" : "Some runner tests failed!\n");
    return success ? 0 : 1;
}
