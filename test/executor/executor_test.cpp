#include "executor.hpp"
#include "assembler.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

using namespace cpu16;

// Ejecuta una línea de asm sobre el estado dado
static Effect run_line(const char* line, MachineState& st) {
    auto ins = Assembler::parse_line(line);
    if (!ins) throw std::runtime_error(std::string("línea vacía: ") + line);
    return execute(*ins, st);
}

void test_moves(bool& success) {
    std::cout << "Testing mov1..mov4..." << std::endl;
    MachineState st;

    st.set_mem(10, 77);
    run_line("mov1 R1 10", st);
    success &= st.reg(1) == 77;

    st.set_reg(2, -5);
    run_line("mov2 R2 200", st);
    success &= st.mem(200) == -5;

    st.set_reg(3, 40);
    st.set_reg(4, 9);
    run_line("mov3 R3 R4", st);
    success &= st.mem(40) == 9;

    // mov4 escribe memoria en la dirección literal, el registro no cambia
    st.set_reg(6, 123);
    run_line("mov4 R6 55", st);
    success &= st.mem(6) == 55;
    success &= st.reg(6) == 123;

    std::cout << "Moves test done" << std::endl;
}

void test_arithmetic(bool& success) {
    std::cout << "Testing add/subt/mul..." << std::endl;
    MachineState st;
    st.set_reg(2, 7);
    st.set_reg(3, 5);

    run_line("add R1 R2 R3", st);
    success &= st.reg(1) == 12;

    run_line("subt R1 R3 R2", st);
    success &= st.reg(1) == -2;

    run_line("mul R1 R2 R3", st);
    success &= st.reg(1) == 35;

    // Destino igual a fuente
    run_line("add R2 R2 R2", st);
    success &= st.reg(2) == 14;

    // Re-ejecutar la misma instrucción cambia el resultado (estado compartido)
    auto ins = Assembler::parse_line("add R2 R2 R3");
    execute(*ins, st);
    execute(*ins, st);
    success &= st.reg(2) == 24;

    std::cout << "Arithmetic test done" << std::endl;
}

void test_jz_polarity(bool& success) {
    std::cout << "Testing jz branch polarity..." << std::endl;

    MachineState st;
    st.set_pc(4);
    st.set_reg(5, 0);
    run_line("jz R5 20", st);
    success &= st.pc() == 4;  // registro en cero: no salta

    st.set_reg(5, 3);
    run_line("jz R5 20", st);
    success &= st.pc() == 20; // distinto de cero: salta

    st.set_reg(5, -1);
    run_line("jz R5 0", st);
    success &= st.pc() == 0;

    std::cout << "jz polarity test done" << std::endl;
}

void test_load_halt_readm(bool& success) {
    std::cout << "Testing load/halt/readm..." << std::endl;
    MachineState st;

    st.set_mem(100, 4242);
    st.set_reg(2, 100);
    success &= run_line("load R1 R2", st) == Effect::Continue;
    success &= st.reg(1) == 4242;

    success &= run_line("halt", st) == Effect::Halt;

    run_line("readm 42", st);
    success &= st.output().size() == 1 && st.output()[0] == 42;

    st.tick();
    st.tick();
    run_line("readm 7", st);
    success &= st.output().size() == 3;
    success &= st.output()[1] == 0 && st.output()[2] == 7;

    // Misma celda de tiempo: se sobrescribe
    run_line("readm 8", st);
    success &= st.output()[2] == 8;

    std::cout << "load/halt/readm test done" << std::endl;
}

void test_out_of_range(bool& success) {
    std::cout << "Testing out-of-range accesses..." << std::endl;
    MachineState st;

    st.set_reg(1, 256);
    try {
        run_line("load R2 R1", st);
        std::cout << "load should reject address 256\n";
        success = false;
    } catch (const std::out_of_range&) {
    }

    st.set_reg(1, -1);
    try {
        run_line("mov3 R1 R2", st);
        std::cout << "mov3 should reject address -1\n";
        success = false;
    } catch (const std::out_of_range&) {
    }

    try {
        st.reg(16);
        success = false;
    } catch (const std::out_of_range&) {
    }

    try {
        st.set_mem(cfg::kMemWords, 1);
        success = false;
    } catch (const std::out_of_range&) {
    }

    std::cout << "Out-of-range test done" << std::endl;
}

int main() {
    std::cout << "\nStarting executor tests...\n";
    bool success = true;
    try {
        test_moves(success);
        test_arithmetic(success);
        test_jz_polarity(success);
        test_load_halt_readm(success);
        test_out_of_range(success);
    } catch (const std::exception& e) {
        std::cout << "Executor tests failed with exception: " << e.what() << "\n";
        success = false;
    }
    std::cout << (success ? "All executor tests passed!\n" : "Some executor tests failed!\n");
    return success ? 0 : 1;
}
