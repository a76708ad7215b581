#pragma once
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>

#include "action_adapter.hpp"
#include "pmacro_program.hpp"
#include "pmacro_value.hpp"

namespace PMACRO {

constexpr int STATUS_SUCCESS = 0;
constexpr int STATUS_FAILURE = 1;

// Set from the SIGINT handler; polled by the execution loop
extern volatile std::sig_atomic_t INTERRUPT_FLAG;
void installInterruptHandler();

enum class RunResult { Completed, Aborted, Interrupted };

enum class Opcode {
    VarSet, VarIncrease, Checkpoint, Goto, Mouse, Key, Sleep, If, CvMatch, End, Unknown
};

// Executes a loaded program against an action adapter. One instance per run.
class Interpreter {
public:
    Interpreter(const Program& program, ActionAdapter& adapter,
                std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Runs until the program counter leaves the program, an instruction
    // fails, or an interrupt is requested.
    RunResult run();

    // Executes the instruction at the program counter and advances it.
    // Errors propagate to the caller.
    void step();

    static Opcode decode(const Instruction& ins);

    // Milliseconds to wait after every actuation call
    void setActionPause(int ms) { actionPauseMs_ = ms; }

    size_t pc() const { return pc_; }
    int lastStatus() const { return lastStatus_; }
    const VariableStore& variables() const { return vars_; }
    VariableStore& variables() { return vars_; }
    const std::string& lastError() const { return lastError_; }
    size_t executedCount() const { return executed_; }

private:
    void execVarSet(const Instruction& ins);
    void execVarIncrease(const Instruction& ins);
    void execGoto(const Instruction& ins);
    void execMouse(const Instruction& ins);
    void execKey(const Instruction& ins);
    void execSleep(const Instruction& ins);
    void execIf(const Instruction& ins);
    void execCvMatch(const Instruction& ins);
    void execEnd(const Instruction& ins);

    void skipToEnd();
    void pauseAfterAction();

    const Program& program_;
    ActionAdapter& adapter_;
    std::ostream& out_;
    std::ostream& err_;

    size_t pc_ = 0;
    int lastStatus_ = STATUS_SUCCESS;
    VariableStore vars_;
    int actionPauseMs_ = 0;
    size_t executed_ = 0;
    std::string lastError_;
};

// Sleeps for `ms` milliseconds; returns early if an interrupt arrives
void sleepMs(int64_t ms);

} // namespace PMACRO
