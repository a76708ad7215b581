// pmacro_lang.cpp
#include "pmacro_lang.hpp"
#include "desktop_adapter.hpp"
#include "image_driver.hpp"
#include "input_driver.hpp"
#include "pmacro_errors.hpp"
#include "pmacro_program.hpp"
#include "pmacro_vm.hpp"

#include <memory>
#include <utility>

namespace PMACRO {

static const std::string SEPARATOR(50, '-');

static void listProgram(const Program& prog, const std::string& label, std::ostream& out) {
    out << "Parsed " << prog.size() << " commands from " << label << "\n";
    for(const Instruction& ins : prog.instructions){
        out << "  " << ins.index + 1 << ": " << ins.text << "\n";
    }
    out << "\n";
}

static int runProgram(const Program& prog, const std::string& label, const RunOptions& options,
                      std::ostream& out, std::ostream& err) {
    if(options.verbose || options.dryRun) listProgram(prog, label, out);
    if(options.dryRun){
        out << "Dry run mode - commands parsed but not executed\n";
        return 0;
    }

    int pause = options.actionPauseMs;
    if(pause < 0) pause = options.simulate ? 0 : DEFAULT_ACTION_PAUSE_MS;

    ImageDriver driver;
    InputDriver input;
    std::unique_ptr<ActionAdapter> adapter;
    if(options.simulate){
        out << "Simulating macro file: " << label << "\n";
        out << "Simulation mode - logic executed but no desktop actions performed\n";
        auto sim = std::make_unique<SimulatedAdapter>();
        // templates are still decoded so bad paths show up
        sim->setImageLoader([&driver](const std::string& path) { return driver.loadImage(path); });
        adapter = std::move(sim);
    } else {
        out << "Executing macro file: " << label << "\n";
        out << "Press Ctrl+C to stop";
        if(options.failSafe) out << ", or move mouse to top-left corner to trigger failsafe";
        out << "\n";
        adapter = std::make_unique<DesktopAdapter>(driver, input, options.failSafe);
    }
    out << SEPARATOR << "\n";

    Interpreter interpreter(prog, *adapter, out, err);
    interpreter.setActionPause(pause);
    RunResult result = interpreter.run();

    out << SEPARATOR << "\n";
    switch(result){
        case RunResult::Completed:
            out << "Macro execution completed\n";
            return 0;
        case RunResult::Interrupted:
            out << "\nMacro execution interrupted by user\n";
            return 0;
        case RunResult::Aborted:
            // the failing instruction was already reported by the loop
            out << "Macro execution aborted\n";
            return 0;
    }
    return 0;
}

int runSource(const std::string& source, const RunOptions& options,
              std::ostream& out, std::ostream& err) {
    Program prog = parseProgram(source);
    return runProgram(prog, "<source>", options, out, err);
}

int runScript(const std::string& filename, const RunOptions& options,
              std::ostream& out, std::ostream& err) {
    Program prog;
    try {
        prog = loadProgram(filename);
    } catch(const FileError& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
    return runProgram(prog, filename, options, out, err);
}

} // namespace PMACRO
