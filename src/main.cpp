// ----------------------- main (CLI) -----------------------
#include "pmacro_lang.hpp"
#include "pmacro_vm.hpp"

#include <exception>
#include <iostream>
#include <string>

static void usage(const char* prog) {
    std::cout << "Usage: " << prog << " <macro-file> [options]" << std::endl;
    std::cout << "Execute desktop automation macro files" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -v, --verbose    Print the parsed commands before running" << std::endl;
    std::cout << "  --dry-run        Parse commands without executing them" << std::endl;
    std::cout << "  --simulate       Execute logic and show output but skip desktop actions" << std::endl;
    std::cout << "  --pause <ms>     Pause after every mouse/keyboard action (default: "
              << PMACRO::DEFAULT_ACTION_PAUSE_MS << ", 0 when simulating)" << std::endl;
    std::cout << "  --no-failsafe    Do not abort when the mouse reaches the top-left corner" << std::endl;
    std::cout << "  -h, --help       Show this help" << std::endl;
}

int main(int argc, char** argv){
    PMACRO::RunOptions options;
    std::string filename;

    for(int i = 1; i < argc; ++i){
        std::string arg = argv[i];
        if(arg == "-h" || arg == "--help"){
            usage(argv[0]);
            return 0;
        } else if(arg == "-v" || arg == "--verbose"){
            options.verbose = true;
        } else if(arg == "--dry-run"){
            options.dryRun = true;
        } else if(arg == "--simulate"){
            options.simulate = true;
        } else if(arg == "--no-failsafe"){
            options.failSafe = false;
        } else if(arg == "--pause"){
            if(i + 1 >= argc){
                std::cerr << "Error: --pause requires a value" << std::endl;
                return 1;
            }
            try {
                options.actionPauseMs = std::stoi(argv[++i]);
            } catch(const std::exception&) {
                std::cerr << "Error: invalid --pause value '" << argv[i] << "'" << std::endl;
                return 1;
            }
            if(options.actionPauseMs < 0){
                std::cerr << "Error: --pause must not be negative" << std::endl;
                return 1;
            }
        } else if(!arg.empty() && arg[0] == '-'){
            std::cerr << "Error: unknown option " << arg << std::endl;
            usage(argv[0]);
            return 1;
        } else if(filename.empty()){
            filename = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if(filename.empty()){
        usage(argv[0]);
        return 1;
    }

    PMACRO::installInterruptHandler();
    try {
        return PMACRO::runScript(filename, options);
    } catch(const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
