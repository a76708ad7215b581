#ifndef PMACRO_LANG_HPP
#define PMACRO_LANG_HPP

#include <iostream>
#include <string>

namespace PMACRO {

struct RunOptions {
    bool verbose = false;    // list instructions before running
    bool dryRun = false;     // parse and list only
    bool simulate = false;   // no real actuation or sensing
    int actionPauseMs = -1;  // pause after each action; -1 picks the mode default
    bool failSafe = true;    // abort when the pointer sits in the top-left corner
};

constexpr int DEFAULT_ACTION_PAUSE_MS = 100;

// Run a macro file directly. Returns the process exit code.
int runScript(const std::string& filename, const RunOptions& options,
              std::ostream& out = std::cout, std::ostream& err = std::cerr);

// Run a macro held in memory. Returns the process exit code.
int runSource(const std::string& source, const RunOptions& options,
              std::ostream& out = std::cout, std::ostream& err = std::cerr);

} // namespace PMACRO

#endif // PMACRO_LANG_HPP
