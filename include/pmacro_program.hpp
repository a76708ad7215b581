#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PMACRO {

struct Instruction {
    std::string text;       // trimmed source line
    size_t index = 0;       // slot in the program
    size_t sourceLine = 0;  // 1-based line in the macro file
};

struct Program {
    std::vector<Instruction> instructions;
    // checkpoint name -> slot of the checkpoint line itself
    std::unordered_map<std::string, size_t> checkpoints;

    size_t size() const { return instructions.size(); }
    bool empty() const { return instructions.empty(); }
    const Instruction& at(size_t i) const { return instructions.at(i); }
    std::optional<size_t> checkpoint(const std::string& name) const;
};

// Extracts the text between the first pair of double quotes after the keyword,
// e.g. `goto "loop"` -> "loop". Empty optional if malformed.
std::optional<std::string> parseQuotedName(const std::string& text, const std::string& keyword);

// Blank lines and '#' comments are dropped; checkpoints are registered.
Program parseProgram(const std::string& source);

// Throws FileError if the file cannot be read
Program loadProgram(const std::string& path);

} // namespace PMACRO
