#include "pmacro_program.hpp"
#include "pmacro_errors.hpp"
#include "text_util.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace PMACRO {

std::optional<size_t> Program::checkpoint(const std::string& name) const {
    auto it = checkpoints.find(name);
    if(it == checkpoints.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> parseQuotedName(const std::string& text, const std::string& keyword) {
    auto [word, rest] = splitFirstWord(text);
    if(word != keyword) return std::nullopt;
    if(rest.size() < 2 || rest.front() != '"') return std::nullopt;
    size_t close = rest.find('"', 1);
    if(close == std::string::npos || close == 1) return std::nullopt;
    // nothing but whitespace may follow the closing quote
    if(!trim(rest.substr(close + 1)).empty()) return std::nullopt;
    return rest.substr(1, close - 1);
}

Program parseProgram(const std::string& source) {
    Program prog;
    std::istringstream in(source);
    std::string line;
    size_t lineNo = 0;
    while(std::getline(in, line)){
        ++lineNo;
        std::string t = trim(line);
        if(t.empty() || t[0] == '#') continue;

        Instruction ins;
        ins.text = t;
        ins.index = prog.instructions.size();
        ins.sourceLine = lineNo;

        if(splitFirstWord(t).first == "checkpoint"){
            // the slot of the checkpoint line itself; the loop's +1 after a
            // goto lands on the following instruction
            if(auto name = parseQuotedName(t, "checkpoint")) prog.checkpoints[*name] = ins.index;
        }
        prog.instructions.push_back(std::move(ins));
    }
    return prog;
}

Program loadProgram(const std::string& path) {
    std::ifstream file(path);
    if(!file.is_open()){
        throw FileError("Macro file '" + path + "' not found");
    }
    std::string source((std::istreambuf_iterator<char>(file)),
            std::istreambuf_iterator<char>());
    if(file.bad()){
        throw FileError("Could not read macro file '" + path + "'");
    }
    return parseProgram(source);
}

} // namespace PMACRO
