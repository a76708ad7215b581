#include "pmacro_vm.hpp"
#include "pmacro_errors.hpp"
#include "pmacro_expr.hpp"
#include "template_locator.hpp"
#include "text_util.hpp"

#include <cerrno>
#include <iomanip>
#include <optional>
#include <time.h>

namespace PMACRO {

volatile std::sig_atomic_t INTERRUPT_FLAG = 0;

static void handleSignal(int) {
    INTERRUPT_FLAG = 1;
}

void installInterruptHandler() {
    std::signal(SIGINT, handleSignal);
}

void sleepMs(int64_t ms) {
    if(ms <= 0) return;
    timespec ts;
    ts.tv_sec = (time_t)(ms / 1000);
    ts.tv_nsec = (long)(ms % 1000) * 1000000L;
    // nanosleep is never restarted after a handled signal
    while(::nanosleep(&ts, &ts) == -1 && errno == EINTR){
        if(INTERRUPT_FLAG) return;
    }
}

// ----------------------- Argument parsing -----------------------

namespace {

std::optional<int64_t> parseInt(const std::string& s, bool allowSign = true) {
    std::string t = trim(s);
    size_t i = 0;
    if(allowSign && !t.empty() && (t[0] == '-' || t[0] == '+')) i = 1;
    if(i >= t.size()) return std::nullopt;
    for(size_t k = i; k < t.size(); ++k){
        if(!std::isdigit((unsigned char)t[k])) return std::nullopt;
    }
    try {
        return std::stoll(t);
    } catch(const std::out_of_range&) {
        return std::nullopt;
    }
}

// "$name" -> "name"
std::optional<std::string> parseVarRef(const std::string& s) {
    if(s.size() < 2 || s[0] != '$') return std::nullopt;
    for(size_t i = 1; i < s.size(); ++i){
        if(!isNameChar(s[i])) return std::nullopt;
    }
    return s.substr(1);
}

// "100,200" or "100, 200"
std::optional<Position> parseCoordinates(const std::string& s) {
    size_t comma = s.find(',');
    if(comma == std::string::npos) return std::nullopt;
    auto x = parseInt(s.substr(0, comma));
    auto y = parseInt(s.substr(comma + 1));
    if(!x || !y) return std::nullopt;
    return Position{ *x, *y };
}

// "(100,200)"
std::optional<Position> parsePair(const std::string& s) {
    std::string t = trim(s);
    if(t.size() < 2 || t.front() != '(' || t.back() != ')') return std::nullopt;
    return parseCoordinates(t.substr(1, t.size() - 2));
}

// Text after the first `count` words
std::string restAfterWords(const std::string& text, int count) {
    std::string rest = text;
    for(int i = 0; i < count; ++i) rest = splitFirstWord(rest).second;
    return rest;
}

bool isKeyName(const std::string& s) {
    if(s.empty()) return false;
    for(char c : s) if(!isNameChar(c)) return false;
    return true;
}

} // namespace

// ----------------------- Interpreter -----------------------

Interpreter::Interpreter(const Program& program, ActionAdapter& adapter,
                         std::ostream& out, std::ostream& err)
    : program_(program), adapter_(adapter), out_(out), err_(err) {}

Opcode Interpreter::decode(const Instruction& ins) {
    auto [word, rest] = splitFirstWord(ins.text);
    if(word == "var"){
        std::string sub = splitFirstWord(rest).first;
        if(sub == "set") return Opcode::VarSet;
        if(sub == "increase") return Opcode::VarIncrease;
        return Opcode::Unknown;
    }
    if(word == "checkpoint") return Opcode::Checkpoint;
    if(word == "goto") return Opcode::Goto;
    if(word == "mouse") return Opcode::Mouse;
    if(word == "key") return Opcode::Key;
    if(word == "sleep") return Opcode::Sleep;
    if(word == "if" || startsWith(ins.text, "if(")) return Opcode::If;
    if(word == "cv" && splitFirstWord(rest).first == "match") return Opcode::CvMatch;
    if(word == "end") return Opcode::End;
    return Opcode::Unknown;
}

RunResult Interpreter::run() {
    while(pc_ < program_.size()){
        if(INTERRUPT_FLAG) return RunResult::Interrupted;
        const Instruction& ins = program_.at(pc_);
        try {
            step();
        } catch(const MacroError& e) {
            lastError_ = e.what();
            err_ << "Error executing command '" << ins.text << "' at line "
                 << ins.sourceLine << ": " << e.what() << "\n";
            return RunResult::Aborted;
        }
    }
    if(INTERRUPT_FLAG) return RunResult::Interrupted;
    return RunResult::Completed;
}

void Interpreter::step() {
    if(pc_ >= program_.size()) return;
    const Instruction& ins = program_.at(pc_);

    switch(decode(ins)){
        case Opcode::VarSet:      execVarSet(ins); break;
        case Opcode::VarIncrease: execVarIncrease(ins); break;
        case Opcode::Checkpoint:  break; // registered at load time
        case Opcode::Goto:        execGoto(ins); break;
        case Opcode::Mouse:       execMouse(ins); break;
        case Opcode::Key:         execKey(ins); break;
        case Opcode::Sleep:       execSleep(ins); break;
        case Opcode::If:          execIf(ins); break;
        case Opcode::CvMatch:     execCvMatch(ins); break;
        case Opcode::End:         execEnd(ins); break;
        case Opcode::Unknown:
            err_ << "Unknown command: " << ins.text << "\n";
            break;
    }

    ++executed_;
    // goto and skips have already moved pc_; the advance still applies
    ++pc_;
    if(pc_ > program_.size()) pc_ = program_.size();
}

void Interpreter::execVarSet(const Instruction& ins) {
    auto [ref, valueText] = splitFirstWord(restAfterWords(ins.text, 2));
    auto name = parseVarRef(ref);
    if(!name || valueText.empty()) throw SyntaxError("Invalid var set syntax: " + ins.text);

    Value value;
    if(valueText[0] == '('){
        auto p = parsePair(valueText);
        if(!p) throw SyntaxError("Invalid position value: " + valueText);
        value = *p;
    } else {
        auto n = parseInt(valueText);
        if(!n) throw SyntaxError("Invalid integer value: " + valueText);
        value = *n;
    }
    vars_.set(*name, value);
    out_ << "Set $" << *name << " = " << valueToString(value) << "\n";
}

void Interpreter::execVarIncrease(const Instruction& ins) {
    auto words = splitWords(ins.text);
    std::optional<std::string> name;
    std::optional<int64_t> delta;
    if(words.size() == 4){
        name = parseVarRef(words[2]);
        delta = parseInt(words[3]);
    }
    if(!name || !delta) throw SyntaxError("Invalid var increase syntax: " + ins.text);

    int64_t now = vars_.increase(*name, *delta);
    out_ << "Increased $" << *name << " by " << *delta << ", now = " << now << "\n";
}

void Interpreter::execGoto(const Instruction& ins) {
    auto name = parseQuotedName(ins.text, "goto");
    if(!name) throw SyntaxError("Invalid goto syntax: " + ins.text);
    auto target = program_.checkpoint(*name);
    if(!target) throw SyntaxError("Checkpoint '" + *name + "' not found");
    pc_ = *target;
    out_ << "Jumping to checkpoint: " << *name << "\n";
}

void Interpreter::execMouse(const Instruction& ins) {
    auto words = splitWords(ins.text);
    if(words.size() >= 3 && words[1] == "move"){
        std::string arg = restAfterWords(ins.text, 2);
        Position p;
        if(arg[0] == '$'){
            auto name = parseVarRef(arg);
            if(!name) throw SyntaxError("Invalid mouse move syntax: " + ins.text);
            p = vars_.getPosition(*name);
        } else {
            auto c = parseCoordinates(arg);
            if(!c) throw SyntaxError("Invalid mouse move syntax: " + ins.text);
            p = *c;
        }
        adapter_.moveTo(p.x, p.y);
        out_ << "Mouse moved to (" << p.x << ", " << p.y << ")\n";
        pauseAfterAction();
        return;
    }

    if(words.size() != 3 || (words[1] != "left" && words[1] != "right"))
        throw SyntaxError("Unknown mouse command: " + ins.text);

    MouseButton button = words[1] == "left" ? MouseButton::Left : MouseButton::Right;
    const char* label = button == MouseButton::Left ? "Left" : "Right";
    if(words[2] == "click"){
        adapter_.click(button);
        out_ << label << " mouse click\n";
    } else if(words[2] == "down"){
        adapter_.buttonDown(button);
        out_ << label << " mouse down\n";
    } else if(words[2] == "up"){
        adapter_.buttonUp(button);
        out_ << label << " mouse up\n";
    } else {
        throw SyntaxError("Unknown mouse command: " + ins.text);
    }
    pauseAfterAction();
}

void Interpreter::execKey(const Instruction& ins) {
    auto words = splitWords(ins.text);
    std::string sub = words.size() > 1 ? words[1] : "";

    if(sub == "type"){
        std::string arg = restAfterWords(ins.text, 2);
        if(arg.size() < 2 || arg.front() != '"' || arg.back() != '"')
            throw SyntaxError("Invalid key type syntax: " + ins.text);
        std::string text = arg.substr(1, arg.size() - 2);
        adapter_.typeText(text);
        out_ << "Typed: " << text << "\n";
        pauseAfterAction();
        return;
    }

    if(sub != "down" && sub != "up" && sub != "press")
        throw SyntaxError("Unknown key command: " + ins.text);
    if(words.size() != 3 || !isKeyName(words[2]))
        throw SyntaxError("Invalid key " + sub + " syntax: " + ins.text);

    const std::string& key = words[2];
    if(sub == "down"){
        adapter_.keyDown(key);
        out_ << "Key down: " << key << "\n";
    } else if(sub == "up"){
        adapter_.keyUp(key);
        out_ << "Key up: " << key << "\n";
    } else {
        adapter_.keyPress(key);
        out_ << "Key press: " << key << "\n";
    }
    pauseAfterAction();
}

void Interpreter::execSleep(const Instruction& ins) {
    auto words = splitWords(ins.text);
    std::optional<int64_t> ms;
    if(words.size() == 2) ms = parseInt(words[1], false);
    if(!ms) throw SyntaxError("Invalid sleep syntax: " + ins.text);

    sleepMs(*ms);
    if(INTERRUPT_FLAG) out_ << "Sleep interrupted\n";
    else out_ << "Slept for " << *ms << "ms\n";
}

void Interpreter::execIf(const Instruction& ins) {
    std::string cond = trim(ins.text.substr(2));
    if(cond.size() < 2 || cond.front() != '(' || cond.back() != ')')
        throw SyntaxError("Invalid if syntax: " + ins.text);

    std::string shown = trim(cond.substr(1, cond.size() - 2));
    if(evaluateCondition(cond, vars_, lastStatus_, err_)){
        out_ << "Condition '" << shown << "' is true, executing block\n";
    } else {
        out_ << "Condition '" << shown << "' is false, skipping to end\n";
        skipToEnd();
    }
}

// Flat scan for the next literal `end`; nesting is not tracked
void Interpreter::skipToEnd() {
    size_t j = pc_ + 1;
    while(j < program_.size() && program_.at(j).text != "end") ++j;
    pc_ = j;
}

void Interpreter::execCvMatch(const Instruction& ins) {
    auto words = splitWords(ins.text);
    if(words.size() < 5) throw SyntaxError("Invalid cv match syntax: " + ins.text);

    auto name = parseVarRef(words.back());
    std::string pct = words[words.size() - 2];
    std::optional<int64_t> percent;
    if(pct.size() >= 2 && pct.back() == '%') percent = parseInt(pct.substr(0, pct.size() - 1), false);
    if(!name || !percent || *percent > 100) throw SyntaxError("Invalid cv match syntax: " + ins.text);

    // path is everything between "cv match" and the percentage
    std::string rest = restAfterWords(ins.text, 2);
    size_t pctPos = rest.rfind(pct);
    std::string path = trim(rest.substr(0, pctPos));
    if(path.size() >= 2 && path.front() == '"' && path.back() == '"') path = path.substr(1, path.size() - 2);
    if(path.empty()) throw SyntaxError("Invalid cv match syntax: " + ins.text);

    const double threshold = *percent / 100.0;
    try {
        std::optional<Image> templ = adapter_.loadImage(path);
        if(!templ){
            err_ << "Could not load template image '" << path << "'\n";
            lastStatus_ = STATUS_FAILURE;
            return;
        }
        Image screen = adapter_.captureScreen();
        ScreenSize logical = adapter_.logicalScreenSize();

        MatchResult m = locate(screen, *templ, threshold);
        if(!m.searched){
            err_ << "Template '" << path << "' (" << templ->w << "x" << templ->h
                 << ") does not fit in the screen capture (" << screen.w << "x" << screen.h << ")\n";
            lastStatus_ = STATUS_FAILURE;
            return;
        }
        if(!m.found){
            out_ << "Template '" << path << "' not found (best confidence "
                 << std::fixed << std::setprecision(3) << m.confidence << " < " << threshold << ")\n"
                 << std::defaultfloat;
            lastStatus_ = STATUS_FAILURE;
            return;
        }

        Position p = rescaleToLogical(m.center, screen.size(), logical);
        vars_.set(*name, p);
        lastStatus_ = STATUS_SUCCESS;
        out_ << "Template '" << path << "' found at (" << p.x << ", " << p.y << ") with confidence "
             << std::fixed << std::setprecision(3) << m.confidence << std::defaultfloat
             << ", stored in $" << *name << "\n";
    } catch(const MacroError& e) {
        err_ << "Template match failed for '" << path << "': " << e.what() << "\n";
        lastStatus_ = STATUS_FAILURE;
    }
}

void Interpreter::execEnd(const Instruction& ins) {
    if(ins.text != "end") throw SyntaxError("Invalid end syntax: " + ins.text);
}

void Interpreter::pauseAfterAction() {
    if(actionPauseMs_ > 0) sleepMs(actionPauseMs_);
}

} // namespace PMACRO
