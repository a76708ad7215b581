#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>

namespace PMACRO {

struct Position {
    int64_t x = 0;
    int64_t y = 0;
    bool operator==(const Position& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Position& o) const { return !(*this == o); }
};

using Value = std::variant<int64_t, Position>;

inline bool isInteger(const Value& v) { return std::holds_alternative<int64_t>(v); }
inline bool isPosition(const Value& v) { return std::holds_alternative<Position>(v); }

// "5" for integers, "(x, y)" for positions
std::string valueToString(const Value& v);

class VariableStore {
public:
    void set(const std::string& name, const Value& value);

    // Throws NotFoundError when the name was never set
    const Value& get(const std::string& name) const;
    int64_t getInteger(const std::string& name) const;
    Position getPosition(const std::string& name) const;

    const Value* find(const std::string& name) const;
    bool has(const std::string& name) const { return vars_.count(name) != 0; }

    // Absent names start at 0; positions raise TypeError, leaving the 64-bit
    // range raises OverflowError. Returns the new value.
    int64_t increase(const std::string& name, int64_t delta);

    size_t size() const { return vars_.size(); }
    void clear() { vars_.clear(); }

private:
    std::unordered_map<std::string, Value> vars_;
};

} // namespace PMACRO
