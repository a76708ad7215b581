#include "pmacro_value.hpp"
#include "pmacro_errors.hpp"

namespace PMACRO {

std::string valueToString(const Value& v) {
    if(const Position* p = std::get_if<Position>(&v)){
        return "(" + std::to_string(p->x) + ", " + std::to_string(p->y) + ")";
    }
    return std::to_string(std::get<int64_t>(v));
}

void VariableStore::set(const std::string& name, const Value& value) {
    vars_[name] = value;
}

const Value& VariableStore::get(const std::string& name) const {
    auto it = vars_.find(name);
    if(it == vars_.end()) throw NotFoundError("Variable '$" + name + "' is not defined");
    return it->second;
}

int64_t VariableStore::getInteger(const std::string& name) const {
    const Value& v = get(name);
    if(!isInteger(v)) throw TypeError("Variable '$" + name + "' holds a position, expected an integer");
    return std::get<int64_t>(v);
}

Position VariableStore::getPosition(const std::string& name) const {
    const Value& v = get(name);
    if(!isPosition(v)) throw TypeError("Variable '$" + name + "' holds an integer, expected a position");
    return std::get<Position>(v);
}

const Value* VariableStore::find(const std::string& name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

int64_t VariableStore::increase(const std::string& name, int64_t delta) {
    auto it = vars_.find(name);
    if(it == vars_.end()){
        it = vars_.emplace(name, Value(int64_t(0))).first;
    }
    int64_t* current = std::get_if<int64_t>(&it->second);
    if(!current) throw TypeError("Cannot increase '$" + name + "': it holds a position");
    int64_t sum;
    if(__builtin_add_overflow(*current, delta, &sum)){
        throw OverflowError("Cannot increase '$" + name + "' by " + std::to_string(delta) + ": result out of range");
    }
    *current = sum;
    return sum;
}

} // namespace PMACRO
