#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "pmacro_value.hpp"

namespace PMACRO {

// Replaces `$name` with the value of the longest defined variable matching at
// that point, and any other `$` with the last status code. Substituted text is
// not rescanned.
std::string substituteVariables(const std::string& condition,
                                const VariableStore& vars,
                                int lastStatus);

// ----------------------- Expression Engine -----------------------
// Integers, (a, b) pairs, + - * / %, comparisons, and/or/not.
// Unary operators come out of infixToRPN as NEG, POS and NOT; a
// parenthesised pair as PAIR.

struct ExprValue {
    bool pair = false;
    int64_t a = 0;
    int64_t b = 0;
    bool truthy() const { return pair || a != 0; }
};

std::vector<std::string> tokenizeExpr(const std::string& s);
std::vector<std::string> infixToRPN(const std::vector<std::string>& tokens);
ExprValue evalRPN(const std::vector<std::string>& rpn);

// Throws ConditionError on malformed input
bool evaluateExpression(const std::string& expr);

// Substitutes, evaluates and reports failures on `log`; a condition that
// cannot be evaluated is false.
bool evaluateCondition(const std::string& condition,
                       const VariableStore& vars,
                       int lastStatus,
                       std::ostream& log);

} // namespace PMACRO
