#include "pmacro_expr.hpp"
#include "pmacro_errors.hpp"
#include "text_util.hpp"

#include <cstring>
#include <limits>
#include <ostream>
#include <unordered_set>

namespace PMACRO {

std::string substituteVariables(const std::string& condition,
                                const VariableStore& vars,
                                int lastStatus) {
    std::string out;
    size_t i = 0;
    while(i < condition.size()){
        char c = condition[i];
        if(c != '$'){
            out.push_back(c);
            ++i;
            continue;
        }
        // longest defined name that matches right after the '$'
        size_t j = i + 1;
        while(j < condition.size() && isNameChar(condition[j])) ++j;
        const Value* value = nullptr;
        size_t len = j - (i + 1);
        for(; len > 0; --len){
            value = vars.find(condition.substr(i + 1, len));
            if(value) break;
        }
        if(value){
            out += valueToString(*value);
            i += 1 + len;
        } else {
            out += std::to_string(lastStatus);
            ++i;
        }
    }
    return out;
}

// ----------------------- Expression Engine -----------------------

namespace {

int precedence(const std::string &op){
    if(op == "or" || op == "||") return 1;
    if(op == "and" || op == "&&" || op == "CHAINAND") return 2;
    if(op == "NOT") return 3;
    if(op == "==" || op == "!=" || op == "<" || op == "<=" || op == ">" || op == ">=" || op == "CHAINAND") return 4;
    if(op == "+" || op == "-") return 5;
    if(op == "*" || op == "/" || op == "%") return 6;
    if(op == "NEG" || op == "POS") return 7;
    return 0;
}

bool isBinaryOperator(const std::string &s){
    static const std::unordered_set<std::string> ops = {
        "+", "-", "*", "/", "%", "==", "!=", "<", "<=", ">", ">=", "and", "&&", "or", "||", "CHAINAND"
    };
    return ops.count(s) != 0;
}

bool isComparison(const std::string &s){
    return s == "==" || s == "!=" || s == "<" || s == "<=" || s == ">" || s == ">=";
}

// "CHAIN<" etc: compare, then keep the right operand for the next link
bool isChainLink(const std::string &s){
    return s.size() > 5 && s.compare(0, 5, "CHAIN") == 0 && isComparison(s.substr(5));
}

bool isUnaryOperator(const std::string &s){
    return s == "NEG" || s == "POS" || s == "NOT";
}

bool isOperator(const std::string &s){
    return isBinaryOperator(s) || isUnaryOperator(s);
}

bool isNumber(const std::string &s){
    if(s.empty()) return false;
    for(char c : s) if(!std::isdigit((unsigned char)c)) return false;
    return true;
}

bool isLiteralWord(const std::string &s){
    return s == "true" || s == "false" || s == "True" || s == "False";
}

int64_t parseNumber(const std::string &s){
    try {
        return std::stoll(s);
    } catch(const std::exception&) {
        throw ConditionError("integer literal out of range: " + s);
    }
}

ExprValue intValue(int64_t v){
    ExprValue r;
    r.a = v;
    return r;
}

ExprValue applyBinary(const std::string &op, const ExprValue &x, const ExprValue &y){
    if(op == "and" || op == "&&" || op == "CHAINAND") return intValue(x.truthy() && y.truthy());
    if(op == "or" || op == "||") return intValue(x.truthy() || y.truthy());

    if(x.pair || y.pair){
        bool same = x.pair == y.pair && x.a == y.a && x.b == y.b;
        if(op == "==") return intValue(same);
        if(op == "!=") return intValue(!same);
        throw ConditionError("operator '" + op + "' is not defined for positions");
    }

    int64_t a = x.a, b = y.a;
    int64_t r;
    if(op == "+" || op == "-" || op == "*"){
        bool overflow = op == "+" ? __builtin_add_overflow(a, b, &r)
                      : op == "-" ? __builtin_sub_overflow(a, b, &r)
                      : __builtin_mul_overflow(a, b, &r);
        if(overflow) throw ConditionError("integer overflow in '" + op + "'");
        return intValue(r);
    }
    if(op == "/" || op == "%"){
        if(b == 0) throw ConditionError("division by zero");
        if(b == -1 && a == std::numeric_limits<int64_t>::min()) throw ConditionError("integer overflow");
        return intValue(op == "/" ? a / b : a % b);
    }
    if(op == "==") return intValue(a == b);
    if(op == "!=") return intValue(a != b);
    if(op == "<") return intValue(a < b);
    if(op == "<=") return intValue(a <= b);
    if(op == ">") return intValue(a > b);
    if(op == ">=") return intValue(a >= b);
    throw ConditionError("unknown operator '" + op + "'");
}

} // namespace

std::vector<std::string> tokenizeExpr(const std::string &s){
    std::vector<std::string> out;
    size_t i = 0;
    while(i < s.size()){
        if(std::isspace((unsigned char)s[i])) { ++i; continue; }
        // two-char ops
        if(i + 1 < s.size()){
            std::string two = s.substr(i, 2);
            if(two=="<="||two==">="||two=="=="||two=="!="||two=="&&"||two=="||"){
                out.push_back(two); i += 2; continue;
            }
        }
        char c = s[i];
        if(std::strchr("+-*/%()<>!,", c)){
            out.push_back(std::string(1, c));
            ++i; continue;
        }
        if(std::isdigit((unsigned char)c)){
            size_t j = i + 1;
            while(j < s.size() && std::isdigit((unsigned char)s[j])) j++;
            out.push_back(s.substr(i, j - i));
            i = j; continue;
        }
        if(std::isalpha((unsigned char)c) || c == '_'){
            size_t j = i + 1;
            while(j < s.size() && isNameChar(s[j])) j++;
            std::string word = s.substr(i, j - i);
            if(word != "and" && word != "or" && word != "not" && !isLiteralWord(word)){
                throw ConditionError("unknown name '" + word + "'");
            }
            out.push_back(word);
            i = j; continue;
        }
        throw ConditionError(std::string("unexpected character '") + c + "'");
    }
    return out;
}

std::vector<std::string> infixToRPN(const std::vector<std::string> &tokens){
    std::vector<std::string> out;
    std::vector<std::string> st;
    std::vector<int> commas;   // one entry per open parenthesis
    bool prevOperand = false;  // last token ended an operand

    for(const std::string &tok : tokens){
        std::string t = tok;
        if(!prevOperand){
            if(t == "-") t = "NEG";
            else if(t == "+") t = "POS";
        }
        if(t == "!" || t == "not") t = "NOT";

        if(isUnaryOperator(t)){
            if(prevOperand) throw ConditionError("unexpected '" + tok + "'");
            st.push_back(t);
        } else if(isBinaryOperator(t)){
            if(!prevOperand) throw ConditionError("missing operand before '" + t + "'");
            if(isComparison(t)){
                // a < b < c reads as (a < b) and (b < c)
                while(!st.empty() && isOperator(st.back()) && precedence(st.back()) > precedence(t)){
                    out.push_back(st.back()); st.pop_back();
                }
                if(!st.empty() && isComparison(st.back())){
                    out.push_back("CHAIN" + st.back()); st.pop_back();
                    st.push_back("CHAINAND");
                }
            } else {
                while(!st.empty() && isOperator(st.back()) && precedence(st.back()) >= precedence(t)){
                    out.push_back(st.back()); st.pop_back();
                }
            }
            st.push_back(t);
            prevOperand = false;
        } else if(t == "("){
            if(prevOperand) throw ConditionError("unexpected '('");
            st.push_back(t);
            commas.push_back(0);
        } else if(t == ","){
            if(!prevOperand) throw ConditionError("missing operand before ','");
            while(!st.empty() && st.back() != "("){
                out.push_back(st.back()); st.pop_back();
            }
            if(st.empty() || commas.empty()) throw ConditionError("',' outside of a pair");
            if(++commas.back() > 1) throw ConditionError("only pairs of two values are supported");
            prevOperand = false;
        } else if(t == ")"){
            if(!prevOperand) throw ConditionError("missing operand before ')'");
            while(!st.empty() && st.back() != "("){
                out.push_back(st.back()); st.pop_back();
            }
            if(st.empty()) throw ConditionError("unbalanced ')'");
            st.pop_back();
            if(commas.back() == 1) out.push_back("PAIR");
            commas.pop_back();
            prevOperand = true;
        } else {
            // number or literal word
            if(prevOperand) throw ConditionError("missing operator before '" + t + "'");
            out.push_back(t);
            prevOperand = true;
        }
    }
    if(!tokens.empty() && !prevOperand) throw ConditionError("expression ends with an operator");
    while(!st.empty()){
        if(st.back() == "(") throw ConditionError("unbalanced '('");
        out.push_back(st.back()); st.pop_back();
    }
    return out;
}

ExprValue evalRPN(const std::vector<std::string> &rpn){
    std::vector<ExprValue> st;
    auto pop = [&st]() {
        if(st.empty()) throw ConditionError("malformed expression");
        ExprValue v = st.back(); st.pop_back();
        return v;
    };
    for(const std::string &t : rpn){
        if(isBinaryOperator(t)){
            ExprValue b = pop();
            ExprValue a = pop();
            st.push_back(applyBinary(t, a, b));
        } else if(isChainLink(t)){
            ExprValue b = pop();
            ExprValue a = pop();
            st.push_back(applyBinary(t.substr(5), a, b));
            st.push_back(b);
        } else if(t == "NEG" || t == "POS"){
            ExprValue a = pop();
            if(a.pair) throw ConditionError("unary '" + std::string(t == "NEG" ? "-" : "+") + "' is not defined for positions");
            if(t == "NEG" && a.a == std::numeric_limits<int64_t>::min()) throw ConditionError("integer overflow in unary '-'");
            st.push_back(intValue(t == "NEG" ? -a.a : a.a));
        } else if(t == "NOT"){
            st.push_back(intValue(!pop().truthy()));
        } else if(t == "PAIR"){
            ExprValue y = pop();
            ExprValue x = pop();
            if(x.pair || y.pair) throw ConditionError("nested pairs are not supported");
            ExprValue p;
            p.pair = true;
            p.a = x.a;
            p.b = y.a;
            st.push_back(p);
        } else if(t == "true" || t == "True"){
            st.push_back(intValue(1));
        } else if(t == "false" || t == "False"){
            st.push_back(intValue(0));
        } else if(isNumber(t)){
            st.push_back(intValue(parseNumber(t)));
        } else {
            throw ConditionError("unexpected token '" + t + "'");
        }
    }
    if(st.size() != 1) throw ConditionError("malformed expression");
    return st.back();
}

bool evaluateExpression(const std::string& expr){
    auto tokens = tokenizeExpr(expr);
    if(tokens.empty()) throw ConditionError("empty expression");
    auto rpn = infixToRPN(tokens);
    return evalRPN(rpn).truthy();
}

bool evaluateCondition(const std::string& condition,
                       const VariableStore& vars,
                       int lastStatus,
                       std::ostream& log){
    std::string expr = substituteVariables(condition, vars, lastStatus);
    try {
        return evaluateExpression(expr);
    } catch(const ConditionError& e) {
        log << "Error evaluating condition '" << expr << "': " << e.what() << "\n";
        return false;
    }
}

} // namespace PMACRO
