#pragma once
#include <string>
#include <utility>
#include <vector>
#include <cctype>

namespace PMACRO {

// Trims leading and trailing whitespace from a string
inline std::string trim(const std::string& s) {
    size_t a = 0;
    while(a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size();
    while(b > a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b-a);
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

inline bool isNameChar(char c) {
    return std::isalnum((unsigned char)c) || c == '_';
}

// Splits on whitespace; the first word and the remainder (trimmed)
inline std::pair<std::string, std::string> splitFirstWord(const std::string& s) {
    std::string t = trim(s);
    size_t p = 0;
    while(p < t.size() && !std::isspace((unsigned char)t[p])) ++p;
    return { t.substr(0, p), trim(t.substr(p)) };
}

inline std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for(char c : s){
        if(std::isspace((unsigned char)c)){
            if(!cur.empty()){ out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

} // namespace PMACRO
