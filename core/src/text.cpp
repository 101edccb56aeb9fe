#include "hostlink/text.h"

#include <cctype>
#include <sstream>

namespace hostlink::text {

std::string strip_formatting(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        unsigned char c = (unsigned char)s[i];

        // "§" is 0xC2 0xA7 in UTF-8; the code char follows.
        if (c == 0xC2 && i + 1 < s.size() && (unsigned char)s[i + 1] == 0xA7) {
            i += 1;
            if (i + 1 < s.size()) i += 1;
            continue;
        }

        if (c == 0x1B) {
            if (i + 1 < s.size() && s[i + 1] == '[') {
                i += 2;
                while (i < s.size()) {
                    unsigned char f = (unsigned char)s[i];
                    if (f >= 0x40 && f <= 0x7E) break;
                    i++;
                }
            } else if (i + 1 < s.size()) {
                i += 1;
            }
            continue;
        }

        if (c < 0x20 && c != '\t') continue;
        if (c == 0x7F) continue;
        out.push_back((char)c);
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string sanitize_identifier(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        bool ok = std::isalnum((unsigned char)c) || c == '_';
        char m = ok ? c : '_';
        if (m == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(m);
    }
    while (!out.empty() && out.front() == '_') out.erase(0, 1);
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out;
}

} // namespace hostlink::text
