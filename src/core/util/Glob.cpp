#include "softmock/core/util/Glob.h"

namespace softmock::core::util {
namespace {
char lower(char c) { return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c; }

bool match_ci(const char* p, std::size_t pi, std::size_t pn, const char* t, std::size_t ti, std::size_t tn) {
    while (true) {
        if (pi == pn) return ti == tn;
        char pc = p[pi];
        if (pc == '*') {
            while (pi < pn && p[pi] == '*') ++pi; // collapse runs
            if (pi == pn) return true;
            for (std::size_t skip = 0; ti + skip <= tn; ++skip) {
                if (match_ci(p, pi, pn, t, ti + skip, tn)) return true;
            }
            return false;
        }
        if (ti == tn) return false;
        if (pc != '?' && lower(pc) != lower(t[ti])) return false;
        ++pi; ++ti;
    }
}
}

bool glob_match(const std::string& pattern, const std::string& text) {
    return match_ci(pattern.c_str(), 0, pattern.size(), text.c_str(), 0, text.size());
}
}
