#pragma once
#include <string>
#include <cstddef>

namespace softmock::core::util {
// Very small glob: '*' matches any sequence, '?' matches a single char, case-insensitive.
bool glob_match(const std::string& pattern, const std::string& text);
}
