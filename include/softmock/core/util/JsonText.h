#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <map>
#include <cstdint>

namespace softmock::core::util {
std::string escape_json(std::string_view in);
std::string b64_encode(std::string_view in);
std::optional<std::string> b64_decode(std::string_view in);

// Value of a flat JSON object member. Numbers keep their literal text.
struct JsonScalar {
    enum class Type { string, number, boolean, null };
    Type type{Type::null};
    std::string text;
    bool flag{false};
    uint64_t as_u64() const;
    int64_t as_i64() const;
};

// Parses one object of string/number/bool/null members (no nesting), the
// shape written by the flow journal. Returns nullopt on any syntax error.
std::optional<std::map<std::string, JsonScalar>> parse_flat_json_object(std::string_view json);
}
