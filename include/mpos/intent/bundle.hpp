#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace mpos {

// A single payload value carried by an Intent or an activity result.
// std::monostate is an explicit "null" entry.
using Value = std::variant<
    std::monostate, bool, int64_t, double, std::string,
    std::vector<std::string>>;

// String-keyed payload. Key order carries no meaning; std::map only keeps
// printing deterministic.
using Bundle = std::map<std::string, Value>;

// {x=1, name="a"}
auto FormatValue(const Value& value) -> std::string;
auto FormatBundle(const Bundle& bundle) -> std::string;

// Truthiness used for intent flags: monostate, false, 0, 0.0 and empty
// strings/lists are false.
auto IsTruthy(const Value& value) -> bool;

}  // namespace mpos
