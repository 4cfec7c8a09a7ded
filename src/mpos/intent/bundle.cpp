#include "mpos/intent/bundle.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "mpos/common/overloaded.hpp"

namespace mpos {

auto FormatValue(const Value& value) -> std::string {
  return std::visit(
      Overloaded{
          [](std::monostate) -> std::string { return "null"; },
          [](bool b) -> std::string { return b ? "true" : "false"; },
          [](int64_t i) -> std::string { return fmt::format("{}", i); },
          [](double d) -> std::string { return fmt::format("{}", d); },
          [](const std::string& s) -> std::string {
            return fmt::format("\"{}\"", s);
          },
          [](const std::vector<std::string>& list) -> std::string {
            std::string out = "[";
            for (size_t i = 0; i < list.size(); ++i) {
              if (i > 0) {
                out += ", ";
              }
              out += list[i];
            }
            out += "]";
            return out;
          },
      },
      value);
}

auto FormatBundle(const Bundle& bundle) -> std::string {
  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : bundle) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += key;
    out += "=";
    out += FormatValue(value);
  }
  out += "}";
  return out;
}

auto IsTruthy(const Value& value) -> bool {
  return std::visit(
      Overloaded{
          [](std::monostate) { return false; },
          [](bool b) { return b; },
          [](int64_t i) { return i != 0; },
          [](double d) { return d != 0.0; },
          [](const std::string& s) { return !s.empty(); },
          [](const std::vector<std::string>& list) { return !list.empty(); },
      },
      value);
}

}  // namespace mpos
