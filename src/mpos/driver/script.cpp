#include "script.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "mpos/activity/activity_result.hpp"
#include "mpos/navigator/chooser_activity.hpp"

namespace mpos::driver {

namespace fs = std::filesystem;

namespace {

struct VerbArity {
  std::string_view verb;
  size_t min_args;
  size_t max_args;
};

constexpr size_t kUnbounded = SIZE_MAX;

constexpr VerbArity kVerbs[] = {
    {.verb = "start", .min_args = 1, .max_args = kUnbounded},
    {.verb = "action", .min_args = 1, .max_args = kUnbounded},
    {.verb = "start-for-result", .min_args = 1, .max_args = kUnbounded},
    {.verb = "choose", .min_args = 1, .max_args = 1},
    {.verb = "finish", .min_args = 0, .max_args = kUnbounded},
    {.verb = "back", .min_args = 0, .max_args = 0},
    {.verb = "background", .min_args = 0, .max_args = 0},
    {.verb = "foreground", .min_args = 0, .max_args = 0},
    {.verb = "stack", .min_args = 0, .max_args = 0},
};

auto FindVerb(std::string_view verb) -> const VerbArity* {
  for (const auto& entry : kVerbs) {
    if (entry.verb == verb) {
      return &entry;
    }
  }
  return nullptr;
}

// A token starting with '#' begins a comment; '#' inside a token is data.
auto Tokenize(std::string_view line) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  std::istringstream in{std::string(line)};
  std::string token;
  while (in >> token) {
    if (token.front() == '#') {
      break;
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

auto ScriptError(std::string_view origin, size_t line, std::string_view detail)
    -> Diagnostic {
  return Diagnostic::HostError(
      DiagCode::kScript, fmt::format("{}:{}: {}", origin, line, detail));
}

// Applies "key=value" and "+flag" tokens to `intent`.
auto ApplyExtras(Intent& intent, const std::vector<std::string>& tokens,
                 size_t first) -> std::optional<std::string> {
  for (size_t i = first; i < tokens.size(); ++i) {
    std::string_view token = tokens[i];
    if (token.starts_with('+')) {
      if (token.size() == 1) {
        return "empty flag name '+'";
      }
      intent.AddFlag(std::string(token.substr(1)));
      continue;
    }
    auto eq = token.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      return fmt::format("expected key=value, got '{}'", token);
    }
    intent.Put(
        std::string(token.substr(0, eq)), ParseValue(token.substr(eq + 1)));
  }
  return std::nullopt;
}

auto ParseBundle(const std::vector<std::string>& tokens, size_t first)
    -> std::expected<Bundle, std::string> {
  Bundle bundle;
  for (size_t i = first; i < tokens.size(); ++i) {
    std::string_view token = tokens[i];
    auto eq = token.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      return std::unexpected(
          fmt::format("expected key=value, got '{}'", token));
    }
    bundle[std::string(token.substr(0, eq))] =
        ParseValue(token.substr(eq + 1));
  }
  return bundle;
}

}  // namespace

auto ParseValue(std::string_view text) -> Value {
  if (text == "true") return true;
  if (text == "false") return false;
  if (text == "null") return std::monostate{};

  const char* first = text.data();
  const char* last = text.data() + text.size();

  int64_t integer = 0;
  auto [int_end, int_ec] = std::from_chars(first, last, integer);
  if (int_ec == std::errc{} && int_end == last) {
    return integer;
  }

  double real = 0.0;
  auto [real_end, real_ec] = std::from_chars(first, last, real);
  if (real_ec == std::errc{} && real_end == last) {
    return real;
  }

  return std::string(text);
}

auto ParseScript(std::string_view text, std::string_view origin)
    -> Result<std::vector<ScriptCommand>> {
  std::vector<ScriptCommand> commands;
  std::istringstream in{std::string(text)};
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto tokens = Tokenize(line);
    if (tokens.empty()) {
      continue;
    }

    const VerbArity* verb = FindVerb(tokens.front());
    if (verb == nullptr) {
      return std::unexpected(ScriptError(
          origin, line_no, fmt::format("unknown command '{}'", tokens.front())));
    }
    size_t arg_count = tokens.size() - 1;
    if (arg_count < verb->min_args || arg_count > verb->max_args) {
      return std::unexpected(ScriptError(
          origin, line_no,
          fmt::format("wrong number of arguments for '{}'", verb->verb)));
    }

    ScriptCommand command{
        .line = line_no,
        .verb = tokens.front(),
        .args = std::vector<std::string>(tokens.begin() + 1, tokens.end()),
    };
    commands.push_back(std::move(command));
  }
  return commands;
}

auto LoadScript(const fs::path& path) -> Result<std::vector<ScriptCommand>> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            DiagCode::kScript,
            fmt::format("cannot open script '{}'", path.string())));
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ParseScript(ss.str(), path.string());
}

ScriptRunner::ScriptRunner(Shell& shell, FILE* out, std::string origin)
    : shell_(shell), out_(out), origin_(std::move(origin)) {
}

auto ScriptRunner::Run(const std::vector<ScriptCommand>& commands)
    -> Result<void> {
  for (const auto& command : commands) {
    fmt::print(
        out_, "> {}{}{}\n", command.verb, command.args.empty() ? "" : " ",
        fmt::join(command.args, " "));
    auto result = Execute(command);
    if (!result) {
      return result;
    }
    // Background updates posted during the command land before the next one.
    shell_.Navigator().GetUiThread().RunPending();
  }
  return {};
}

auto ScriptRunner::Fail(const ScriptCommand& command, std::string_view detail)
    const -> Diagnostic {
  return ScriptError(origin_, command.line, detail);
}

auto ScriptRunner::BuildIntent(
    const ScriptCommand& command, std::string_view target, bool implicit)
    -> Result<Intent> {
  Intent intent;
  if (implicit) {
    intent = Intent::Implicit(std::string(target));
  } else {
    auto activity_class = shell_.Apps().FindClass(target);
    if (!activity_class) {
      return std::unexpected(
          Fail(command, fmt::format("unknown activity class '{}'", target)));
    }
    intent = Intent::Explicit(std::move(*activity_class));
  }
  if (auto error = ApplyExtras(intent, command.args, 1)) {
    return std::unexpected(Fail(command, *error));
  }
  return intent;
}

auto ScriptRunner::Execute(const ScriptCommand& command) -> Result<void> {
  ActivityNavigator& navigator = shell_.Navigator();
  const std::string& verb = command.verb;

  if (verb == "start" || verb == "action" || verb == "start-for-result") {
    std::string_view target = command.args.front();
    bool implicit = verb == "action";
    if (verb == "start-for-result" && target.starts_with("action:")) {
      target.remove_prefix(std::string_view("action:").size());
      implicit = true;
    }
    auto intent = BuildIntent(command, target, implicit);
    if (!intent) {
      return std::unexpected(intent.error());
    }

    Result<LaunchOutcome> outcome;
    if (verb == "start-for-result") {
      FILE* out = out_;
      outcome = navigator.StartActivityForResult(
          *intent, [out](const ActivityResult& result) {
            fmt::print(
                out, "  callback {} {}\n",
                result.result_code.value_or("<none>"),
                FormatBundle(result.data));
          });
    } else {
      outcome = navigator.StartActivity(*intent);
    }
    if (!outcome) {
      return std::unexpected(outcome.error());
    }
    fmt::print(out_, "  -> {}\n", LaunchOutcomeName(*outcome));
    return {};
  }

  if (verb == "choose") {
    size_t index = 0;
    const std::string& arg = command.args.front();
    auto [end, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), index);
    if (ec != std::errc{} || end != arg.data() + arg.size()) {
      return std::unexpected(
          Fail(command, fmt::format("invalid choice index '{}'", arg)));
    }
    auto* chooser = dynamic_cast<ChooserActivity*>(navigator.Top());
    if (chooser == nullptr) {
      return std::unexpected(Fail(command, "no chooser on top"));
    }
    if (!chooser->Choose(index)) {
      return std::unexpected(Fail(
          command, fmt::format(
                       "choice {} out of range ({} candidates)", index,
                       chooser->Candidates().size())));
    }
    return {};
  }

  if (verb == "finish") {
    if (navigator.StackDepth() == 0) {
      return std::unexpected(Fail(command, "nothing to finish"));
    }
    if (command.args.empty()) {
      navigator.FinishTop();
      return {};
    }
    auto data = ParseBundle(command.args, 1);
    if (!data) {
      return std::unexpected(Fail(command, data.error()));
    }
    navigator.FinishTop(command.args.front(), std::move(*data));
    return {};
  }

  if (verb == "back") {
    if (!navigator.Back()) {
      fmt::print(out_, "  (at root)\n");
    }
    return {};
  }

  if (verb == "background") {
    navigator.OnAppBackground();
    return {};
  }

  if (verb == "foreground") {
    navigator.OnAppForeground();
    return {};
  }

  if (verb == "stack") {
    fmt::print(
        out_, "  stack: {}\n", fmt::join(navigator.StackClassNames(), " > "));
    return {};
  }

  return std::unexpected(
      Fail(command, fmt::format("unknown command '{}'", verb)));
}

}  // namespace mpos::driver
