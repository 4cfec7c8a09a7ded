#pragma once

#include <string>

#include "mpos/common/diagnostic/diagnostic.hpp"
#include "mpos/common/diagnostic/diagnostic_sink.hpp"

namespace mpos::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace mpos::driver
