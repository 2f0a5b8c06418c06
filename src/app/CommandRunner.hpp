#pragma once

#include "CommandLine.hpp"

#include <iosfwd>

struct ToolSettings;

// Applies command to every line of in and writes one result per line to out.
// Returns 0 on success, 1 if the operation rejected its settings; the failure
// is reported through utils::ErrorReporter.
int runCommand(Command command, const ToolSettings& settings, std::istream& in, std::ostream& out);
