#pragma once

namespace pbi_scan {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (for colored summary output).
bool IsStdoutTty();

/// Returns true if stdin is a terminal (interactive workspace picking).
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

} // namespace pbi_scan
