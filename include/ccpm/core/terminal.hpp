#pragma once

namespace ccpm {

/// Returns true if the given file descriptor is connected to a terminal.
bool IsTerminal(int fd);

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdin is a terminal (for interactive prompts).
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Returns true if a CI-style environment signal is present (CI is set and
/// not "0"/"false"). Prompts must not wait for input in that case.
bool CiEnvSet();

} // namespace ccpm
