#pragma once

namespace catalog_graph {

/// True when stderr is a terminal (colored log lines).
bool IsStderrTty();

/// True when stdout is a terminal (colored tables and errors).
bool IsStdoutTty();

/// True when NO_COLOR is set, whatever its value (https://no-color.org/).
bool NoColorEnvSet();

/// Color decision shared by the logger and the output formatter:
/// an explicit --color/--no-color wins, then NO_COLOR, then the TTY check.
bool ShouldUseColor(int explicit_choice, bool is_tty);

} // namespace catalog_graph
