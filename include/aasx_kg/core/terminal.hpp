#pragma once

namespace aasx_kg {

namespace ansi {

constexpr const char* kReset  = "\033[0m";
constexpr const char* kBold   = "\033[1m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kGreen  = "\033[1;32m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";

} // namespace ansi

/// True when stderr is attached to a terminal (colored log output).
bool IsStderrTty();

/// True when stdout is attached to a terminal (colored tables and errors).
bool IsStdoutTty();

/// True when NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

// ---------------------------------------------------------------------------
// ColorChoice — what the user asked for with --color / --no-color.
// ---------------------------------------------------------------------------
enum class ColorChoice {
    Auto,
    Always,
    Never,
};

/// Decide whether to emit ANSI codes. --no-color and NO_COLOR win over
/// --color; Auto follows the terminal check.
bool ResolveColor(ColorChoice choice, bool is_tty);

} // namespace aasx_kg
