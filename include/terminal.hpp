#pragma once
#include <ostream>
#include <string>

#include <unistd.h>

/**
 * ANSI color helpers for the text report.
 *
 * Colors are emitted only when term::g_enabled is set; call
 * term::auto_enable() once at startup to turn them off when stdout is
 * not a terminal (pipes, files, CI logs).
 */

namespace term {

inline bool g_enabled = true;

inline const char* reset()  { return g_enabled ? "\x1b[0m"  : ""; }
inline const char* bold()   { return g_enabled ? "\x1b[1m"  : ""; }
inline const char* red()    { return g_enabled ? "\x1b[31m" : ""; }
inline const char* green()  { return g_enabled ? "\x1b[32m" : ""; }
inline const char* yellow() { return g_enabled ? "\x1b[33m" : ""; }

inline void auto_enable() {
    g_enabled = ::isatty(STDOUT_FILENO) == 1;
}

/**
 * Underlined section title:
 *
 *  CHECKING HOST(S) AVAILABILITY
 *  -----------------------------
 */
inline void section(std::ostream& out, const std::string& title) {
    out << "\n " << bold() << title << reset() << "\n "
        << std::string(title.size(), '-') << "\n\n";
}

} // namespace term
