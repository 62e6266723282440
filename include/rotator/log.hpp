#pragma once
// Log: stderr diagnostics tagged by component
//
// Lines look like "[component] message". Debug lines carry a wall-clock
// timestamp and only print in verbose mode.

#include <cstdarg>

namespace rotator {

void set_verbose(bool on);
bool verbose();

// printf-style, only emitted when verbose() is true
void log_debug(const char* component, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

// Always emitted
void log_info(const char* component, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

// Structural invariant broken: log and abort
[[noreturn]] void fatal(const char* component, const char* msg);

} // namespace rotator
