#pragma once
// Log: component-tagged diagnostics on stderr
//
// Every line is "[HH:MM:SS.mmm][component] message". debug() lines are only
// emitted in verbose mode (--debug / --verbose). Writes are serialized so
// lines from concurrent connection workers never interleave.

#include <string>

namespace conduit::log {

void set_verbose(bool on);
bool verbose();

void debug(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void info(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void warn(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));
void error(const char* component, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

// Append stdout/stderr to a log file. Returns false if it cannot be opened.
bool redirect_to_file(const std::string& path);

} // namespace conduit::log
