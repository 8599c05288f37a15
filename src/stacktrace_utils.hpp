#pragma once

// Internal helper for stacktrace formatting.
// This header is NOT installed; it is only used by the library's .cpp files.

#include "bindery/element_source.hpp"

#include <any>
#include <sstream>
#include <string>

#include <boost/stacktrace.hpp>

namespace bindery::internal {

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty.
inline std::string format_stacktrace(const std::any& st) {
    const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st);
    if (!trace || trace->size() == 0) return {};
    std::ostringstream oss;
    oss << *trace;
    return oss.str();
}

/// Registration trace of one element source:
///   "Registration stacktrace for file.cpp:12:\n  0# ...\n"
/// or an empty string if none was captured.
inline std::string format_registration_trace(const element_source& source) {
    std::string trace = format_stacktrace(source.stacktrace);
    if (trace.empty()) return {};
    return "Registration stacktrace for " + source.to_string() + ":\n" + trace;
}

} // namespace bindery::internal
