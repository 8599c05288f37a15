#pragma once

#include "export.hpp"

#include <any>
#include <source_location>
#include <string>
#include <vector>

namespace bindery {

namespace internal {
/// Capture the current call stack into a std::any (empty if capture
/// is not requested).  Defined in stacktrace_capture.cpp.
BINDERY_EXPORT std::any capture_stacktrace();
} // namespace internal

/// Where an element was declared: the binder call site, the chain of
/// modules that were being configured, and optionally a registration
/// stacktrace.
struct BINDERY_EXPORT element_source {
    std::source_location location{};
    std::vector<std::string> module_stack;
    std::any stacktrace;

    /// Used instead of `location` for synthesized bindings (the type name).
    std::string declaring;

    bool has_location() const noexcept { return location.file_name()[0] != '\0'; }

    /// "file.cpp:42 (via modules: app_module -> db_module)"
    std::string to_string() const;
};

} // namespace bindery
