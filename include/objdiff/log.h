// log.h - Diagnostic output helpers for objdiff

#pragma once

#include <objdiff/objdiff_config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace objdiff {

namespace detail {

/// Report a field that was skipped during traversal. Always enabled.
inline void log_field_skipped(
    std::string_view component,
    std::string_view field,
    std::string_view path,
    std::string_view reason) noexcept
{
    std::cerr << "[" << component << "] Error accessing field \"" << field
              << "\" at '" << path << "'. Skipping. " << reason << "\n";
}

/// Report a recoverable irregularity. Always enabled.
inline void log_warning(std::string_view component, std::string_view message) noexcept
{
    std::cerr << "[" << component << "] Warning: " << message << "\n";
}

/// Trace a traversal decision; compiled out unless OBJDIFF_VERBOSE_LOG
inline void log_trace(
    std::string_view component,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OBJDIFF_VERBOSE_LOG
    std::cerr << "[" << component << "] " << message
              << " (" << loc.file_name() << ":" << loc.line() << ")\n";
#else
    (void)component;
    (void)message;
    (void)loc;
#endif
}

} // namespace detail

} // namespace objdiff
