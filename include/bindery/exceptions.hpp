#pragma once

#include "export.hpp"
#include "element_source.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bindery {

// ---------------------------------------------------------------
// error_id: stable classification of every reported problem
// ---------------------------------------------------------------

enum class error_id {
    binding_already_set,
    jit_binding_already_set,
    child_binding_already_set,
    missing_implementation,
    missing_constructor,
    jit_disabled,
    circular_dependency,
    recursive_binding,
    scope_not_found,
    duplicate_scopes,
    user_reported,
    module_exception,
    binding_to_null,
    bad_exposure,
    implementation_already_set,
    mismatched_key_type,
    annotation_already_specified,
    scope_already_set,
    missing_constant_annotation,
    conversion_error,
    converter_returned_null,
    ambiguous_conversion,
    null_injected,
    error_injecting_constructor,
    error_in_custom_provider,
    duplicate_element,
    null_element,
    duplicate_map_key,
    null_value_in_map,
    out_of_scope,
    circular_proxies_disabled
};

BINDERY_EXPORT std::string_view to_string(error_id id) noexcept;

// ---------------------------------------------------------------
// message: one accumulated error
// ---------------------------------------------------------------

class BINDERY_EXPORT message {
public:
    message(error_id id, std::string text,
            std::vector<element_source> sources = {},
            std::exception_ptr cause = nullptr);

    /// Text rendered on first read, once, from any thread.
    message(error_id id, std::function<std::string()> render,
            std::vector<element_source> sources = {});

    error_id id() const noexcept { return id_; }
    const std::string& text() const;
    bool is_rendered() const noexcept;

    const std::vector<element_source>& sources() const noexcept { return sources_; }

    /// Provision chain, innermost first ("while locating Foo", ...).
    const std::vector<std::string>& chain() const noexcept { return chain_; }

    std::exception_ptr cause() const noexcept { return cause_; }

    message with_chain(std::vector<std::string> chain) const;
    message with_source(element_source source) const;

    /// Same id, same text, same sources.
    bool operator==(const message& other) const;

private:
    struct text_state;

    error_id id_;
    std::shared_ptr<text_state> text_;
    std::vector<element_source> sources_;
    std::vector<std::string> chain_;
    std::exception_ptr cause_;
};

/// Format a numbered message list:
///   "<heading>:\n\n1) text\n  at source\n\n1 error"
BINDERY_EXPORT std::string format_messages(std::string_view heading,
                                           const std::vector<message>& messages);

// ---------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------

class BINDERY_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    virtual std::string full_diagnostic() const;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
};

/// Base of the exceptions that carry a list of messages.  what() is
/// formatted on first use.
class BINDERY_EXPORT aggregate_error : public di_error {
public:
    const std::vector<message>& messages() const noexcept { return messages_; }

    const char* what() const noexcept override;

    /// what() plus the registration stacktraces of every message source.
    std::string full_diagnostic() const override;

protected:
    aggregate_error(std::string heading, std::vector<message> messages,
                    std::source_location loc);

private:
    struct what_cache;

    std::string heading_;
    std::vector<message> messages_;
    std::shared_ptr<what_cache> cache_;
};

/// Injector construction failed; lists every problem found.
class BINDERY_EXPORT creation_error : public aggregate_error {
public:
    explicit creation_error(std::vector<message> messages,
                            std::source_location loc = std::source_location::current());
};

/// A post-construction lookup could not be satisfied.
class BINDERY_EXPORT configuration_error : public aggregate_error {
public:
    explicit configuration_error(std::vector<message> messages,
                                 std::source_location loc = std::source_location::current());
};

/// Provisioning failed: a constructor or provider threw, a null reached
/// a non-nullable dependency, or an aggregate rejected its contributions.
class BINDERY_EXPORT provision_error : public aggregate_error {
public:
    explicit provision_error(std::vector<message> messages,
                             std::source_location loc = std::source_location::current());

    /// First underlying exception, if any.
    std::exception_ptr cause() const noexcept;
};

/// Thrown by scopes used outside their lifetime.
class BINDERY_EXPORT out_of_scope_error : public di_error {
public:
    explicit out_of_scope_error(const std::string& message,
                                std::source_location loc = std::source_location::current());
};

namespace detail {
/// Throw a provision_error for `m`, attaching the current provision chain.
[[noreturn]] BINDERY_EXPORT void raise_provision_error(message m);
} // namespace detail

} // namespace bindery
