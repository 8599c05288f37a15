#pragma once

// Internal error accumulator and message factories.

#include "bindery/binding.hpp"
#include "bindery/dependency.hpp"
#include "bindery/element_source.hpp"
#include "bindery/exceptions.hpp"
#include "bindery/key.hpp"

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <typeindex>
#include <vector>

namespace bindery::internal {

/// Messages collected while an injector is built or a lookup is linked.
class error_list {
public:
    void add(message m) { messages_.push_back(std::move(m)); }

    void merge(error_list&& other) {
        for (auto& m : other.messages_) messages_.push_back(std::move(m));
        other.messages_.clear();
    }

    std::size_t size() const noexcept { return messages_.size(); }
    bool empty() const noexcept { return messages_.empty(); }

    const std::vector<message>& messages() const noexcept { return messages_; }
    std::vector<message> take() { return std::move(messages_); }

private:
    std::vector<message> messages_;
};

// ---------------------------------------------------------------
// Configuration-time messages
// ---------------------------------------------------------------

message binding_already_set(const binding& original, const binding& duplicate);
message jit_binding_already_set(const key& k, const element_source& source);
message child_binding_already_set(const key& k, const std::vector<element_source>& child_sources,
                                  const element_source& source);

/// "No implementation for K was bound." with "Did you mean?" hints over
/// `candidates`.  The hints are rendered when the text is first read.
message missing_implementation(const key& k, bool generic_type,
                               std::vector<std::shared_ptr<const binding>> candidates,
                               const element_source& source);

message missing_constructor(const key& k, std::size_t designated, const element_source& source);
message jit_disabled(const key& k, const element_source& source);
message circular_dependency(const std::vector<key>& cycle, const element_source& source);
message recursive_binding(const key& k, const element_source& source);
message scope_not_found(std::type_index annotation, const element_source& source);
message duplicate_scopes(std::type_index annotation, const std::string& existing,
                         const element_source& existing_source, const std::string& duplicate,
                         const element_source& source);
message bad_exposure(const key& k, const element_source& source);
message module_exception(const std::string& module_name, const std::exception& e,
                         std::exception_ptr cause);

message conversion_error(const std::string& value, const element_source& constant_source,
                         const key& target, const std::string& reason, std::exception_ptr cause);
message converter_returned_null(const std::string& value, const element_source& constant_source,
                                const key& target);
message ambiguous_conversion(const std::string& value, const element_source& constant_source,
                             const key& target, const std::vector<element_source>& converters);

// ---------------------------------------------------------------
// Provision-time messages
// ---------------------------------------------------------------

message null_injected(const element_source& binding_source, const dependency& dep);
message error_injecting_constructor(const std::exception& e, std::exception_ptr cause,
                                    const element_source& source);
message error_injecting_member(const std::exception& e, std::exception_ptr cause,
                               const element_source& source);
message error_in_custom_provider(const std::exception& e, std::exception_ptr cause,
                                 const element_source& source);
message circular_proxies_disabled(const key& k, const element_source& source);
message out_of_scope(const out_of_scope_error& e, const element_source& source);

} // namespace bindery::internal
