#include "errors.hpp"

#include <algorithm>
#include <functional>
#include <string>
#include <utility>
#include <variant>

namespace bindery::internal {

namespace {

constexpr std::size_t max_matching_types_reported = 3;
constexpr std::size_t max_related_types_reported = 3;

std::string format_suggestion(const binding& b) {
    return b.get_key().to_string() + " bound at " + b.source().to_string();
}

std::string render_hints(const key& k, bool generic_type,
                         const std::vector<std::shared_ptr<const binding>>& candidates) {
    std::string out;

    std::vector<const binding*> same_type;
    for (const auto& b : candidates) {
        if (b->get_key().type_index() == k.type_index() && !(b->get_key() == k)
            && !b->get_key().element()) {
            same_type.push_back(b.get());
        }
    }

    std::vector<std::string> related;
    if (!same_type.empty()) {
        out += "\nDid you mean?";
        std::size_t shown = std::min(same_type.size(), max_matching_types_reported);
        for (std::size_t i = 0; i < shown; ++i) {
            out += "\n    * " + format_suggestion(*same_type[i]);
        }
        if (same_type.size() > max_matching_types_reported) {
            std::size_t remaining = same_type.size() - max_matching_types_reported;
            out += "\n    * " + std::to_string(remaining) + " more binding"
                   + (remaining == 1 ? "" : "s") + " with other annotations.";
        }
    } else {
        // Substring search over type names; catches wrapper types bound
        // in place of the wrapped one and vice versa.
        std::string want = k.type().name();
        for (const auto& b : candidates) {
            if (std::holds_alternative<untargetted_target>(b->target())) continue;
            if (b->get_key().element()) continue;
            std::string have = b->get_key().type().name();
            if (have.find(want) != std::string::npos || want.find(have) != std::string::npos) {
                related.push_back(format_suggestion(*b));
                if (related.size() > max_related_types_reported) break;
            }
        }
        if (!related.empty() && related.size() <= max_related_types_reported) {
            out += "\nDid you mean?";
            for (const auto& r : related) out += "\n    * " + r;
        }
    }

    if (same_type.empty() && related.empty() && !k.has_annotation() && generic_type) {
        out += "\nThe key seems very generic, did you forget an annotation?";
    }
    return out;
}

std::string describe_target(const binding& b) {
    std::string out = b.target_description();
    if (b.get_scoping().is_explicitly_scoped()) out += " in " + b.get_scoping().to_string();
    return out;
}

} // namespace

// ---------------------------------------------------------------
// Configuration-time messages
// ---------------------------------------------------------------

message binding_already_set(const binding& original, const binding& duplicate) {
    return message(error_id::binding_already_set,
                   "A binding to " + original.get_key().to_string()
                   + " was already configured at " + original.source().to_string() + "."
                   + "\n    existing: " + describe_target(original)
                   + "\n    conflicting: " + describe_target(duplicate),
                   {duplicate.source()});
}

message jit_binding_already_set(const key& k, const element_source& source) {
    return message(error_id::jit_binding_already_set,
                   "A just-in-time binding to " + k.to_string()
                   + " was already configured on a parent injector.",
                   {source});
}

message child_binding_already_set(const key& k, const std::vector<element_source>& child_sources,
                                  const element_source& source) {
    std::string all;
    for (const auto& s : child_sources) all += "\n    bound at " + s.to_string();
    return message(error_id::child_binding_already_set,
                   "Unable to create binding for " + k.to_string()
                   + ". It was already configured on one or more child injectors or private modules"
                   + all + "\n  If it was in a PrivateModule, did you forget to expose the binding?",
                   {source});
}

message missing_implementation(const key& k, bool generic_type,
                               std::vector<std::shared_ptr<const binding>> candidates,
                               const element_source& source) {
    return message(error_id::missing_implementation,
                   std::function<std::string()>(
                       [k, generic_type, candidates = std::move(candidates)] {
                           return "No implementation for " + k.to_string() + " was bound."
                                  + render_hints(k, generic_type, candidates);
                       }),
                   {source});
}

message missing_constructor(const key& k, std::size_t designated, const element_source& source) {
    const std::string rules =
        "Classes must have either one (and only one) constructor designated with "
        "inject<...> or a default constructor.";
    std::string text = designated > 1
        ? k.type().name() + " has more than one constructor designated with inject<...>. " + rules
        : "Could not find a suitable constructor in " + k.type().name() + ". " + rules;
    return message(error_id::missing_constructor, std::move(text), {source});
}

message jit_disabled(const key& k, const element_source& source) {
    return message(error_id::jit_disabled,
                   "Explicit bindings are required and " + k.to_string()
                   + " is not explicitly bound.",
                   {source});
}

message circular_dependency(const std::vector<key>& cycle, const element_source& source) {
    std::string path;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) path += " -> ";
        path += cycle[i].to_string();
    }
    return message(error_id::circular_dependency,
                   "Circular dependency detected: " + path + ".", {source});
}

message recursive_binding(const key& k, const element_source& source) {
    return message(error_id::recursive_binding,
                   "Binding points to itself. Key: " + k.to_string(), {source});
}

message scope_not_found(std::type_index annotation, const element_source& source) {
    return message(error_id::scope_not_found,
                   "No scope is bound to " + demangle(annotation) + ".", {source});
}

message duplicate_scopes(std::type_index annotation, const std::string& existing,
                         const element_source& existing_source, const std::string& duplicate,
                         const element_source& source) {
    return message(error_id::duplicate_scopes,
                   "Scope " + existing + " is already bound to " + demangle(annotation)
                   + " at " + existing_source.to_string() + ".\n Cannot bind " + duplicate + ".",
                   {source});
}

message bad_exposure(const key& k, const element_source& source) {
    return message(error_id::bad_exposure,
                   "Could not expose() " + k.to_string() + ", it must be explicitly bound.",
                   {source});
}

message module_exception(const std::string& module_name, const std::exception& e,
                         std::exception_ptr cause) {
    element_source source;
    source.declaring = module_name;
    return message(error_id::module_exception,
                   std::string("An exception was caught and reported. Message: ") + e.what(),
                   {std::move(source)}, std::move(cause));
}

message conversion_error(const std::string& value, const element_source& constant_source,
                         const key& target, const std::string& reason, std::exception_ptr cause) {
    return message(error_id::conversion_error,
                   "Error converting '" + value + "' (bound at " + constant_source.to_string()
                   + ") to " + target.type().name() + ".\n Reason: " + reason,
                   {constant_source}, std::move(cause));
}

message converter_returned_null(const std::string& value, const element_source& constant_source,
                                const key& target) {
    return message(error_id::converter_returned_null,
                   "Received null converting '" + value + "' (bound at "
                   + constant_source.to_string() + ") to " + target.type().name(),
                   {constant_source});
}

message ambiguous_conversion(const std::string& value, const element_source& constant_source,
                             const key& target, const std::vector<element_source>& converters) {
    std::string text = "Multiple converters can convert '" + value + "' (bound at "
                       + constant_source.to_string() + ") to " + target.type().name() + ":";
    for (std::size_t i = 0; i < converters.size(); ++i) {
        text += "\n converter at " + converters[i].to_string()
                + (i + 1 < converters.size() ? " and" : ".");
    }
    text += "\n Please adjust your type converter configuration to avoid overlapping matches.";
    return message(error_id::ambiguous_conversion, std::move(text), {constant_source});
}

// ---------------------------------------------------------------
// Provision-time messages
// ---------------------------------------------------------------

message null_injected(const element_source& binding_source, const dependency& dep) {
    return message(error_id::null_injected,
                   "null returned by binding at " + binding_source.to_string() + "\n but "
                   + dep.injection_point + " is not nullable",
                   {binding_source});
}

message error_injecting_constructor(const std::exception& e, std::exception_ptr cause,
                                    const element_source& source) {
    return message(error_id::error_injecting_constructor,
                   std::string("Error injecting constructor, ") + e.what(), {source},
                   std::move(cause));
}

message error_injecting_member(const std::exception& e, std::exception_ptr cause,
                               const element_source& source) {
    return message(error_id::error_injecting_constructor,
                   std::string("Error injecting member, ") + e.what(), {source},
                   std::move(cause));
}

message error_in_custom_provider(const std::exception& e, std::exception_ptr cause,
                                 const element_source& source) {
    return message(error_id::error_in_custom_provider,
                   std::string("Error in custom provider, ") + e.what(), {source},
                   std::move(cause));
}

message circular_proxies_disabled(const key& k, const element_source& source) {
    return message(error_id::circular_proxies_disabled,
                   "Found a circular dependency involving " + k.to_string()
                   + ", and circular dependencies are disabled.",
                   {source});
}

message out_of_scope(const out_of_scope_error& e, const element_source& source) {
    return message(error_id::out_of_scope, e.what(), {source},
                   std::make_exception_ptr(e));
}

} // namespace bindery::internal
