#pragma once

#include "export.hpp"
#include "dependency.hpp"
#include "key.hpp"
#include "type_traits.hpp"

#include <charconv>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <typeindex>
#include <vector>

namespace bindery {

// ---------------------------------------------------------------
// introspector: the injector's only source of type metadata
// ---------------------------------------------------------------

class BINDERY_EXPORT introspector {
public:
    virtual ~introspector() = default;

    /// Metadata for the type, or nullopt if nothing is known about it.
    virtual std::optional<type_description> introspect(const type_handle& type) const = 0;
};

/// Default introspector: reads the nested declarations of a class
/// (`inject`, `inject_constructors`, `inject_members`, `implemented_by`,
/// `scope_annotation`) captured when the type's key was first formed.
class BINDERY_EXPORT type_introspector : public introspector {
public:
    std::optional<type_description> introspect(const type_handle& type) const override;
};

// ---------------------------------------------------------------
// Built-in string conversions
// ---------------------------------------------------------------

namespace detail {

template <typename T>
bool convert_builtin(const std::string& text, instance_ptr& out, std::string& reason) {
    if constexpr (std::is_same_v<T, bool>) {
        std::string lower;
        for (char c : text) lower += static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
        if (lower == "true") { out = std::make_shared<bool>(true); return true; }
        if (lower == "false") { out = std::make_shared<bool>(false); return true; }
        reason = "expected true or false";
        return false;
    } else if constexpr (std::is_same_v<T, char>) {
        if (text.size() != 1) {
            reason = "expected exactly one character";
            return false;
        }
        out = std::make_shared<char>(text[0]);
        return true;
    } else {
        T value{};
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            reason = "value out of range";
            return false;
        }
        if (ec != std::errc{} || ptr != last || text.empty()) {
            reason = "for input string: \"" + text + "\"";
            return false;
        }
        out = std::make_shared<T>(value);
        return true;
    }
}

template <typename T>
concept has_inject = requires { typename T::inject; };

template <typename T>
concept has_inject_constructors = requires { typename T::inject_constructors; };

template <typename T>
concept has_inject_members = requires { typename T::inject_members; };

template <typename T>
concept has_implemented_by = requires { typename T::implemented_by; };

template <typename T>
concept has_scope_annotation = requires { typename T::scope_annotation; };

/// Value types that are only ever bound, never synthesized.
template <typename T>
struct bound_only : std::bool_constant<requires { typename T::bound_only; }> {};

template <>
struct bound_only<std::string> : std::true_type {};

template <typename T>
struct bound_only<std::optional<T>> : std::true_type {};

template <typename T, typename A>
struct bound_only<std::vector<T, A>> : std::true_type {};

template <typename T, typename List>
struct constructor_list;

template <typename T, typename... Injects>
struct constructor_list<T, constructors<Injects...>> {
    static std::vector<constructor_description> describe() {
        return {Injects::template describe<T>()...};
    }
};

} // namespace detail

/// Fill the introspection record for T.  Referenced from type_handle_for<T>().
template <typename T>
bool describe_type(type_description& out) {
    out.type = std::type_index(typeid(T));

    if constexpr (std::is_same_v<T, std::string>) {
        out.is_generic = true;
    } else if constexpr (std::is_arithmetic_v<T>) {
        out.is_generic = true;
        out.from_string = &detail::convert_builtin<T>;
    }

    if constexpr (std::is_class_v<T>) {
        if constexpr (detail::has_implemented_by<T>) {
            using impl_type = typename T::implemented_by;
            // Subclasses inherit the alias from their interface.
            if constexpr (!std::is_same_v<impl_type, T> && std::is_base_of_v<T, impl_type>) {
                out.implemented_by = key::get<impl_type>();
                out.implemented_by_upcast = &detail::upcast<T, impl_type>;
            }
        }
        if constexpr (detail::has_scope_annotation<T>) {
            out.scope_annotation = std::type_index(typeid(typename T::scope_annotation));
        }
        if constexpr (detail::has_inject_members<T>) {
            out.members = T::inject_members::template describe<T>();
        }

        if constexpr (std::is_abstract_v<T> || detail::bound_only<T>::value) {
            out.is_abstract = true;
        } else if constexpr (detail::has_inject_constructors<T>) {
            out.has_designated = true;
            out.constructors =
                detail::constructor_list<T, typename T::inject_constructors>::describe();
        } else if constexpr (detail::has_inject<T>) {
            out.has_designated = true;
            out.constructors.push_back(T::inject::template describe<T>());
        } else if constexpr (std::is_default_constructible_v<T>) {
            out.constructors.push_back(bindery::inject<>::template describe<T>());
        }
    } else {
        out.is_abstract = true;
    }
    return true;
}

} // namespace bindery
