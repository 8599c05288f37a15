#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "key.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace bindery {

namespace internal {
/// "1st", "2nd", "3rd", "4th", ...
BINDERY_EXPORT std::string ordinal(int n);

/// "the 2nd parameter of <owner>" for a zero-based index.
BINDERY_EXPORT std::string parameter_point(int index, const std::string& owner);
} // namespace internal

// ---------------------------------------------------------------
// dependency: one edge of the object graph
// ---------------------------------------------------------------

struct BINDERY_EXPORT dependency {
    key target;
    bool nullable = false;
    bool optional = false;
    bool is_provider = false;
    int parameter_index = -1;

    /// Human-readable consuming injection point, e.g.
    /// "the 1st parameter of Foo's constructor".
    std::string injection_point;

    std::string to_string() const;

    bool operator==(const dependency& other) const {
        return target == other.target && nullable == other.nullable
            && optional == other.optional && is_provider == other.is_provider
            && parameter_index == other.parameter_index;
    }
};

/// One resolved argument handed to a constructor, setter or provider
/// method.  Direct dependencies fill `value`, provider dependencies fill
/// `lazy`.  `absent` marks an optional dependency nothing could satisfy.
struct argument {
    instance_ptr value;
    std::shared_ptr<const raw_provider> lazy;
    bool absent = false;
};

using arguments = std::vector<argument>;

// ---------------------------------------------------------------
// Introspection records
// ---------------------------------------------------------------

struct constructor_description {
    /// Identity of the constructor: the inject<...> list it was declared with.
    std::type_index signature = std::type_index(typeid(void));
    std::vector<dependency> dependencies;
    std::function<instance_ptr(const arguments&)> construct;
};

struct member_description {
    dependency target;
    std::function<void(void* object, const argument& value)> apply;
};

using upcast_fn = instance_ptr (*)(const instance_ptr&);
using string_conversion_fn = bool (*)(const std::string& text, instance_ptr& out,
                                      std::string& reason);

/// Everything the injector knows about a type.
struct type_description {
    std::type_index type = std::type_index(typeid(void));

    /// Abstract or non-class: cannot be constructed.
    bool is_abstract = false;

    /// Declares its constructor(s) explicitly instead of relying on the
    /// default constructor.
    bool has_designated = false;

    std::vector<constructor_description> constructors;
    std::vector<member_description> members;

    /// `using implemented_by = Impl;`
    std::optional<key> implemented_by;
    upcast_fn implemented_by_upcast = nullptr;

    /// `using scope_annotation = A;`
    std::optional<std::type_index> scope_annotation;

    /// Built-in conversion from a string constant, if the type has one.
    string_conversion_fn from_string = nullptr;

    /// String and arithmetic types: a missing binding usually means a
    /// missing qualifier.
    bool is_generic = false;
};

} // namespace bindery
