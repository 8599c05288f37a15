#pragma once

#include "export.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <typeindex>
#include <type_traits>

namespace bindery {

struct type_description;

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
BINDERY_EXPORT std::string demangle(std::type_index type);

BINDERY_EXPORT std::size_t hash_combine(std::size_t seed, std::size_t value) noexcept;
} // namespace internal

// ---------------------------------------------------------------
// value_ops: typed equality and rendering for erased values
// ---------------------------------------------------------------

template <typename T>
concept streamable = requires(std::ostream& os, const T& v) { os << v; };

/// Typed operations captured when a value is erased behind `void*`.
/// Values without operator== compare by identity.
struct value_ops {
    bool (*equals)(const void* a, const void* b);
    std::string (*describe)(const void* v);
};

template <typename T>
const value_ops& value_ops_for() noexcept {
    static const value_ops ops{
        [](const void* a, const void* b) -> bool {
            if (a == b) return true;
            if (!a || !b) return false;
            if constexpr (std::equality_comparable<T>) {
                return *static_cast<const T*>(a) == *static_cast<const T*>(b);
            } else {
                return false;
            }
        },
        [](const void* v) -> std::string {
            if (!v) return "null";
            if constexpr (streamable<T>) {
                std::ostringstream os;
                os << *static_cast<const T*>(v);
                return os.str();
            } else {
                std::ostringstream os;
                os << internal::demangle(typeid(T)) << '@' << v;
                return os.str();
            }
        }};
    return ops;
}

// ---------------------------------------------------------------
// type_handle: static per-type metadata referenced by keys
// ---------------------------------------------------------------

/// One instance per type, created on first use of key::get<T>().
/// `describe` fills the introspection record for the type; it is the
/// only path by which the injector learns about constructors.
struct type_handle {
    std::type_index type;
    bool (*describe)(type_description& out);

    std::string name() const { return internal::demangle(type); }
};

/// Defined in introspector.hpp.
template <typename T>
bool describe_type(type_description& out);

template <typename T>
const type_handle& type_handle_for() noexcept {
    static const type_handle handle{std::type_index(typeid(T)), &describe_type<T>};
    return handle;
}

// ---------------------------------------------------------------
// qualifier
// ---------------------------------------------------------------

/// Which multibinding aggregate an element qualifier belongs to.
enum class element_kind {
    multibinder,
    mapbinder,
    optional_default,
    optional_actual,
    permit_duplicates
};

BINDERY_EXPORT std::string_view to_string(element_kind kind) noexcept;

/// Identity of one contribution to a multibinding aggregate.  All
/// contributions of one logical collection share (set_name, kind,
/// key_type); unique_id separates the individual add_binding() calls.
struct element_info {
    std::string set_name;
    int unique_id = 0;
    element_kind kind = element_kind::multibinder;
    std::optional<std::type_index> key_type;

    /// Map key of a mapbinder contribution (typed as key_type).
    std::shared_ptr<const void> map_key;
    const value_ops* map_key_ops = nullptr;

    bool same_collection(const element_info& other) const noexcept {
        return set_name == other.set_name && kind == other.kind
            && key_type == other.key_type;
    }

    std::string describe_map_key() const {
        return map_key_ops ? map_key_ops->describe(map_key.get()) : std::string{};
    }
};

/// Binding qualifier: a marker type, a named value, or the internal
/// element qualifier of multibinding contributions.
class BINDERY_EXPORT qualifier {
public:
    enum class kind { marker, named, element };

    template <typename Q>
    static qualifier of() {
        return qualifier(kind::marker, std::type_index(typeid(Q)), {}, nullptr);
    }

    static qualifier named(std::string value);
    static qualifier element(element_info info);

    kind get_kind() const noexcept { return kind_; }
    std::type_index marker_type() const noexcept { return marker_; }
    const std::string& value() const noexcept { return value_; }

    /// Non-null only for element qualifiers.
    const element_info* element() const noexcept { return element_.get(); }

    std::size_t hash() const noexcept { return hash_; }
    std::string to_string() const;

    bool operator==(const qualifier& other) const noexcept;

private:
    qualifier(kind k, std::type_index marker, std::string value,
              std::shared_ptr<const element_info> element);

    kind kind_;
    std::type_index marker_;
    std::string value_;
    std::shared_ptr<const element_info> element_;
    std::size_t hash_ = 0;
};

/// Shorthand for qualifier::named.
inline qualifier named(std::string value) {
    return qualifier::named(std::move(value));
}

// ---------------------------------------------------------------
// key
// ---------------------------------------------------------------

/// Immutable (type, qualifier?) address of a binding.  The hash is
/// computed once at construction.
class BINDERY_EXPORT key {
public:
    template <typename T>
    static key get() {
        return key(&type_handle_for<std::remove_cvref_t<T>>(), std::nullopt);
    }

    template <typename T>
    static key get(qualifier q) {
        return key(&type_handle_for<std::remove_cvref_t<T>>(), std::move(q));
    }

    template <typename T, typename Q>
    static key annotated() {
        return get<T>(qualifier::of<Q>());
    }

    /// Same qualifier, different type.
    template <typename U>
    key of_type() const {
        return key(&type_handle_for<std::remove_cvref_t<U>>(), annotation_);
    }

    key with_annotation(std::optional<qualifier> q) const {
        return key(type_, std::move(q));
    }

    const type_handle& type() const noexcept { return *type_; }
    std::type_index type_index() const noexcept { return type_->type; }
    const std::optional<qualifier>& annotation() const noexcept { return annotation_; }
    bool has_annotation() const noexcept { return annotation_.has_value(); }

    /// Element info when this key addresses a multibinding contribution.
    const element_info* element() const noexcept {
        return annotation_ ? annotation_->element() : nullptr;
    }

    std::size_t hash() const noexcept { return hash_; }
    std::string to_string() const;

    bool operator==(const key& other) const noexcept;

private:
    key(const type_handle* type, std::optional<qualifier> q);

    const type_handle* type_;
    std::optional<qualifier> annotation_;
    std::size_t hash_;
};

struct key_hash {
    std::size_t operator()(const key& k) const noexcept { return k.hash(); }
};

BINDERY_EXPORT std::ostream& operator<<(std::ostream& os, const key& k);

} // namespace bindery

template <>
struct std::hash<bindery::key> {
    std::size_t operator()(const bindery::key& k) const noexcept { return k.hash(); }
};
