#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "dependency.hpp"
#include "element_source.hpp"
#include "key.hpp"
#include "scope.hpp"

#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

namespace bindery {

// ---------------------------------------------------------------
// provider_instance: caller-supplied provisioning logic
// ---------------------------------------------------------------

/// A provider bound with to_provider().  Declared dependencies are
/// resolved by the injector and handed to get() in order.
class BINDERY_EXPORT provider_instance {
public:
    virtual ~provider_instance() = default;

    virtual instance_ptr get(const arguments& args) const = 0;

    virtual std::vector<dependency> dependencies() const { return {}; }

    /// Extension equality; identity by default.
    virtual bool equals(const provider_instance& other) const { return this == &other; }

    virtual std::string to_string() const = 0;
};

// ---------------------------------------------------------------
// Binding targets (closed sum type)
// ---------------------------------------------------------------

/// `bind<Foo>()` alone: resolved like a synthesized binding.
struct untargetted_target {};

struct instance_target {
    instance_ptr value;
    const value_ops* ops = nullptr;
};

struct linked_key_target {
    key target;
    upcast_fn upcast = nullptr;
};

/// Delegates to a key whose instance is a provider object with get().
struct provider_key_target {
    key provider_key;
    instance_ptr (*invoke)(const instance_ptr& provider_object) = nullptr;
};

struct provider_instance_target {
    std::shared_ptr<const provider_instance> provider;
};

struct constructor_target {
    key implementation;
    constructor_description constructor;
    std::vector<member_description> members;

    /// Views the constructed implementation as the bound type; null when
    /// they are the same.
    upcast_fn upcast = nullptr;
};

/// Typed constant converted from a string constant with the same qualifier.
struct converted_constant_target {
    key source_key;
    std::string text;
    instance_ptr value;
};

/// Re-exports a binding of a private environment.
struct exposed_target {
    std::shared_ptr<const private_elements> environment;
};

using binding_target = std::variant<untargetted_target,
                                    instance_target,
                                    linked_key_target,
                                    provider_key_target,
                                    provider_instance_target,
                                    constructor_target,
                                    converted_constant_target,
                                    exposed_target>;

// ---------------------------------------------------------------
// Multibinding SPI
// ---------------------------------------------------------------

class BINDERY_EXPORT multibinder_binding {
public:
    virtual ~multibinder_binding() = default;

    /// Key of the set_of<T> view.
    virtual key set_key() const = 0;
    virtual std::type_index element_type() const = 0;

    /// Contributions in declaration order.  Empty until an injector has
    /// initialized the aggregate.
    virtual std::vector<std::shared_ptr<const binding>> elements() const = 0;
    virtual bool permits_duplicates() const = 0;
};

class BINDERY_EXPORT map_binder_binding {
public:
    virtual ~map_binder_binding() = default;

    /// Key of the map_of<K, V> view.
    virtual key map_key() const = 0;
    virtual std::type_index key_type() const = 0;
    virtual std::type_index value_type() const = 0;

    /// (rendered map key, value binding) in declaration order.
    virtual std::vector<std::pair<std::string, std::shared_ptr<const binding>>> entries() const = 0;
    virtual bool permits_duplicates() const = 0;
};

class BINDERY_EXPORT optional_binder_binding {
public:
    virtual ~optional_binder_binding() = default;

    /// Key of the optional_of<T> view.
    virtual key optional_key() const = 0;

    virtual std::shared_ptr<const binding> default_binding() const = 0;
    virtual std::shared_ptr<const binding> actual_binding() const = 0;
};

// ---------------------------------------------------------------
// Visitors
// ---------------------------------------------------------------

/// Visits the target of a binding.  Every overload falls back to
/// visit_other(), which returns a default-constructed R.
template <typename R>
class binding_target_visitor {
public:
    virtual ~binding_target_visitor() = default;

    virtual R visit(const binding& b, const untargetted_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const instance_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const linked_key_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const provider_key_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const provider_instance_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const constructor_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const converted_constant_target&) { return visit_other(b); }
    virtual R visit(const binding& b, const exposed_target&) { return visit_other(b); }

    virtual R visit_other(const binding&) { return R(); }
};

/// Additionally receives the aggregate views of multibinders, map
/// binders and optional binders.
template <typename R>
class multibindings_target_visitor : public binding_target_visitor<R> {
public:
    using binding_target_visitor<R>::visit;

    virtual R visit(const binding& b, const multibinder_binding&) { return this->visit_other(b); }
    virtual R visit(const binding& b, const map_binder_binding&) { return this->visit_other(b); }
    virtual R visit(const binding& b, const optional_binder_binding&) { return this->visit_other(b); }
};

// ---------------------------------------------------------------
// binding
// ---------------------------------------------------------------

/// Association of a key with a way of producing its value.
class BINDERY_EXPORT binding {
public:
    binding(bindery::key k, element_source source,
            binding_target target = untargetted_target{},
            bindery::scoping scoping = {});

    const bindery::key& get_key() const noexcept { return key_; }
    const element_source& source() const noexcept { return source_; }
    const bindery::scoping& get_scoping() const noexcept { return scoping_; }
    const binding_target& target() const noexcept { return target_; }

    /// Dependencies known from the binding itself.  Untargetted and
    /// exposed bindings report none.
    std::vector<dependency> dependencies() const;

    /// Same scoping and same target, regardless of key and source.
    bool same_target(const binding& other) const;

    /// Structural equality; the source is ignored.
    bool operator==(const binding& other) const {
        return key_ == other.key_ && same_target(other);
    }

    std::string to_string() const;

    /// The target alone, e.g. "linked to Impl".
    std::string target_description() const;

    template <typename R>
    R accept_target_visitor(binding_target_visitor<R>& visitor) const;

private:
    template <typename T>
    friend class binding_builder;
    friend class constant_builder;
    friend class binder;

    bindery::key key_;
    element_source source_;
    binding_target target_;
    bindery::scoping scoping_;
};

template <typename R>
R binding::accept_target_visitor(binding_target_visitor<R>& visitor) const {
    if (const auto* pi = std::get_if<provider_instance_target>(&target_)) {
        if (auto* mv = dynamic_cast<multibindings_target_visitor<R>*>(&visitor)) {
            const provider_instance* p = pi->provider.get();
            if (const auto* set = dynamic_cast<const multibinder_binding*>(p)) {
                return mv->visit(*this, *set);
            }
            if (const auto* map = dynamic_cast<const map_binder_binding*>(p)) {
                return mv->visit(*this, *map);
            }
            if (const auto* opt = dynamic_cast<const optional_binder_binding*>(p)) {
                return mv->visit(*this, *opt);
            }
        }
    }
    return std::visit([&](const auto& t) -> R { return visitor.visit(*this, t); }, target_);
}

} // namespace bindery
