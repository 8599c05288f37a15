#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "binder.hpp"
#include "binding.hpp"
#include "exceptions.hpp"
#include "introspector.hpp"
#include "key.hpp"
#include "provider.hpp"
#include "stage.hpp"

#include <memory>
#include <source_location>
#include <typeindex>
#include <vector>

namespace bindery {

namespace internal {
struct injector_state;
} // namespace internal

// ---------------------------------------------------------------
// Injector configuration
// ---------------------------------------------------------------

struct injector_options {
    /// Decides which singletons are created eagerly.
    bindery::stage stage = bindery::stage::development;

    /// Refuse just-in-time bindings; every key must be bound explicitly.
    bool require_explicit_bindings = false;

    /// Capture a Boost.Stacktrace at every binder call.  Shown by
    /// di_error::full_diagnostic().
    bool capture_stacktraces = false;

    /// Source of type metadata; type_introspector when null.
    std::shared_ptr<const bindery::introspector> introspector;
};

/// Evaluate the modules and build a root injector.  Throws
/// creation_error listing every problem found.
BINDERY_EXPORT std::shared_ptr<injector> create_injector(
    const module_list& modules, injector_options options = {},
    std::source_location loc = std::source_location::current());

// ---------------------------------------------------------------
// injector
// ---------------------------------------------------------------

class BINDERY_EXPORT injector : public std::enable_shared_from_this<injector> {
public:
    ~injector();

    injector(const injector&) = delete;
    injector& operator=(const injector&) = delete;

    // ---------------------------------------------------------------
    // Instances
    // ---------------------------------------------------------------

    /// Provision T.  Throws configuration_error if T cannot be bound and
    /// provision_error if provisioning fails.
    template <typename T>
    std::shared_ptr<T> get_instance() {
        return std::static_pointer_cast<T>(get_instance(key::get<T>()));
    }

    template <typename T>
    std::shared_ptr<T> get_instance(qualifier q) {
        return std::static_pointer_cast<T>(get_instance(key::get<T>(std::move(q))));
    }

    instance_ptr get_instance(const key& k);

    /// Lazy handle.  Handles for the same key compare equal.
    template <typename T>
    provider<T> get_provider() {
        return provider<T>(get_raw_provider(key::get<T>()));
    }

    template <typename T>
    provider<T> get_provider(qualifier q) {
        return provider<T>(get_raw_provider(key::get<T>(std::move(q))));
    }

    std::shared_ptr<const raw_provider> get_raw_provider(const key& k);

    /// Inject the members declared by `T::inject_members` into an
    /// existing object.
    template <typename T>
    void inject_members(T& object) {
        inject_members(key::get<T>(), &object);
    }

    void inject_members(const key& type, void* object);

    // ---------------------------------------------------------------
    // Bindings
    // ---------------------------------------------------------------

    /// Binding for k, synthesized just-in-time when needed.
    std::shared_ptr<const binding> get_binding(const key& k);

    template <typename T>
    std::shared_ptr<const binding> get_binding() {
        return get_binding(key::get<T>());
    }

    /// Explicit or already synthesized binding for k in this injector or
    /// an ancestor; null otherwise.
    std::shared_ptr<const binding> get_existing_binding(const key& k) const;

    /// Explicit bindings of this injector, in declaration order.
    std::vector<std::shared_ptr<const binding>> get_bindings() const;

    /// Explicit and just-in-time bindings of this injector.
    std::vector<std::shared_ptr<const binding>> get_all_bindings() const;

    /// Explicit bindings of this injector and its ancestors whose key
    /// type is `type`.
    std::vector<std::shared_ptr<const binding>> find_bindings_by_type(std::type_index type) const;

    template <typename T>
    std::vector<std::shared_ptr<const binding>> find_bindings_by_type() const {
        return find_bindings_by_type(std::type_index(typeid(T)));
    }

    // ---------------------------------------------------------------
    // Hierarchy
    // ---------------------------------------------------------------

    std::shared_ptr<injector> parent() const noexcept { return parent_; }

    /// Build a child injector.  The child sees this injector's bindings
    /// and keeps its own just-in-time and singleton caches.
    std::shared_ptr<injector> create_child_injector(
        const module_list& modules,
        std::source_location loc = std::source_location::current());

    const injector_options& options() const noexcept;

private:
    friend std::shared_ptr<injector> create_injector(const module_list&, injector_options,
                                                     std::source_location);

    injector(std::shared_ptr<internal::injector_state> state, std::shared_ptr<injector> parent);

    static std::shared_ptr<injector> build(const module_list& modules,
                                           std::shared_ptr<injector> parent,
                                           injector_options options,
                                           std::source_location loc);

    std::shared_ptr<internal::injector_state> state_;
    std::shared_ptr<injector> parent_;
};

} // namespace bindery
