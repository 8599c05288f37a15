#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "binding.hpp"
#include "element.hpp"
#include "exceptions.hpp"
#include "introspector.hpp"
#include "key.hpp"
#include "provider.hpp"
#include "scope.hpp"
#include "type_traits.hpp"

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace bindery {

namespace internal {
struct recording;
} // namespace internal

// ---------------------------------------------------------------
// Modules
// ---------------------------------------------------------------

class BINDERY_EXPORT module {
public:
    virtual ~module() = default;

    virtual void configure(binder& b) = 0;

    /// Name shown in element sources ("via modules: ...").
    virtual std::string name() const;
};

/// Module whose bindings are private unless exposed.
class BINDERY_EXPORT private_module : public module {
public:
    void configure(binder& b) final;

    virtual void configure(private_binder& b) = 0;
};

namespace detail {

template <typename F>
class function_module : public module {
public:
    function_module(F fn, std::string name)
        : fn_(std::move(fn)), name_(std::move(name)) {}

    void configure(binder& b) override { fn_(b); }
    std::string name() const override { return name_; }

private:
    F fn_;
    std::string name_;
};

// ---------------------------------------------------------------
// Provider adapters for to_provider()
// ---------------------------------------------------------------

template <typename T, typename F>
class function_provider : public provider_instance {
public:
    explicit function_provider(F fn) : fn_(std::move(fn)) {}

    instance_ptr get(const arguments&) const override {
        std::shared_ptr<T> value = fn_();
        return value;
    }

    std::string to_string() const override {
        return "provider function of " + internal::demangle(typeid(T));
    }

private:
    mutable F fn_;
};

/// Provider with injected parameters.
template <typename T, typename F, typename... Deps>
class method_provider : public provider_instance {
public:
    method_provider(F fn, std::string owner)
        : fn_(std::move(fn))
        , dependencies_(inject<Deps...>::dependencies(owner))
        , owner_(std::move(owner)) {}

    instance_ptr get(const arguments& args) const override {
        std::shared_ptr<T> value = inject<Deps...>::invoke(fn_, args);
        return value;
    }

    std::vector<dependency> dependencies() const override { return dependencies_; }

    std::string to_string() const override { return owner_; }

private:
    mutable F fn_;
    std::vector<dependency> dependencies_;
    std::string owner_;
};

/// Wraps an existing provider<T>; equal when the wrapped handles are.
template <typename T>
class handle_provider : public provider_instance {
public:
    explicit handle_provider(provider<T> p) : provider_(std::move(p)) {}

    instance_ptr get(const arguments&) const override {
        std::shared_ptr<T> value = provider_.get();
        return value;
    }

    bool equals(const provider_instance& other) const override {
        const auto* o = dynamic_cast<const handle_provider*>(&other);
        return o && o->provider_ == provider_;
    }

    std::string to_string() const override {
        return "provider handle of " + internal::demangle(typeid(T));
    }

private:
    provider<T> provider_;
};

template <typename T, typename P>
instance_ptr invoke_provider_object(const instance_ptr& object) {
    std::shared_ptr<T> value = std::static_pointer_cast<P>(object)->get();
    return value;
}

} // namespace detail

/// Wrap a callable `void(binder&)` as a module.
template <typename F>
module_ptr make_module(F fn, std::string name = "module") {
    return std::make_shared<detail::function_module<F>>(std::move(fn), std::move(name));
}

// ---------------------------------------------------------------
// binder
// ---------------------------------------------------------------

class constant_builder;

/// Collects the elements of the modules being configured.
class BINDERY_EXPORT binder {
public:
    virtual ~binder();

    binder(const binder&) = delete;
    binder& operator=(const binder&) = delete;

    /// Start a binding for T.  Without a target it is untargetted.
    template <typename T>
    binding_builder<T> bind(std::source_location loc = std::source_location::current()) {
        return binding_builder<T>(*this, record_binding(key::get<T>(), loc));
    }

    /// Start a binding for the qualified key (T, q).
    template <typename T>
    binding_builder<T> bind(qualifier q,
                            std::source_location loc = std::source_location::current()) {
        return binding_builder<T>(*this, record_binding(key::get<T>(std::move(q)), loc), true);
    }

    constant_builder bind_constant(std::source_location loc = std::source_location::current());

    /// Evaluate a module.  A module object installed twice is evaluated once.
    void install(const module_ptr& m);

    void add_error(std::string text,
                   std::source_location loc = std::source_location::current());
    void add_error(message m);

    template <typename A>
    void bind_scope(std::shared_ptr<scope> s,
                    std::source_location loc = std::source_location::current()) {
        bind_scope(std::type_index(typeid(A)), std::move(s), loc);
    }

    void bind_scope(std::type_index annotation, std::shared_ptr<scope> s,
                    std::source_location loc = std::source_location::current());

    void require_binding(const key& k,
                         std::source_location loc = std::source_location::current());

    template <typename T>
    void require_binding(std::source_location loc = std::source_location::current()) {
        require_binding(key::get<T>(), loc);
    }

    /// Register a string converter for T.  The converter returns either
    /// a T or a std::shared_ptr<T> (null means "received null").
    template <typename T, typename F>
    void convert_to(F converter, std::source_location loc = std::source_location::current()) {
        using result_type = std::invoke_result_t<F&, const std::string&>;
        std::function<instance_ptr(const std::string&)> convert;
        if constexpr (std::is_same_v<result_type, std::shared_ptr<T>>) {
            convert = [fn = std::move(converter)](const std::string& s) mutable -> instance_ptr {
                return fn(s);
            };
        } else {
            convert = [fn = std::move(converter)](const std::string& s) mutable -> instance_ptr {
                return std::make_shared<T>(fn(s));
            };
        }
        record(type_converter_binding{std::type_index(typeid(T)), std::move(convert),
                                      make_source(loc)});
    }

    /// Allocate an id for one multibinding contribution.  Unique within
    /// the injector tree being built.
    int next_unique_id();

    /// Whether element sources capture stacktraces.
    bool captures_stacktraces() const noexcept;

    element_source make_source(std::source_location loc) const;

    void record(element e);

    /// Record a binding and return it for the builder to complete.
    std::shared_ptr<binding> record_binding(key k, std::source_location loc);

    /// Record a binding whose value is produced by an aggregate view
    /// (multibinder, map binder or optional binder).
    void bind_aggregate(key k, std::shared_ptr<const provider_instance> view,
                        std::source_location loc);

protected:
    struct impl;

    explicit binder(std::unique_ptr<impl> p);

    std::unique_ptr<impl> impl_;

private:
    friend class private_module;
    friend struct internal::recording;

    void configure_private(private_module& m);
};

/// Binder of a private module.
class BINDERY_EXPORT private_binder : public binder {
public:
    ~private_binder() override;

    /// Make a binding of this private environment visible to the
    /// enclosing one.
    void expose(const key& k, std::source_location loc = std::source_location::current());

    template <typename T>
    void expose(std::source_location loc = std::source_location::current()) {
        expose(key::get<T>(), loc);
    }

    template <typename T>
    void expose(qualifier q, std::source_location loc = std::source_location::current()) {
        expose(key::get<T>(std::move(q)), loc);
    }

private:
    friend class binder;

    explicit private_binder(std::unique_ptr<impl> p);
};

// ---------------------------------------------------------------
// binding_builder
// ---------------------------------------------------------------

template <typename T>
class binding_builder {
public:
    binding_builder(binder& b, std::shared_ptr<binding> target, bool annotated = false)
        : binder_(&b), binding_(std::move(target)), annotated_(annotated) {}

    template <typename Q>
    binding_builder& annotated_with() {
        return annotated_with(qualifier_of<Q>());
    }

    binding_builder& annotated_with(qualifier q) {
        if (annotated_) {
            report(error_id::annotation_already_specified,
                   "More than one annotation is specified for this binding.");
            return *this;
        }
        annotated_ = true;
        binding_->key_ = binding_->key_.with_annotation(std::move(q));
        return *this;
    }

    /// Link to the implementation type U.
    template <typename U>
        requires derived_from_base<U, T>
    binding_builder& to() {
        return set_target(linked_key_target{key::get<U>(), &detail::upcast<T, U>});
    }

    template <typename U>
        requires derived_from_base<U, T>
    binding_builder& to(qualifier q) {
        return set_target(linked_key_target{key::get<U>(std::move(q)), &detail::upcast<T, U>});
    }

    /// Link to another key of the same type.
    binding_builder& to(const key& k) {
        if (k.type_index() != std::type_index(typeid(T))) {
            report(error_id::mismatched_key_type,
                   "Cannot link " + binding_->key_.to_string() + " to " + k.to_string()
                   + ": the key has a different type.");
            return *this;
        }
        return set_target(linked_key_target{k, nullptr});
    }

    binding_builder& to_instance(const T& value)
        requires std::copy_constructible<T>
    {
        return set_target(instance_target{std::make_shared<T>(value), &value_ops_for<T>()});
    }

    template <typename U>
        requires derived_from_base<U, T>
    binding_builder& to_instance(std::shared_ptr<U> value) {
        if (!value) {
            report(error_id::binding_to_null,
                   "Binding to null instances is not allowed. Use to_provider() "
                   "if this is your intended behaviour.");
            return *this;
        }
        std::shared_ptr<T> as_t = std::move(value);
        return set_target(instance_target{std::move(as_t), &value_ops_for<T>()});
    }

    /// Provider function `std::shared_ptr<U>()`; may return null.
    template <typename F>
        requires std::invocable<F&>
    binding_builder& to_provider(F fn) {
        return set_target(provider_instance_target{
            std::make_shared<detail::function_provider<T, F>>(std::move(fn))});
    }

    /// Provider function with injected parameters.
    template <typename... Deps, typename F>
    binding_builder& to_provider(deps_tag<Deps...>, F fn) {
        std::string owner = "the provider of " + binding_->key_.to_string() + " at "
                            + binding_->source_.to_string();
        return set_target(provider_instance_target{
            std::make_shared<detail::method_provider<T, F, Deps...>>(std::move(fn),
                                                                     std::move(owner))});
    }

    binding_builder& to_provider(provider<T> p) {
        return set_target(provider_instance_target{
            std::make_shared<detail::handle_provider<T>>(std::move(p))});
    }

    /// Delegate to the provider object bound at P; P::get() returns
    /// std::shared_ptr<U> with U derived from T.
    template <typename P>
    binding_builder& to_provider() {
        return set_target(provider_key_target{key::get<P>(),
                                              &detail::invoke_provider_object<T, P>});
    }

    /// Construct U through the given constructor signature.
    template <typename U, typename... Deps>
        requires derived_from_base<U, T>
    binding_builder& to_constructor(deps_tag<Deps...>) {
        type_description desc;
        describe_type<U>(desc);
        upcast_fn cast = std::is_same_v<T, U> ? nullptr : &detail::upcast<T, U>;
        return set_target(constructor_target{key::get<U>(),
                                             inject<Deps...>::template describe<U>(),
                                             std::move(desc.members), cast});
    }

    template <typename A>
    void in() {
        set_scoping(scoping::for_annotation(std::type_index(typeid(A))));
    }

    void in(std::shared_ptr<scope> s) {
        set_scoping(scoping::for_instance(std::move(s)));
    }

    void as_eager_singleton() { set_scoping(scoping::eager_singleton()); }

    /// The binding as recorded so far.
    std::shared_ptr<const binding> get() const noexcept { return binding_; }

private:
    binding_builder& set_target(binding_target target) {
        if (!std::holds_alternative<untargetted_target>(binding_->target_)) {
            report(error_id::implementation_already_set, "Implementation is set more than once.");
            return *this;
        }
        binding_->target_ = std::move(target);
        return *this;
    }

    void set_scoping(scoping s) {
        if (binding_->scoping_.is_explicitly_scoped()) {
            report(error_id::scope_already_set, "Scope is set more than once.");
            return;
        }
        binding_->scoping_ = std::move(s);
    }

    void report(error_id id, std::string text) {
        binder_->add_error(message(id, std::move(text), {binding_->source_}));
    }

    binder* binder_;
    std::shared_ptr<binding> binding_;
    bool annotated_;
};

// ---------------------------------------------------------------
// constant_builder
// ---------------------------------------------------------------

/// `bind_constant().annotated_with<Port>().to("8080")`
class BINDERY_EXPORT constant_builder {
public:
    constant_builder(binder& b, element_source source);

    template <typename Q>
    constant_builder& annotated_with() {
        return annotated_with(qualifier_of<Q>());
    }

    constant_builder& annotated_with(qualifier q);

    void to(std::string value);
    void to(const char* value) { to(std::string(value)); }

    template <typename V>
        requires std::is_arithmetic_v<V>
    void to(V value) {
        bind_value(key::get<V>(), std::make_shared<V>(value), &value_ops_for<V>());
    }

private:
    void bind_value(key k, instance_ptr value, const value_ops* ops);

    binder* binder_;
    element_source source_;
    std::optional<qualifier> annotation_;
};

} // namespace bindery
