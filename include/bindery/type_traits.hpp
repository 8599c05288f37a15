#pragma once

#include "dependency.hpp"
#include "key.hpp"
#include "provider.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace bindery {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-binding).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

// ---------------------------------------------------------------
// Qualifier tags
// ---------------------------------------------------------------

template <std::size_t N>
struct fixed_string {
    char value[N]{};

    constexpr fixed_string(const char (&s)[N]) { std::copy_n(s, N, value); }
    constexpr std::string_view view() const { return {value, N - 1}; }
};

/// Type-level named qualifier: `annotated<Foo, name<"primary">>`.
template <fixed_string S>
struct name {
    using is_named_qualifier = void;
    static std::string value() { return std::string(S.view()); }
};

/// Qualifier for a qualifier tag type: `name<"x">` becomes
/// named("x"), any other type is a marker qualifier.
template <typename Q>
qualifier qualifier_of() {
    if constexpr (requires { typename Q::is_named_qualifier; }) {
        return qualifier::named(Q::value());
    } else {
        return qualifier::of<Q>();
    }
}

// ---------------------------------------------------------------
// Dependency wrapper tag types
// ---------------------------------------------------------------

/// Accepts a null instance.  Constructor receives `std::shared_ptr<T>`.
template <typename T>
struct nullable { using type = T; };

/// Injects an empty pointer when no binding can be found or synthesized.
template <typename T>
struct optional_dependency { using type = T; };

/// Dependency on the qualified key (T, Q).
template <typename D, typename Q>
struct annotated { using type = D; };

// ---------------------------------------------------------------
// dep_traits: extract injection metadata from a dep declaration
// ---------------------------------------------------------------

/// Primary: bare `T` → required, inject as `std::shared_ptr<T>`.
template <typename D>
struct dep_traits {
    using value_type  = D;
    using inject_type = std::shared_ptr<D>;
    static constexpr bool is_nullable = false;
    static constexpr bool is_optional = false;
    static constexpr bool is_provider = false;

    static std::optional<qualifier> annotation() { return std::nullopt; }

    static inject_type extract(const argument& arg) {
        return std::static_pointer_cast<D>(arg.value);
    }
};

template <typename T>
struct dep_traits<nullable<T>> : dep_traits<T> {
    static constexpr bool is_nullable = true;
};

template <typename T>
struct dep_traits<optional_dependency<T>> : dep_traits<T> {
    static constexpr bool is_nullable = true;
    static constexpr bool is_optional = true;
};

/// `provider<T>` → lazy, breaks construction cycles.
template <typename T>
struct dep_traits<provider<T>> {
    using value_type  = T;
    using inject_type = provider<T>;
    static constexpr bool is_nullable = true;
    static constexpr bool is_optional = false;
    static constexpr bool is_provider = true;

    static std::optional<qualifier> annotation() { return std::nullopt; }

    static inject_type extract(const argument& arg) { return provider<T>(arg.lazy); }
};

template <typename D, typename Q>
struct dep_traits<annotated<D, Q>> : dep_traits<D> {
    static std::optional<qualifier> annotation() { return qualifier_of<Q>(); }
};

/// Helper alias.
template <typename D>
using inject_type_t = typename dep_traits<D>::inject_type;

template <typename D>
dependency make_dependency(int index, std::string injection_point) {
    using traits = dep_traits<D>;
    using T = typename traits::value_type;
    auto q = traits::annotation();
    return dependency{q ? key::get<T>(std::move(*q)) : key::get<T>(),
                      traits::is_nullable, traits::is_optional, traits::is_provider,
                      index, std::move(injection_point)};
}

// ---------------------------------------------------------------
// Dependency lists
// ---------------------------------------------------------------

/// A zero-size tag type that carries a compile-time dependency type list.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

/// Designated constructor.  A class declares
///   using inject = bindery::inject<Logger, provider<Clock>>;
/// and the injector calls `T(std::shared_ptr<Logger>, provider<Clock>)`.
template <typename... Deps>
struct inject {
    static constexpr std::size_t count = sizeof...(Deps);

    static std::vector<dependency> dependencies(const std::string& owner) {
        return dependencies_impl(owner, std::index_sequence_for<Deps...>{});
    }

    template <typename T>
    static std::shared_ptr<T> construct(const arguments& args) {
        static_assert(std::is_constructible_v<T, inject_type_t<Deps>...>,
            "inject<Deps...>: T is not constructible from the declared dependencies");
        return construct_impl<T>(args, std::index_sequence_for<Deps...>{});
    }

    /// Call `fn` with the resolved arguments (provider methods).
    template <typename F>
    static decltype(auto) invoke(F& fn, const arguments& args) {
        return invoke_impl(fn, args, std::index_sequence_for<Deps...>{});
    }

    template <typename T>
    static constructor_description describe() {
        return constructor_description{
            std::type_index(typeid(inject)),
            dependencies(internal::demangle(typeid(T)) + "'s constructor"),
            [](const arguments& args) -> instance_ptr { return construct<T>(args); }};
    }

private:
    template <std::size_t... I>
    static std::vector<dependency> dependencies_impl(const std::string& owner,
                                                     std::index_sequence<I...>) {
        return {make_dependency<Deps>(static_cast<int>(I),
                    internal::parameter_point(static_cast<int>(I), owner))...};
    }

    template <typename T, std::size_t... I>
    static std::shared_ptr<T> construct_impl(const arguments& args, std::index_sequence<I...>) {
        return std::make_shared<T>(dep_traits<Deps>::extract(args[I])...);
    }

    template <typename F, std::size_t... I>
    static decltype(auto) invoke_impl(F& fn, const arguments& args, std::index_sequence<I...>) {
        return fn(dep_traits<Deps>::extract(args[I])...);
    }
};

/// Several designated constructors.  More than one eligible constructor
/// is reported as ambiguous when the type is synthesized.
template <typename... Injects>
struct constructors {};

// ---------------------------------------------------------------
// Member injection
// ---------------------------------------------------------------

/// Setter injection: `bindery::setter<&Foo::set_logger, Logger>`.
template <auto Fn, typename D>
struct setter {
    static constexpr bool is_optional = false;

    template <typename T>
    static member_description describe(int index) {
        auto dep = make_dependency<D>(index,
            "the " + internal::ordinal(index + 1) + " injected member of "
            + internal::demangle(typeid(T)));
        dep.optional = dep.optional || is_optional;
        return member_description{
            std::move(dep),
            [](void* object, const argument& arg) {
                (static_cast<T*>(object)->*Fn)(dep_traits<D>::extract(arg));
            }};
    }
};

/// Setter skipped when no binding can be found or synthesized.
template <auto Fn, typename D>
struct optional_setter : setter<Fn, D> {
    static constexpr bool is_optional = true;

    template <typename T>
    static member_description describe(int index) {
        auto desc = setter<Fn, D>::template describe<T>(index);
        desc.target.optional = true;
        desc.target.nullable = true;
        return desc;
    }
};

/// `using inject_members = bindery::members<setter<...>, ...>;`
template <typename... Setters>
struct members {
    template <typename T>
    static std::vector<member_description> describe() {
        return describe_impl<T>(std::index_sequence_for<Setters...>{});
    }

private:
    template <typename T, std::size_t... I>
    static std::vector<member_description> describe_impl(std::index_sequence<I...>) {
        return {Setters::template describe<T>(static_cast<int>(I))...};
    }
};

// ---------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------

namespace detail {

/// Convert an instance of U into an instance viewed as its base T.
template <typename T, typename U>
instance_ptr upcast(const instance_ptr& p) {
    return std::static_pointer_cast<T>(std::static_pointer_cast<U>(p));
}

} // namespace detail

} // namespace bindery
