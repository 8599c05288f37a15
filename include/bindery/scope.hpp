#pragma once

#include "export.hpp"
#include "fwd.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>

namespace bindery {

/// Scope annotation for the built-in singleton scope:
///   `bind<Foo>().in<singleton>()` or `using scope_annotation = bindery::singleton;`
struct singleton {};

/// Scope strategy.  Wraps the unscoped provider of a binding once, when
/// the binding is linked; the returned provider decides when to reuse
/// instances.  Throw out_of_scope_error when called outside the scope.
class BINDERY_EXPORT scope {
public:
    virtual ~scope() = default;

    virtual raw_provider scope_provider(const key& k, raw_provider unscoped) = 0;

    virtual std::string to_string() const = 0;
};

enum class scoping_kind {
    unscoped,
    singleton,
    eager_singleton,
    annotation,   // scope annotation type, resolved through bind_scope
    instance      // scope object given directly with in(scope)
};

constexpr std::string_view to_string(scoping_kind kind) noexcept {
    constexpr std::string_view names[] = {
        "unscoped", "singleton", "eager singleton", "annotation", "instance"};
    return names[static_cast<int>(kind)];
}

/// How a binding is scoped.
struct BINDERY_EXPORT scoping {
    scoping_kind kind = scoping_kind::unscoped;
    std::optional<std::type_index> annotation;
    std::shared_ptr<bindery::scope> instance;

    static scoping unscoped() { return {}; }
    static scoping singleton() { return {scoping_kind::singleton, std::nullopt, nullptr}; }
    static scoping eager_singleton() { return {scoping_kind::eager_singleton, std::nullopt, nullptr}; }

    /// Annotation scoping; `bindery::singleton` collapses to the built-in kind.
    static scoping for_annotation(std::type_index annotation);
    static scoping for_instance(std::shared_ptr<bindery::scope> s);

    bool is_explicitly_scoped() const noexcept { return kind != scoping_kind::unscoped; }
    bool is_singleton() const noexcept {
        return kind == scoping_kind::singleton || kind == scoping_kind::eager_singleton;
    }

    std::string to_string() const;

    bool operator==(const scoping& other) const noexcept {
        return kind == other.kind && annotation == other.annotation
            && instance == other.instance;
    }
};

} // namespace bindery
