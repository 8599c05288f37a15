#include "injector_state.hpp"

#include <atomic>
#include <exception>

namespace bindery::internal {

namespace {

struct singleton_cell {
    std::atomic<bool> ready{false};
    bool constructing = false;
    instance_ptr value;
};

/// Clears the constructing flag however construction ends.  A failed
/// construction is not cached; the next call tries again.
class construction_guard {
public:
    explicit construction_guard(bool& flag) noexcept : flag_(flag) { flag_ = true; }
    ~construction_guard() { flag_ = false; }

    construction_guard(const construction_guard&) = delete;
    construction_guard& operator=(const construction_guard&) = delete;

private:
    bool& flag_;
};

raw_provider make_singleton(entry& e, raw_provider unscoped) {
    auto cell = std::make_shared<singleton_cell>();
    // The tree outlives every entry it contains.
    tree_context* tree = e.owner->tree.get();
    key k = e.get_key();
    element_source source = e.source();

    return [cell, tree, unscoped = std::move(unscoped), k, source]() -> instance_ptr {
        if (cell->ready.load(std::memory_order_acquire)) return cell->value;

        std::lock_guard<std::recursive_mutex> lock(tree->mutex);
        if (cell->ready.load(std::memory_order_relaxed)) return cell->value;
        if (cell->constructing) {
            detail::raise_provision_error(circular_proxies_disabled(k, source));
        }

        construction_guard guard(cell->constructing);
        cell->value = unscoped();
        cell->ready.store(true, std::memory_order_release);
        return cell->value;
    };
}

raw_provider custom_scope(bindery::scope& s, entry& e, raw_provider unscoped,
                          error_list& errors) {
    try {
        raw_provider scoped = s.scope_provider(e.get_key(), std::move(unscoped));
        if (!scoped) {
            errors.add(message(error_id::error_in_custom_provider,
                               "Scope " + s.to_string() + " returned no provider for "
                                   + e.get_key().to_string() + ".",
                               {e.source()}));
        }
        return scoped;
    } catch (const std::exception& ex) {
        errors.add(error_in_custom_provider(ex, std::current_exception(), e.source()));
        return {};
    }
}

} // namespace

raw_provider apply_scoping(entry& e, raw_provider unscoped, error_list& errors) {
    const scoping& sc = e.effective_scoping;
    switch (sc.kind) {
    case scoping_kind::unscoped:
        return unscoped;
    case scoping_kind::singleton:
    case scoping_kind::eager_singleton:
        return make_singleton(e, std::move(unscoped));
    case scoping_kind::annotation: {
        const scope_binding* sb = e.owner->find_scope(*sc.annotation);
        if (!sb) {
            errors.add(scope_not_found(*sc.annotation, e.source()));
            return {};
        }
        return custom_scope(*sb->scope, e, std::move(unscoped), errors);
    }
    case scoping_kind::instance:
        return custom_scope(*sc.instance, e, std::move(unscoped), errors);
    }
    return unscoped;
}

} // namespace bindery::internal
