#include "bindery/injector.hpp"
#include "injector_state.hpp"
#include "log.hpp"
#include "recording.hpp"

#include <exception>
#include <mutex>
#include <utility>

namespace bindery {

namespace {

bool eager_in(stage s, const internal::entry& e) {
    if (e.state != internal::link_state::linked) return false;
    switch (s) {
    case stage::tool:
        return false;
    case stage::development:
        return e.effective_scoping.kind == scoping_kind::eager_singleton;
    case stage::production:
        return e.effective_scoping.is_singleton();
    }
    return false;
}

void collect_eager(internal::injector_state& state, stage s,
                   std::vector<const internal::entry*>& out) {
    for (const auto& e : state.explicit_order) {
        if (eager_in(s, *e)) out.push_back(e.get());
    }
    for (const auto& e : state.jit_order) {
        if (eager_in(s, *e)) out.push_back(e.get());
    }
    for (auto& [elements, env] : state.environments) collect_eager(*env, s, out);
}

/// Link k for a post-construction lookup, creating just-in-time bindings
/// as needed.  Throws configuration_error; nothing created by a failed
/// lookup is kept.
internal::entry_ptr lookup(internal::injector_state& state, const key& k,
                           internal::jit_limitation limit = internal::jit_limitation::no_jit) {
    std::lock_guard<std::recursive_mutex> lock(state.tree->mutex);
    internal::error_list errors;
    internal::link_context ctx;
    const std::size_t mark = internal::journal_mark(state);

    auto e = internal::get_binding_or_create(state, k, ctx, errors, element_source{}, limit);
    if (!e || !errors.empty()) {
        internal::rollback_journal(state, mark);
        state.tree->jit_journal.clear();
        if (errors.empty()) {
            errors.add(internal::missing_implementation(k, false, {}, element_source{}));
        }
        throw configuration_error(errors.take());
    }
    state.tree->jit_journal.clear();
    return e;
}

} // namespace

// ---------------------------------------------------------------
// Construction
// ---------------------------------------------------------------

std::shared_ptr<injector> create_injector(const module_list& modules, injector_options options,
                                          std::source_location loc) {
    return injector::build(modules, nullptr, std::move(options), loc);
}

injector::injector(std::shared_ptr<internal::injector_state> state,
                   std::shared_ptr<injector> parent)
    : state_(std::move(state))
    , parent_(std::move(parent))
{}

injector::~injector() = default;

std::shared_ptr<injector> injector::build(const module_list& modules,
                                          std::shared_ptr<injector> parent,
                                          injector_options options,
                                          std::source_location loc) {
    auto tree = parent ? parent->state_->tree
                       : std::make_shared<internal::tree_context>(std::move(options));
    std::lock_guard<std::recursive_mutex> lock(tree->mutex);

    auto state = std::make_shared<internal::injector_state>(
        tree, parent ? parent->state_.get() : nullptr);
    internal::error_list errors;

    auto elements = internal::recording::record(modules, tree->next_id,
                                                tree->options.capture_stacktraces);
    internal::index_elements(*state, elements, errors);
    internal::initialize_aggregates(*state);

    const std::size_t mark = internal::journal_mark(*state);
    internal::link_context ctx;
    internal::link_all(*state, ctx, errors);

    if (!errors.empty()) {
        internal::rollback_journal(*state, mark);
        tree->jit_journal.clear();
        BINDERY_LOG_WARNING << "injector creation failed with " << errors.size()
                            << (errors.size() == 1 ? " error" : " errors");
        throw creation_error(errors.take(), loc);
    }
    tree->jit_journal.clear();

    std::shared_ptr<injector> result(new injector(state, std::move(parent)));

    std::vector<const internal::entry*> eager;
    collect_eager(*state, tree->options.stage, eager);
    for (const auto* e : eager) {
        BINDERY_LOG_DEBUG << "eager singleton " << e->get_key();
        try {
            internal::call_entry(*e, nullptr);
        } catch (const provision_error& ex) {
            for (const auto& m : ex.messages()) errors.add(m);
        } catch (const out_of_scope_error& ex) {
            errors.add(internal::out_of_scope(ex, e->source()));
        }
    }
    if (!errors.empty()) {
        BINDERY_LOG_WARNING << "eager singleton construction failed with " << errors.size()
                            << (errors.size() == 1 ? " error" : " errors");
        throw creation_error(errors.take(), loc);
    }

    BINDERY_LOG_INFO << "injector created (" << to_string(tree->options.stage) << "): "
                     << state->explicit_order.size() << " explicit bindings, "
                     << state->jit_order.size() << " just-in-time, "
                     << eager.size() << " eager singletons";
    return result;
}

std::shared_ptr<injector> injector::create_child_injector(const module_list& modules,
                                                          std::source_location loc) {
    return build(modules, shared_from_this(), options(), loc);
}

const injector_options& injector::options() const noexcept {
    return state_->tree->options;
}

// ---------------------------------------------------------------
// Instances
// ---------------------------------------------------------------

instance_ptr injector::get_instance(const key& k) {
    auto e = lookup(*state_, k);
    return internal::call_entry(*e, nullptr);
}

std::shared_ptr<const raw_provider> injector::get_raw_provider(const key& k) {
    return lookup(*state_, k)->external;
}

void injector::inject_members(const key& type, void* object) {
    auto desc = state_->tree->types->introspect(type.type());
    std::vector<internal::resolved_dependency> members;
    {
        std::lock_guard<std::recursive_mutex> lock(state_->tree->mutex);
        internal::error_list errors;
        internal::link_context ctx;
        const std::size_t mark = internal::journal_mark(*state_);

        if (!desc) {
            errors.add(internal::missing_implementation(type, false, {}, element_source{}));
        } else {
            for (const auto& m : desc->members) {
                const internal::entry* target = internal::resolve_dependency(
                    *state_, m.target, ctx, errors, element_source{});
                members.push_back(internal::resolved_dependency{m.target, target});
            }
        }
        if (!errors.empty()) {
            internal::rollback_journal(*state_, mark);
            state_->tree->jit_journal.clear();
            throw configuration_error(errors.take());
        }
        state_->tree->jit_journal.clear();
    }

    for (std::size_t i = 0; i < members.size(); ++i) {
        argument value = internal::build_argument(members[i]);
        if (value.absent) continue;
        try {
            desc->members[i].apply(object, value);
        } catch (const provision_error&) {
            throw;
        } catch (const out_of_scope_error&) {
            throw;
        } catch (const std::exception& ex) {
            detail::raise_provision_error(internal::error_injecting_member(
                ex, std::current_exception(), element_source{}));
        }
    }
}

// ---------------------------------------------------------------
// Bindings
// ---------------------------------------------------------------

std::shared_ptr<const binding> injector::get_binding(const key& k) {
    return lookup(*state_, k, internal::jit_limitation::existing_jit)->definition;
}

std::shared_ptr<const binding> injector::get_existing_binding(const key& k) const {
    std::lock_guard<std::recursive_mutex> lock(state_->tree->mutex);
    auto e = state_->find_existing(k);
    return e ? e->definition : nullptr;
}

std::vector<std::shared_ptr<const binding>> injector::get_bindings() const {
    std::lock_guard<std::recursive_mutex> lock(state_->tree->mutex);
    std::vector<std::shared_ptr<const binding>> out;
    out.reserve(state_->explicit_order.size());
    for (const auto& e : state_->explicit_order) out.push_back(e->definition);
    return out;
}

std::vector<std::shared_ptr<const binding>> injector::get_all_bindings() const {
    std::lock_guard<std::recursive_mutex> lock(state_->tree->mutex);
    std::vector<std::shared_ptr<const binding>> out;
    out.reserve(state_->explicit_order.size() + state_->jit_order.size());
    for (const auto& e : state_->explicit_order) out.push_back(e->definition);
    for (const auto& e : state_->jit_order) out.push_back(e->definition);
    return out;
}

std::vector<std::shared_ptr<const binding>>
injector::find_bindings_by_type(std::type_index type) const {
    std::lock_guard<std::recursive_mutex> lock(state_->tree->mutex);
    std::vector<std::shared_ptr<const binding>> out;
    for (const internal::injector_state* s = state_.get(); s; s = s->parent) {
        for (const auto& e : s->explicit_order) {
            if (e->get_key().type_index() == type) out.push_back(e->definition);
        }
    }
    return out;
}

} // namespace bindery
