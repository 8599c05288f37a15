#include "injector_state.hpp"
#include "log.hpp"

#include <algorithm>
#include <exception>
#include <variant>

namespace bindery::internal {

namespace {

/// A dependency on an entry that is still being linked.  Legal when a
/// provider<T> edge lies on the cycle.
bool check_cycle(const entry& target, const link_context& ctx, error_list& errors,
                 bool lazy_edge) {
    auto it = std::find_if(ctx.path.begin(), ctx.path.end(),
                           [&](const link_context::step& s) { return s.e == &target; });
    if (it == ctx.path.end() || lazy_edge) return true;
    if (std::any_of(std::next(it), ctx.path.end(),
                    [](const link_context::step& s) { return s.lazy; })) {
        return true;
    }

    std::vector<key> cycle;
    for (auto s = it; s != ctx.path.end(); ++s) cycle.push_back(s->e->get_key());
    cycle.push_back(target.get_key());
    errors.add(circular_dependency(cycle, target.source()));
    return false;
}

/// Run user provisioning code.  Errors the injector raised pass through;
/// anything else is reported against `source`.
template <typename F>
instance_ptr run_custom_provider(const element_source& source, F&& fn) {
    try {
        return fn();
    } catch (const provision_error&) {
        throw;
    } catch (const out_of_scope_error&) {
        throw;
    } catch (const std::exception& e) {
        detail::raise_provision_error(
            error_in_custom_provider(e, std::current_exception(), source));
    }
}

/// Builds the unscoped provider of one entry from its target.
struct target_linker {
    entry& e;
    link_context& ctx;
    error_list& errors;

    injector_state& state() const { return *e.owner; }

    bool resolve_all(const std::vector<dependency>& deps, std::vector<resolved_dependency>& out) {
        bool ok = true;
        out.reserve(deps.size());
        for (const auto& dep : deps) {
            const entry* target = resolve_dependency(state(), dep, ctx, errors, e.source());
            if (!target && !dep.optional) ok = false;
            out.push_back(resolved_dependency{dep, target});
        }
        return ok;
    }

    raw_provider operator()(const untargetted_target&) {
        scoping synthesized;
        auto target = synthesize_target(state(), e.get_key(), e.source(), errors, synthesized,
                                        jit_limitation::new_or_existing_jit);
        if (!target) return {};
        if (!e.definition->get_scoping().is_explicitly_scoped()) e.effective_scoping = synthesized;

        auto definition = std::make_shared<const binding>(e.get_key(), e.source(),
                                                          std::move(*target),
                                                          e.effective_scoping);
        e.definition = definition;
        return std::visit(*this, definition->target());
    }

    raw_provider operator()(const instance_target& t) {
        instance_ptr value = t.value;
        return [value]() { return value; };
    }

    raw_provider operator()(const linked_key_target& t) {
        if (t.target == e.get_key()) {
            errors.add(recursive_binding(e.get_key(), e.source()));
            return {};
        }
        dependency dep{t.target, true, false, false, -1, {}};
        const entry* target = resolve_dependency(state(), dep, ctx, errors, e.source(),
                                                 jit_limitation::new_or_existing_jit);
        if (!target) return {};

        upcast_fn upcast = t.upcast;
        return [target, upcast]() -> instance_ptr {
            instance_ptr value = call_entry(*target, nullptr);
            return value && upcast ? upcast(value) : value;
        };
    }

    raw_provider operator()(const provider_key_target& t) {
        dependency dep{t.provider_key, false, false, false, -1,
                       "the provider object of " + e.get_key().to_string()};
        const entry* target = resolve_dependency(state(), dep, ctx, errors, e.source());
        if (!target) return {};

        resolved_dependency resolved{std::move(dep), target};
        auto invoke = t.invoke;
        element_source source = e.source();
        return [resolved, invoke, source]() -> instance_ptr {
            argument provider_object = build_argument(resolved);
            return run_custom_provider(source, [&] { return invoke(provider_object.value); });
        };
    }

    raw_provider operator()(const provider_instance_target& t) {
        std::vector<resolved_dependency> resolved;
        if (!resolve_all(t.provider->dependencies(), resolved)) return {};

        std::shared_ptr<const provider_instance> provider = t.provider;
        element_source source = e.source();
        return [provider, resolved = std::move(resolved), source]() -> instance_ptr {
            arguments args = build_arguments(resolved);
            return run_custom_provider(source, [&] { return provider->get(args); });
        };
    }

    raw_provider operator()(const constructor_target& t) {
        std::vector<resolved_dependency> params;
        bool ok = resolve_all(t.constructor.dependencies, params);

        std::vector<dependency> member_deps;
        member_deps.reserve(t.members.size());
        for (const auto& m : t.members) member_deps.push_back(m.target);
        std::vector<resolved_dependency> members;
        ok = resolve_all(member_deps, members) && ok;
        if (!ok) return {};

        auto construct = t.constructor.construct;
        std::vector<member_description> setters = t.members;
        upcast_fn upcast = t.upcast;
        element_source source = e.source();
        return [params = std::move(params), members = std::move(members), construct,
                setters = std::move(setters), upcast, source]() -> instance_ptr {
            arguments args = build_arguments(params);
            instance_ptr object;
            try {
                object = construct(args);
            } catch (const provision_error&) {
                throw;
            } catch (const out_of_scope_error&) {
                throw;
            } catch (const std::exception& ex) {
                detail::raise_provision_error(
                    error_injecting_constructor(ex, std::current_exception(), source));
            }

            for (std::size_t i = 0; i < setters.size(); ++i) {
                argument value = build_argument(members[i]);
                if (value.absent) continue;
                try {
                    setters[i].apply(object.get(), value);
                } catch (const provision_error&) {
                    throw;
                } catch (const out_of_scope_error&) {
                    throw;
                } catch (const std::exception& ex) {
                    detail::raise_provision_error(
                        error_injecting_member(ex, std::current_exception(), source));
                }
            }
            return upcast ? upcast(object) : object;
        };
    }

    raw_provider operator()(const converted_constant_target& t) {
        instance_ptr value = t.value;
        return [value]() { return value; };
    }

    raw_provider operator()(const exposed_target& t) {
        auto it = state().environments.find(t.environment.get());
        if (it == state().environments.end()) {
            errors.add(bad_exposure(e.get_key(), e.source()));
            return {};
        }
        dependency dep{e.get_key(), true, false, false, -1, {}};
        const entry* target = resolve_dependency(*it->second, dep, ctx, errors, e.source());
        if (!target) return {};
        return [target]() { return target->scoped(); };
    }
};

} // namespace

const entry* resolve_dependency(injector_state& state, const dependency& dep,
                                link_context& ctx, error_list& errors,
                                const element_source& requester, jit_limitation limit) {
    if (dep.optional) {
        auto existing = state.find_existing(dep.target);
        if (existing && jit_refused(state, *existing, limit)) return nullptr;
        if (!existing) {
            // Nothing bound: try a just-in-time binding, quietly.
            error_list scratch;
            const std::size_t mark = journal_mark(state);
            const std::size_t settled_mark = ctx.settled.size();
            auto e = find_or_create(state, dep.target, ctx, scratch, requester, dep.is_provider,
                                    limit);
            if (!e || !scratch.empty()) {
                rollback_journal(state, mark);
                reset_settled(ctx, settled_mark);
                return nullptr;
            }
            return e.get();
        }
    }

    auto e = find_or_create(state, dep.target, ctx, errors, requester, dep.is_provider, limit);
    if (!e) return nullptr;
    if (e->state == link_state::linking) {
        return check_cycle(*e, ctx, errors, dep.is_provider) ? e.get() : nullptr;
    }
    if (!link_entry(*e, ctx, errors, dep.is_provider)) return nullptr;
    return e.get();
}

bool link_entry(entry& e, link_context& ctx, error_list& errors, bool lazy_edge) {
    switch (e.state) {
    case link_state::linked:
    case link_state::linking:
        return true;
    case link_state::failed:
        return false;
    case link_state::unlinked:
        break;
    }

    const std::size_t before = errors.size();
    e.state = link_state::linking;
    ctx.path.push_back({&e, lazy_edge});

    // The untargetted case replaces the definition while it is visited.
    std::shared_ptr<const binding> definition = e.definition;
    target_linker linker{e, ctx, errors};
    raw_provider unscoped = std::visit(linker, definition->target());

    raw_provider scoped;
    if (unscoped && errors.size() == before) {
        scoped = apply_scoping(e, std::move(unscoped), errors);
    }
    ctx.path.pop_back();

    if (!e.jit) ctx.settled.push_back(&e);
    if (!scoped || errors.size() != before) {
        e.state = link_state::failed;
        return false;
    }
    e.scoped = std::move(scoped);
    e.state = link_state::linked;
    return true;
}

void reset_settled(link_context& ctx, std::size_t mark) {
    for (std::size_t i = mark; i < ctx.settled.size(); ++i) {
        ctx.settled[i]->scoped = nullptr;
        ctx.settled[i]->state = link_state::unlinked;
    }
    ctx.settled.resize(mark);
}

void link_all(injector_state& state, link_context& ctx, error_list& errors) {
    for (const auto& e : state.explicit_order) link_entry(*e, ctx, errors);
    for (const auto& r : state.required) {
        get_binding_or_create(state, r.target, ctx, errors, r.source);
    }
    for (auto& [elements, env] : state.environments) {
        BINDERY_LOG_TRACE << "linking private environment declared at "
                          << elements->source.to_string();
        link_all(*env, ctx, errors);
    }
}

} // namespace bindery::internal
