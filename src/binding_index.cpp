#include "injector_state.hpp"
#include "log.hpp"

#include <memory>
#include <type_traits>
#include <variant>

namespace bindery::internal {

namespace {

void register_scope(injector_state& state, const scope_binding& sb, error_list& errors) {
    if (const scope_binding* existing = state.find_scope(sb.annotation)) {
        if (existing->scope == sb.scope) return;
        errors.add(duplicate_scopes(sb.annotation,
                                    existing->scope ? existing->scope->to_string() : "null",
                                    existing->source,
                                    sb.scope ? sb.scope->to_string() : "null", sb.source));
        return;
    }
    state.scopes.emplace(sb.annotation, sb);
}

/// An ancestor binding that re-exports this environment's own binding.
bool exposed_from(const binding& original, const injector_state& state) {
    const auto* exposed = std::get_if<exposed_target>(&original.target());
    return exposed && state.environment && exposed->environment.get() == state.environment;
}

void index_binding(injector_state& state, const std::shared_ptr<const binding>& b,
                   error_list& errors) {
    const key& k = b->get_key();

    if (auto it = state.explicit_bindings.find(k); it != state.explicit_bindings.end()) {
        const binding& original = *it->second->definition;
        if (original == *b) return;
        errors.add(binding_already_set(original, *b));
        return;
    }

    for (injector_state* p = state.parent; p; p = p->parent) {
        if (auto it = p->explicit_bindings.find(k); it != p->explicit_bindings.end()) {
            const binding& original = *it->second->definition;
            if (exposed_from(original, state)) break;
            if (original == *b) return;
            errors.add(binding_already_set(original, *b));
            return;
        }
        if (p->jit_bindings.count(k)) {
            errors.add(jit_binding_already_set(k, b->source()));
            return;
        }
    }

    auto e = make_entry(b, &state, false);
    state.explicit_bindings.emplace(k, e);
    state.explicit_order.push_back(std::move(e));

    for (injector_state* p = state.parent; p; p = p->parent) {
        p->add_to_blacklist(k, b->source(), state.token);
    }
}

} // namespace

void index_elements(injector_state& state, const std::vector<element>& elements,
                    error_list& errors) {
    // Scopes first: bindings may name them in any order.
    for (const auto& el : elements) {
        if (const auto* sb = std::get_if<scope_binding>(&el)) register_scope(state, *sb, errors);
    }

    std::vector<std::shared_ptr<const private_elements>> environments;
    for (const auto& el : elements) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::shared_ptr<const binding>>) {
                index_binding(state, v, errors);
            } else if constexpr (std::is_same_v<T, message>) {
                errors.add(v);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const private_elements>>) {
                environments.push_back(v);
                for (const auto& exp : v->exposed) {
                    index_binding(state,
                                  std::make_shared<const binding>(exp.target, exp.source,
                                                                  exposed_target{v}),
                                  errors);
                }
            } else if constexpr (std::is_same_v<T, require_binding_statement>) {
                state.required.push_back(v);
            } else if constexpr (std::is_same_v<T, type_converter_binding>) {
                state.converters.push_back(v);
            }
        }, el);
    }

    for (const auto& env : environments) {
        auto child = std::make_shared<injector_state>(state.tree, &state, env.get());
        state.environments.emplace(env.get(), child);
        index_elements(*child, env->elements, errors);

        for (const auto& exp : env->exposed) {
            if (!child->explicit_bindings.count(exp.target)) {
                errors.add(bad_exposure(exp.target, exp.source));
            }
        }
        BINDERY_LOG_DEBUG << "private environment " << env->source.to_string() << ": "
                          << child->explicit_order.size() << " bindings, "
                          << env->exposed.size() << " exposed";
    }
}

void initialize_aggregates(injector_state& state) {
    state_aggregation_context ctx(state);
    for (const auto& e : state.explicit_order) {
        const auto* target = std::get_if<provider_instance_target>(&e->definition->target());
        if (!target) continue;
        if (const auto* agg = dynamic_cast<const detail::aggregate*>(target->provider.get())) {
            agg->initialize(ctx);
        }
    }
    for (auto& [env, child] : state.environments) initialize_aggregates(*child);
}

} // namespace bindery::internal
