#include "injector_state.hpp"
#include "log.hpp"

#include <exception>
#include <string>
#include <variant>

namespace bindery::internal {

namespace {

/// Satisfy an annotated key from a string constant bound with the same
/// annotation.  `handled` is set once a conversion was attempted.
std::optional<binding_target> convert_constant(injector_state& state, const key& k,
                                               error_list& errors, bool& handled) {
    handled = false;
    if (k.type_index() == std::type_index(typeid(std::string))) return std::nullopt;

    key string_key = k.of_type<std::string>();
    entry_ptr constant = state.find_explicit(string_key);
    if (!constant) return std::nullopt;
    const auto* inst = std::get_if<instance_target>(&constant->definition->target());
    if (!inst || !inst->value) return std::nullopt;

    const std::string& text = *std::static_pointer_cast<const std::string>(inst->value);
    const element_source& constant_source = constant->source();

    auto converters = state.converters_for(k.type_index());
    if (converters.size() > 1) {
        handled = true;
        std::vector<element_source> sources;
        for (const auto* c : converters) sources.push_back(c->source);
        errors.add(ambiguous_conversion(text, constant_source, k, sources));
        return std::nullopt;
    }
    if (converters.size() == 1) {
        handled = true;
        instance_ptr value;
        try {
            value = converters.front()->convert(text);
        } catch (const std::exception& e) {
            errors.add(conversion_error(text, constant_source, k, e.what(),
                                        std::current_exception()));
            return std::nullopt;
        }
        if (!value) {
            errors.add(converter_returned_null(text, constant_source, k));
            return std::nullopt;
        }
        return converted_constant_target{string_key, text, std::move(value)};
    }

    auto desc = state.tree->types->introspect(k.type());
    if (!desc || !desc->from_string) return std::nullopt;
    handled = true;
    instance_ptr value;
    std::string reason;
    if (!desc->from_string(text, value, reason)) {
        errors.add(conversion_error(text, constant_source, k, reason, nullptr));
        return std::nullopt;
    }
    return converted_constant_target{string_key, text, std::move(value)};
}

bool is_generic(const injector_state& state, const key& k) {
    auto desc = state.tree->types->introspect(k.type());
    return desc && desc->is_generic;
}

entry_ptr create_jit_binding(injector_state& state, const key& k, link_context& ctx,
                             error_list& errors, const element_source& requester,
                             bool lazy_edge, jit_limitation limit) {
    const std::size_t before = errors.size();
    const std::size_t mark = journal_mark(state);

    scoping synthesized_scoping;
    auto target = synthesize_target(state, k, requester, errors, synthesized_scoping, limit);
    if (!target) return nullptr;

    element_source source;
    source.declaring = k.type().name();
    auto e = make_entry(std::make_shared<const binding>(k, std::move(source), std::move(*target),
                                                        synthesized_scoping),
                        &state, true);
    state.jit_bindings.emplace(k, e);
    state.jit_order.push_back(e);
    state.tree->jit_journal.push_back(e);

    BINDERY_LOG_DEBUG << "just-in-time binding for " << k;

    if (!link_entry(*e, ctx, errors, lazy_edge) || errors.size() != before) {
        rollback_journal(state, mark);
        return nullptr;
    }
    return e;
}

/// Create the binding in the highest ancestor that can satisfy it.
entry_ptr create_jit_recursive(injector_state& state, const key& k, link_context& ctx,
                               error_list& errors, const element_source& requester,
                               bool lazy_edge, jit_limitation limit) {
    if (state.parent) {
        error_list scratch;
        const std::size_t mark = journal_mark(state);
        const std::size_t settled_mark = ctx.settled.size();
        auto e = create_jit_recursive(*state.parent, k, ctx, scratch, requester, lazy_edge,
                                      limit);
        if (e && scratch.empty()) return e;
        rollback_journal(state, mark);
        reset_settled(ctx, settled_mark);
    }

    if (state.is_blacklisted(k)) {
        errors.add(child_binding_already_set(k, state.blacklist_sources(k), requester));
        return nullptr;
    }
    return create_jit_binding(state, k, ctx, errors, requester, lazy_edge, limit);
}

} // namespace

std::optional<binding_target> synthesize_target(injector_state& state, const key& k,
                                                 const element_source& source,
                                                 error_list& errors, scoping& out_scoping,
                                                 jit_limitation limit) {
    if (k.has_annotation() && !k.element()) {
        bool handled = false;
        auto converted = convert_constant(state, k, errors, handled);
        if (converted || handled) return converted;
    }

    if (limit != jit_limitation::new_or_existing_jit
        && state.tree->options.require_explicit_bindings) {
        errors.add(jit_disabled(k, source));
        return std::nullopt;
    }

    if (k.has_annotation()) {
        errors.add(missing_implementation(k, is_generic(state, k), state.visible_bindings(),
                                          source));
        return std::nullopt;
    }

    auto desc = state.tree->types->introspect(k.type());
    if (!desc) {
        errors.add(missing_implementation(k, false, state.visible_bindings(), source));
        return std::nullopt;
    }

    if (desc->scope_annotation) out_scoping = scoping::for_annotation(*desc->scope_annotation);

    if (desc->implemented_by) {
        return linked_key_target{*desc->implemented_by, desc->implemented_by_upcast};
    }
    if (desc->is_abstract) {
        errors.add(missing_implementation(k, desc->is_generic, state.visible_bindings(), source));
        return std::nullopt;
    }
    if (desc->constructors.size() != 1) {
        errors.add(missing_constructor(k, desc->constructors.size(), source));
        return std::nullopt;
    }
    return constructor_target{k, std::move(desc->constructors.front()),
                              std::move(desc->members), nullptr};
}

bool jit_refused(const injector_state& state, const entry& e, jit_limitation limit) {
    return e.jit && limit == jit_limitation::no_jit
        && state.tree->options.require_explicit_bindings
        && !std::holds_alternative<converted_constant_target>(e.definition->target());
}

entry_ptr find_or_create(injector_state& state, const key& k, link_context& ctx,
                         error_list& errors, const element_source& requester, bool lazy_edge,
                         jit_limitation limit) {
    if (auto e = state.find_existing(k)) {
        if (jit_refused(state, *e, limit)) {
            errors.add(jit_disabled(k, requester));
            return nullptr;
        }
        return e;
    }
    return create_jit_recursive(state, k, ctx, errors, requester, lazy_edge, limit);
}

entry_ptr get_binding_or_create(injector_state& state, const key& k, link_context& ctx,
                                error_list& errors, const element_source& requester,
                                jit_limitation limit) {
    auto e = find_or_create(state, k, ctx, errors, requester, false, limit);
    if (!e) return nullptr;
    if (e->state == link_state::linking) return e;
    if (!link_entry(*e, ctx, errors)) return nullptr;
    return e;
}

} // namespace bindery::internal
