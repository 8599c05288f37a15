#include "injector_state.hpp"

#include <algorithm>

namespace bindery::internal {

tree_context::tree_context(injector_options opts)
    : options(std::move(opts))
    , types(options.introspector ? options.introspector
                                 : std::make_shared<const type_introspector>())
{}

injector_state::injector_state(std::shared_ptr<tree_context> t, injector_state* p,
                               const private_elements* env)
    : tree(std::move(t))
    , parent(p)
    , environment(env)
    , token(std::make_shared<int>(0))
{}

entry_ptr injector_state::find_explicit(const key& k) const {
    for (const injector_state* s = this; s; s = s->parent) {
        auto it = s->explicit_bindings.find(k);
        if (it != s->explicit_bindings.end()) return it->second;
    }
    return nullptr;
}

entry_ptr injector_state::find_existing(const key& k) const {
    for (const injector_state* s = this; s; s = s->parent) {
        auto it = s->explicit_bindings.find(k);
        if (it != s->explicit_bindings.end()) return it->second;
        auto jit = s->jit_bindings.find(k);
        if (jit != s->jit_bindings.end()) return jit->second;
    }
    return nullptr;
}

bool injector_state::is_blacklisted(const key& k) const {
    auto it = blacklist.find(k);
    if (it == blacklist.end()) return false;
    return std::any_of(it->second.tokens.begin(), it->second.tokens.end(),
                       [](const std::weak_ptr<void>& t) { return !t.expired(); });
}

std::vector<element_source> injector_state::blacklist_sources(const key& k) const {
    std::vector<element_source> out;
    auto it = blacklist.find(k);
    if (it == blacklist.end()) return out;
    for (std::size_t i = 0; i < it->second.tokens.size(); ++i) {
        if (!it->second.tokens[i].expired()) out.push_back(it->second.sources[i]);
    }
    return out;
}

void injector_state::add_to_blacklist(const key& k, const element_source& source,
                                      const std::shared_ptr<void>& child_token) {
    auto& e = blacklist[k];
    // Drop what expired children left behind.
    for (std::size_t i = e.tokens.size(); i-- > 0;) {
        if (e.tokens[i].expired()) {
            e.tokens.erase(e.tokens.begin() + static_cast<std::ptrdiff_t>(i));
            e.sources.erase(e.sources.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
    e.sources.push_back(source);
    e.tokens.push_back(child_token);
}

const scope_binding* injector_state::find_scope(std::type_index annotation) const {
    for (const injector_state* s = this; s; s = s->parent) {
        auto it = s->scopes.find(annotation);
        if (it != s->scopes.end()) return &it->second;
    }
    return nullptr;
}

std::vector<const type_converter_binding*>
injector_state::converters_for(std::type_index type) const {
    std::vector<const type_converter_binding*> out;
    for (const injector_state* s = this; s; s = s->parent) {
        for (const auto& c : s->converters) {
            if (c.type == type) out.push_back(&c);
        }
    }
    return out;
}

std::vector<std::shared_ptr<const binding>> injector_state::visible_bindings() const {
    std::vector<std::shared_ptr<const binding>> out;
    for (const injector_state* s = this; s; s = s->parent) {
        for (const auto& e : s->explicit_order) out.push_back(e->definition);
    }
    return out;
}

entry_ptr make_entry(std::shared_ptr<const binding> definition, injector_state* owner, bool jit) {
    auto e = std::make_shared<entry>();
    e->effective_scoping = definition->get_scoping();
    e->definition = std::move(definition);
    e->owner = owner;
    e->jit = jit;
    e->external = make_external_provider(e);
    return e;
}

std::size_t journal_mark(const injector_state& state) {
    return state.tree->jit_journal.size();
}

void rollback_journal(injector_state& state, std::size_t mark) {
    auto& journal = state.tree->jit_journal;
    while (journal.size() > mark) {
        entry_ptr e = std::move(journal.back());
        journal.pop_back();
        e->removed = true;
        e->state = link_state::failed;
        injector_state& owner = *e->owner;
        auto it = owner.jit_bindings.find(e->get_key());
        if (it != owner.jit_bindings.end() && it->second == e) owner.jit_bindings.erase(it);
        std::erase(owner.jit_order, e);
    }
}

} // namespace bindery::internal
