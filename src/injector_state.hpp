#pragma once

// Internal state of an injector tree.  Not installed.

#include "bindery/binding.hpp"
#include "bindery/dependency.hpp"
#include "bindery/element.hpp"
#include "bindery/injector.hpp"
#include "bindery/introspector.hpp"
#include "bindery/key.hpp"
#include "bindery/multibinder.hpp"
#include "errors.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bindery::internal {

struct injector_state;
struct entry;

using entry_ptr = std::shared_ptr<entry>;

/// Shared by an injector, its private environments and its children.
struct tree_context {
    explicit tree_context(injector_options opts);

    injector_options options;
    std::shared_ptr<const bindery::introspector> types;

    /// Multibinding contribution ids.
    int next_id = 0;

    /// Guards just-in-time creation, linking and singleton construction.
    std::recursive_mutex mutex;

    /// Just-in-time entries created by the current top-level operation,
    /// in creation order.  Rolled back from a mark on failure.
    std::vector<entry_ptr> jit_journal;
};

enum class link_state { unlinked, linking, linked, failed };

/// A dependency of a linked entry with the entry that satisfies it;
/// null when an optional dependency could not be satisfied.
struct resolved_dependency {
    dependency dep;
    const entry* target = nullptr;
};

/// One binding of an injector together with its linked providers.
struct entry {
    std::shared_ptr<const binding> definition;
    injector_state* owner = nullptr;
    bool jit = false;
    bool removed = false;
    link_state state = link_state::unlinked;

    /// Scoping in effect; differs from the definition for untargetted
    /// bindings of types that declare a scope annotation.
    bindery::scoping effective_scoping;

    /// Provider consumers call.
    raw_provider scoped;

    /// Handle given out as provider<T>; does not keep the entry alive.
    std::shared_ptr<const raw_provider> external;

    const key& get_key() const noexcept { return definition->get_key(); }
    const element_source& source() const noexcept { return definition->source(); }
};

struct blacklist_entry {
    std::vector<element_source> sources;
    std::vector<std::weak_ptr<void>> tokens;
};

/// Bindings of one injector or private environment.
struct injector_state {
    injector_state(std::shared_ptr<tree_context> t, injector_state* p,
                   const private_elements* env = nullptr);

    std::shared_ptr<tree_context> tree;

    /// Enclosing injector or environment.  Outlives this state: child
    /// injectors keep their parent alive and environments are owned by
    /// the state that declared them.
    injector_state* parent = nullptr;

    /// Elements this state was built from when it is a private environment.
    const private_elements* environment = nullptr;

    /// Expires the blacklist entries this state put on its ancestors.
    std::shared_ptr<void> token;

    std::unordered_map<key, entry_ptr, key_hash> explicit_bindings;
    std::vector<entry_ptr> explicit_order;

    std::unordered_map<key, entry_ptr, key_hash> jit_bindings;
    std::vector<entry_ptr> jit_order;

    std::unordered_map<std::type_index, scope_binding> scopes;
    std::vector<type_converter_binding> converters;
    std::vector<require_binding_statement> required;

    std::unordered_map<key, blacklist_entry, key_hash> blacklist;

    /// Private environments declared by this state's modules.
    std::unordered_map<const private_elements*, std::shared_ptr<injector_state>> environments;

    /// Explicit binding in this state or an ancestor.
    entry_ptr find_explicit(const key& k) const;

    /// Explicit or just-in-time binding in this state or an ancestor.
    entry_ptr find_existing(const key& k) const;

    bool is_blacklisted(const key& k) const;
    std::vector<element_source> blacklist_sources(const key& k) const;
    void add_to_blacklist(const key& k, const element_source& source,
                          const std::shared_ptr<void>& child_token);

    const scope_binding* find_scope(std::type_index annotation) const;
    std::vector<const type_converter_binding*> converters_for(std::type_index type) const;

    /// Explicit bindings of this state and its ancestors.
    std::vector<std::shared_ptr<const binding>> visible_bindings() const;
};

// ---------------------------------------------------------------
// Binding index (binding_index.cpp)
// ---------------------------------------------------------------

/// Merge evaluated elements into `state`, recursing into private
/// environments.  Conflicts are reported to `errors`.
void index_elements(injector_state& state, const std::vector<element>& elements,
                    error_list& errors);

/// Call initialize() on every aggregate bound in `state` and its
/// private environments.
void initialize_aggregates(injector_state& state);

// ---------------------------------------------------------------
// Linking (linker.cpp, jit_resolver.cpp)
// ---------------------------------------------------------------

struct link_context {
    struct step {
        entry* e;
        bool lazy;
    };

    /// Entries being linked, outermost first, with the kind of edge
    /// that led into each.
    std::vector<step> path;

    /// Explicit entries whose linking finished, linked or failed, in
    /// order.  A discarded attempt returns the tail to unlinked.
    std::vector<entry*> settled;
};

/// How far just-in-time bindings may serve a request when explicit
/// bindings are required.
enum class jit_limitation {
    /// Dependencies and instance lookups: no just-in-time binding at all.
    no_jit,
    /// Binding queries: existing just-in-time bindings only.
    existing_jit,
    /// Targets of linked, implemented_by and untargetted bindings.
    new_or_existing_jit
};

/// New entry with its provider<T> handle.
entry_ptr make_entry(std::shared_ptr<const binding> definition, injector_state* owner, bool jit);

/// Existing binding for k as seen from `state`, or a new just-in-time
/// one.  Just-in-time entries come back linked, existing ones as found.
entry_ptr find_or_create(injector_state& state, const key& k, link_context& ctx,
                         error_list& errors, const element_source& requester, bool lazy_edge,
                         jit_limitation limit = jit_limitation::no_jit);

/// find_or_create() followed by linking.
entry_ptr get_binding_or_create(injector_state& state, const key& k, link_context& ctx,
                                error_list& errors, const element_source& requester,
                                jit_limitation limit = jit_limitation::no_jit);

/// An existing just-in-time entry `limit` may not hand out.
bool jit_refused(const injector_state& state, const entry& e, jit_limitation limit);

/// Link `e` and the transitive closure of its dependencies.  `lazy_edge`
/// tells whether `e` is reached through a provider<T> dependency.
bool link_entry(entry& e, link_context& ctx, error_list& errors, bool lazy_edge = false);

/// Link every explicit binding and required key of `state` and its
/// private environments.
void link_all(injector_state& state, link_context& ctx, error_list& errors);

/// Resolve the entry satisfying one dependency.  Null when an optional
/// dependency cannot be satisfied or an error was reported.
const entry* resolve_dependency(injector_state& state, const dependency& dep,
                                link_context& ctx, error_list& errors,
                                const element_source& requester,
                                jit_limitation limit = jit_limitation::no_jit);

/// Target derived from the type of k, for just-in-time and untargetted
/// bindings.  Sets `out_scoping` from the type's scope annotation.
std::optional<binding_target> synthesize_target(injector_state& state, const key& k,
                                                 const element_source& source,
                                                 error_list& errors, scoping& out_scoping,
                                                 jit_limitation limit);

/// Return the explicit entries settled since `mark` to the unlinked
/// state, after an attempt whose errors were discarded.  Their providers
/// may point into just-in-time entries the attempt rolled back.
void reset_settled(link_context& ctx, std::size_t mark);

std::size_t journal_mark(const injector_state& state);
void rollback_journal(injector_state& state, std::size_t mark);

// ---------------------------------------------------------------
// Scopes (scopes.cpp)
// ---------------------------------------------------------------

/// Wrap the unscoped provider of `e` in its scope.  Empty on error.
raw_provider apply_scoping(entry& e, raw_provider unscoped, error_list& errors);

// ---------------------------------------------------------------
// Provisioning (provision.cpp)
// ---------------------------------------------------------------

/// Provision `target`, recording the key (and the dependency that led
/// to it, if any) for the provision chain.
instance_ptr call_entry(const entry& target, const dependency* via);

/// Build the arguments of a constructor, provider method or member list.
arguments build_arguments(const std::vector<resolved_dependency>& deps);
argument build_argument(const resolved_dependency& dep);

/// The provider<T> handle of an entry.
std::shared_ptr<const raw_provider> make_external_provider(const entry_ptr& e);

// ---------------------------------------------------------------
// Aggregation context over a state (multibindings.cpp)
// ---------------------------------------------------------------

class state_aggregation_context : public detail::aggregation_context {
public:
    explicit state_aggregation_context(const injector_state& state);

    const std::vector<std::shared_ptr<const binding>>& bindings() const override;
    std::shared_ptr<const binding> find(const key& k) const override;

private:
    const injector_state& state_;
    std::vector<std::shared_ptr<const binding>> bindings_;
};

} // namespace bindery::internal
