#pragma once

#include "export.hpp"
#include "binder.hpp"
#include "binding.hpp"
#include "exceptions.hpp"
#include "key.hpp"
#include "provider.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bindery {

// ---------------------------------------------------------------
// Aggregate value types
// ---------------------------------------------------------------

/// Insertion-ordered set of distinct instances.  Instances compare with
/// operator== when T has one, by identity otherwise.
template <typename T>
class set_of {
public:
    using bound_only = void;
    using value_type = std::shared_ptr<T>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    const_iterator begin() const noexcept { return items_.begin(); }
    const_iterator end() const noexcept { return items_.end(); }
    std::size_t size() const noexcept { return items_.size(); }
    bool empty() const noexcept { return items_.empty(); }

    bool contains(const T& value) const {
        const auto& ops = value_ops_for<T>();
        for (const auto& item : items_) {
            if (ops.equals(item.get(), &value)) return true;
        }
        return false;
    }

    /// Append unless an equal instance is present.
    bool insert(value_type value) {
        if (contains(*value)) return false;
        items_.push_back(std::move(value));
        return true;
    }

private:
    std::vector<value_type> items_;
};

/// Insertion-ordered map.  K must be hashable and equality comparable.
template <typename K, typename M>
class linked_map {
public:
    using bound_only = void;
    using value_type = std::pair<K, M>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    bool contains(const K& k) const { return index_.count(k) != 0; }

    const M* find(const K& k) const {
        auto it = index_.find(k);
        return it == index_.end() ? nullptr : &entries_[it->second].second;
    }

    const M& at(const K& k) const {
        const M* m = find(k);
        if (!m) throw std::out_of_range("linked_map::at: no such key");
        return *m;
    }

    /// Insert when the key is new.
    bool insert(K k, M m) {
        if (contains(k)) return false;
        index_.emplace(k, entries_.size());
        entries_.emplace_back(std::move(k), std::move(m));
        return true;
    }

    /// Mapped value for k, default-inserted when the key is new.
    M& operator[](const K& k) {
        auto it = index_.find(k);
        if (it != index_.end()) return entries_[it->second].second;
        index_.emplace(k, entries_.size());
        entries_.emplace_back(k, M{});
        return entries_.back().second;
    }

private:
    std::vector<value_type> entries_;
    std::unordered_map<K, std::size_t> index_;
};

template <typename T>
using provider_set_of = std::vector<provider<T>>;

template <typename K, typename V>
using map_of = linked_map<K, std::shared_ptr<V>>;

template <typename K, typename V>
using provider_map_of = linked_map<K, provider<V>>;

template <typename K, typename V>
using multimap_of = linked_map<K, std::vector<std::shared_ptr<V>>>;

template <typename K, typename V>
using provider_multimap_of = linked_map<K, std::vector<provider<V>>>;

template <typename T>
using optional_of = std::optional<std::shared_ptr<T>>;

template <typename T>
using optional_provider_of = std::optional<provider<T>>;

// ---------------------------------------------------------------
// Aggregation machinery
// ---------------------------------------------------------------

namespace detail {

/// Bindings an aggregate may see while its injector is being linked.
class BINDERY_EXPORT aggregation_context {
public:
    virtual ~aggregation_context() = default;

    /// Explicit bindings of the injector being built, in declaration order.
    virtual const std::vector<std::shared_ptr<const binding>>& bindings() const = 0;

    /// Explicit binding for k in this injector or an ancestor.
    virtual std::shared_ptr<const binding> find(const key& k) const = 0;
};

/// A binding whose provider aggregates other bindings.  Initialized
/// once per injector, before linking.
class BINDERY_EXPORT aggregate {
public:
    virtual ~aggregate() = default;
    virtual void initialize(const aggregation_context& ctx) const = 0;
};

/// Marker bound by permit_duplicates().
struct permit_marker {
    bool operator==(const permit_marker&) const = default;
};

/// Contributions of a collection in declaration order.  Structurally
/// equal contributions (same target, scope and map key) collapse.
BINDERY_EXPORT std::vector<std::shared_ptr<const binding>>
select_contributions(const aggregation_context& ctx, const element_info& collection,
                     std::type_index element_type);

BINDERY_EXPORT key permit_key(const element_info& collection);

BINDERY_EXPORT bool permits_duplicates(const aggregation_context& ctx,
                                       const element_info& collection);

BINDERY_EXPORT message null_set_element(const binding& element);
BINDERY_EXPORT message duplicate_set_element(const std::string& rendered);
/// One contribution to a duplicated map key, with its rendered value.
struct duplicate_map_entry {
    std::string value;
    std::shared_ptr<const binding> element;
};

BINDERY_EXPORT message duplicate_map_keys(
    const std::vector<std::pair<std::string, std::vector<duplicate_map_entry>>>& dups);
BINDERY_EXPORT message null_map_value(const std::string& rendered_key, const binding& value);
BINDERY_EXPORT message null_multimap_value(const std::string& rendered_key, const binding& value);

BINDERY_EXPORT std::string element_point(int index, const key& collection);

/// Shared by the views of one multibinder or map binder.
struct collection_state {
    element_info info;
    key view_key;
    std::type_index element_type;
    mutable std::vector<std::shared_ptr<const binding>> elements;
    mutable bool permit = false;

    void initialize(const aggregation_context& ctx) const {
        elements = select_contributions(ctx, info, element_type);
        permit = permits_duplicates(ctx, info);
    }

    std::vector<dependency> dependencies(bool lazy) const {
        std::vector<dependency> out;
        out.reserve(elements.size());
        for (std::size_t i = 0; i < elements.size(); ++i) {
            out.push_back(dependency{elements[i]->get_key(), true, false, lazy,
                                     static_cast<int>(i),
                                     element_point(static_cast<int>(i), view_key)});
        }
        return out;
    }
};

// ---------------------------------------------------------------
// Multibinder views
// ---------------------------------------------------------------

template <typename T>
class multibinder_view : public provider_instance,
                         public multibinder_binding,
                         public aggregate {
public:
    explicit multibinder_view(std::shared_ptr<const collection_state> state)
        : state_(std::move(state)) {}

    void initialize(const aggregation_context& ctx) const override { state_->initialize(ctx); }

    bool equals(const provider_instance& other) const override {
        const auto* o = dynamic_cast<const multibinder_view*>(&other);
        return o && typeid(*o) == typeid(*this) && o->state_->view_key == state_->view_key;
    }

    std::string to_string() const override { return "multibinder of " + set_key().to_string(); }

    key set_key() const override { return state_->view_key; }
    std::type_index element_type() const override { return typeid(T); }
    std::vector<std::shared_ptr<const binding>> elements() const override { return state_->elements; }
    bool permits_duplicates() const override { return state_->permit; }

protected:
    std::shared_ptr<const collection_state> state_;
};

/// set_of<T>
template <typename T>
class real_multibinder : public multibinder_view<T> {
public:
    using multibinder_view<T>::multibinder_view;

    std::vector<dependency> dependencies() const override {
        return this->state_->dependencies(false);
    }

    instance_ptr get(const arguments& args) const override {
        const auto& elements = this->state_->elements;
        auto result = std::make_shared<set_of<T>>();
        for (std::size_t i = 0; i < elements.size(); ++i) {
            auto value = std::static_pointer_cast<T>(args[i].value);
            if (!value) raise_provision_error(null_set_element(*elements[i]));
            if (!result->insert(value) && !this->state_->permit) {
                raise_provision_error(
                    duplicate_set_element(value_ops_for<T>().describe(value.get())));
            }
        }
        return result;
    }
};

/// provider_set_of<T>: every contribution, unprovisioned.
template <typename T>
class real_provider_multibinder : public multibinder_view<T> {
public:
    using multibinder_view<T>::multibinder_view;

    std::vector<dependency> dependencies() const override {
        return this->state_->dependencies(true);
    }

    instance_ptr get(const arguments& args) const override {
        auto result = std::make_shared<provider_set_of<T>>();
        result->reserve(args.size());
        for (const auto& arg : args) result->push_back(provider<T>(arg.lazy));
        return result;
    }

    std::string to_string() const override {
        return "provider multibinder of " + this->set_key().to_string();
    }
};

// ---------------------------------------------------------------
// Map binder views
// ---------------------------------------------------------------

template <typename K, typename V>
class map_binder_view : public provider_instance,
                        public map_binder_binding,
                        public aggregate {
public:
    explicit map_binder_view(std::shared_ptr<const collection_state> state)
        : state_(std::move(state)) {}

    void initialize(const aggregation_context& ctx) const override { state_->initialize(ctx); }

    bool equals(const provider_instance& other) const override {
        const auto* o = dynamic_cast<const map_binder_view*>(&other);
        return o && typeid(*o) == typeid(*this) && o->state_->view_key == state_->view_key;
    }

    std::string to_string() const override { return "map binder of " + map_key().to_string(); }

    key map_key() const override { return state_->view_key; }
    std::type_index key_type() const override { return typeid(K); }
    std::type_index value_type() const override { return typeid(V); }

    std::vector<std::pair<std::string, std::shared_ptr<const binding>>> entries() const override {
        std::vector<std::pair<std::string, std::shared_ptr<const binding>>> out;
        for (const auto& element : state_->elements) {
            out.emplace_back(element->get_key().element()->describe_map_key(), element);
        }
        return out;
    }

    bool permits_duplicates() const override { return state_->permit; }

protected:
    static const K& map_key_of(const binding& element) {
        return *static_cast<const K*>(element.get_key().element()->map_key.get());
    }

    /// Raise when two contributions share a key and duplicates are not
    /// permitted.  Values come from `values` when the view evaluated them,
    /// otherwise from the contributing binding's target.
    void check_duplicates(const arguments* values) const {
        if (state_->permit) return;
        const auto& elements = state_->elements;
        linked_map<K, std::vector<std::size_t>> by_key;
        for (std::size_t i = 0; i < elements.size(); ++i) {
            by_key[map_key_of(*elements[i])].push_back(i);
        }
        std::vector<std::pair<std::string, std::vector<duplicate_map_entry>>> dups;
        for (const auto& [k, indexes] : by_key) {
            if (indexes.size() < 2) continue;
            std::vector<duplicate_map_entry> entries;
            for (std::size_t i : indexes) {
                std::string value = values
                    ? "value \"" + value_ops_for<V>().describe((*values)[i].value.get()) + "\""
                    : elements[i]->target_description();
                entries.push_back(duplicate_map_entry{std::move(value), elements[i]});
            }
            dups.emplace_back(elements[indexes.front()]->get_key().element()->describe_map_key(),
                              std::move(entries));
        }
        if (!dups.empty()) raise_provision_error(duplicate_map_keys(dups));
    }

    std::shared_ptr<const collection_state> state_;
};

/// map_of<K, V>; with duplicates permitted the first value wins.
template <typename K, typename V>
class real_map_binder : public map_binder_view<K, V> {
public:
    using map_binder_view<K, V>::map_binder_view;

    std::vector<dependency> dependencies() const override {
        return this->state_->dependencies(false);
    }

    instance_ptr get(const arguments& args) const override {
        this->check_duplicates(&args);
        const auto& elements = this->state_->elements;
        auto result = std::make_shared<map_of<K, V>>();
        for (std::size_t i = 0; i < elements.size(); ++i) {
            auto value = std::static_pointer_cast<V>(args[i].value);
            if (!value) {
                raise_provision_error(null_map_value(
                    elements[i]->get_key().element()->describe_map_key(), *elements[i]));
            }
            result->insert(this->map_key_of(*elements[i]), std::move(value));
        }
        return result;
    }
};

template <typename K, typename V>
class real_provider_map_binder : public map_binder_view<K, V> {
public:
    using map_binder_view<K, V>::map_binder_view;

    std::vector<dependency> dependencies() const override {
        return this->state_->dependencies(true);
    }

    instance_ptr get(const arguments& args) const override {
        this->check_duplicates(nullptr);
        const auto& elements = this->state_->elements;
        auto result = std::make_shared<provider_map_of<K, V>>();
        for (std::size_t i = 0; i < elements.size(); ++i) {
            result->insert(this->map_key_of(*elements[i]), provider<V>(args[i].lazy));
        }
        return result;
    }

    std::string to_string() const override {
        return "provider map binder of " + this->map_key().to_string();
    }
};

/// multimap_of<K, V>: every value of every key.
template <typename K, typename V>
class real_multimap_binder : public map_binder_view<K, V> {
public:
    using map_binder_view<K, V>::map_binder_view;

    std::vector<dependency> dependencies() const override {
        return this->state_->dependencies(false);
    }

    instance_ptr get(const arguments& args) const override {
        const auto& elements = this->state_->elements;
        auto result = std::make_shared<multimap_of<K, V>>();
        for (std::size_t i = 0; i < elements.size(); ++i) {
            auto value = std::static_pointer_cast<V>(args[i].value);
            if (!value) {
                raise_provision_error(null_multimap_value(
                    elements[i]->get_key().element()->describe_map_key(), *elements[i]));
            }
            (*result)[this->map_key_of(*elements[i])].push_back(std::move(value));
        }
        return result;
    }

    std::string to_string() const override {
        return "multimap binder of " + this->map_key().to_string();
    }
};

template <typename K, typename V>
class real_provider_multimap_binder : public map_binder_view<K, V> {
public:
    using map_binder_view<K, V>::map_binder_view;

    std::vector<dependency> dependencies() const override {
        return this->state_->dependencies(true);
    }

    instance_ptr get(const arguments& args) const override {
        const auto& elements = this->state_->elements;
        auto result = std::make_shared<provider_multimap_of<K, V>>();
        for (std::size_t i = 0; i < elements.size(); ++i) {
            (*result)[this->map_key_of(*elements[i])].push_back(provider<V>(args[i].lazy));
        }
        return result;
    }

    std::string to_string() const override {
        return "provider multimap binder of " + this->map_key().to_string();
    }
};

// ---------------------------------------------------------------
// Optional binder views
// ---------------------------------------------------------------

struct optional_state {
    key optional_key;
    key direct_key;
    key default_key;
    key actual_key;

    mutable std::shared_ptr<const binding> default_binding;
    mutable std::shared_ptr<const binding> actual_binding;

    /// Key the views read: ACTUAL (set_binding or a user binding of the
    /// direct key) over DEFAULT.
    mutable std::optional<key> chosen;
};

template <typename T>
class optional_view : public provider_instance,
                      public optional_binder_binding,
                      public aggregate {
public:
    explicit optional_view(std::shared_ptr<const optional_state> state)
        : state_(std::move(state)) {}

    void initialize(const aggregation_context& ctx) const override {
        state_->default_binding = ctx.find(state_->default_key);
        state_->actual_binding = ctx.find(state_->actual_key);
        state_->chosen.reset();
        if (state_->actual_binding) {
            state_->chosen = state_->actual_key;
        } else if (auto user = ctx.find(state_->direct_key); user && !is_direct_view(*user)) {
            state_->actual_binding = user;
            state_->chosen = state_->direct_key;
        } else if (state_->default_binding) {
            state_->chosen = state_->default_key;
        }
    }

    bool equals(const provider_instance& other) const override {
        const auto* o = dynamic_cast<const optional_view*>(&other);
        return o && typeid(*o) == typeid(*this)
            && o->state_->optional_key == state_->optional_key;
    }

    key optional_key() const override { return state_->optional_key; }
    std::shared_ptr<const binding> default_binding() const override { return state_->default_binding; }
    std::shared_ptr<const binding> actual_binding() const override { return state_->actual_binding; }

protected:
    std::vector<dependency> chosen_dependency(bool lazy) const {
        if (!state_->chosen) return {};
        return {dependency{*state_->chosen, true, false, lazy, 0,
                           element_point(0, state_->optional_key)}};
    }

    static bool is_direct_view(const binding& b);

    std::shared_ptr<const optional_state> state_;
};

/// optional_of<T>: absent when nothing is bound or the value is null.
template <typename T>
class real_optional_binder : public optional_view<T> {
public:
    using optional_view<T>::optional_view;

    std::vector<dependency> dependencies() const override { return this->chosen_dependency(false); }

    instance_ptr get(const arguments& args) const override {
        auto result = std::make_shared<optional_of<T>>();
        if (!args.empty() && args[0].value) *result = std::static_pointer_cast<T>(args[0].value);
        return result;
    }

    std::string to_string() const override {
        return "optional binder of " + this->optional_key().to_string();
    }
};

/// optional_provider_of<T>: present whenever something is bound.
template <typename T>
class real_optional_provider_binder : public optional_view<T> {
public:
    using optional_view<T>::optional_view;

    std::vector<dependency> dependencies() const override { return this->chosen_dependency(true); }

    instance_ptr get(const arguments& args) const override {
        auto result = std::make_shared<optional_provider_of<T>>();
        if (!args.empty()) *result = provider<T>(args[0].lazy);
        return result;
    }

    std::string to_string() const override {
        return "optional provider binder of " + this->optional_key().to_string();
    }
};

/// The plain key T once set_default() or set_binding() was called.
template <typename T>
class real_optional_direct : public optional_view<T> {
public:
    using optional_view<T>::optional_view;

    std::vector<dependency> dependencies() const override { return this->chosen_dependency(false); }

    instance_ptr get(const arguments& args) const override {
        return args.empty() ? instance_ptr{} : args[0].value;
    }

    std::string to_string() const override {
        return "optional binder direct view of " + this->optional_key().to_string();
    }
};

template <typename T>
bool optional_view<T>::is_direct_view(const binding& b) {
    const auto* target = std::get_if<provider_instance_target>(&b.target());
    return target && dynamic_cast<const real_optional_direct<T>*>(target->provider.get());
}

} // namespace detail

// ---------------------------------------------------------------
// multibinder
// ---------------------------------------------------------------

/// Contributes elements to set_of<T> (and provider_set_of<T>) from any
/// number of modules.
template <typename T>
class multibinder {
public:
    static multibinder new_set_binder(binder& b,
                                      std::source_location loc = std::source_location::current()) {
        return multibinder(b, std::nullopt, loc);
    }

    static multibinder new_set_binder(binder& b, qualifier q,
                                      std::source_location loc = std::source_location::current()) {
        return multibinder(b, std::move(q), loc);
    }

    /// Start one contribution.
    binding_builder<T> add_binding(std::source_location loc = std::source_location::current()) {
        element_info info = state_->info;
        info.unique_id = binder_->next_unique_id();
        return binder_->template bind<T>(qualifier::element(std::move(info)), loc);
    }

    /// Equal elements collapse instead of failing; the first one wins.
    multibinder& permit_duplicates(std::source_location loc = std::source_location::current()) {
        binder_->template bind<detail::permit_marker>(
            detail::permit_key(state_->info).annotation().value(), loc)
            .to_instance(detail::permit_marker{});
        return *this;
    }

    key set_key() const { return state_->view_key; }

    bool operator==(const multibinder& other) const { return set_key() == other.set_key(); }

private:
    multibinder(binder& b, std::optional<qualifier> q, std::source_location loc)
        : binder_(&b) {
        key set = key::get<set_of<T>>().with_annotation(q);
        key providers = key::get<provider_set_of<T>>().with_annotation(q);
        element_info info;
        info.set_name = set.to_string();
        info.kind = element_kind::multibinder;
        state_ = std::make_shared<const detail::collection_state>(
            detail::collection_state{std::move(info), set, std::type_index(typeid(T)), {}, false});

        b.bind_aggregate(set, std::make_shared<detail::real_multibinder<T>>(state_), loc);
        b.bind_aggregate(providers, std::make_shared<detail::real_provider_multibinder<T>>(state_),
                         loc);
    }

    binder* binder_;
    std::shared_ptr<const detail::collection_state> state_;
};

// ---------------------------------------------------------------
// map_binder
// ---------------------------------------------------------------

/// Contributes entries to map_of<K, V> from any number of modules.  The
/// same contributions are visible as provider_map_of<K, V>,
/// multimap_of<K, V> and provider_multimap_of<K, V>.
template <typename K, typename V>
class map_binder {
public:
    static map_binder new_map_binder(binder& b,
                                     std::source_location loc = std::source_location::current()) {
        return map_binder(b, std::nullopt, loc);
    }

    static map_binder new_map_binder(binder& b, qualifier q,
                                     std::source_location loc = std::source_location::current()) {
        return map_binder(b, std::move(q), loc);
    }

    /// Start the contribution for `k`.
    binding_builder<V> add_binding(K k, std::source_location loc = std::source_location::current()) {
        element_info info = state_->info;
        info.unique_id = binder_->next_unique_id();
        info.map_key = std::make_shared<const K>(std::move(k));
        info.map_key_ops = &value_ops_for<K>();
        return binder_->template bind<V>(qualifier::element(std::move(info)), loc);
    }

    /// Duplicate keys keep the first value instead of failing.
    map_binder& permit_duplicates(std::source_location loc = std::source_location::current()) {
        binder_->template bind<detail::permit_marker>(
            detail::permit_key(state_->info).annotation().value(), loc)
            .to_instance(detail::permit_marker{});
        return *this;
    }

    key map_key() const { return state_->view_key; }

    bool operator==(const map_binder& other) const { return map_key() == other.map_key(); }

private:
    map_binder(binder& b, std::optional<qualifier> q, std::source_location loc)
        : binder_(&b) {
        key map = key::get<map_of<K, V>>().with_annotation(q);
        element_info info;
        info.set_name = map.to_string();
        info.kind = element_kind::mapbinder;
        info.key_type = std::type_index(typeid(K));
        state_ = std::make_shared<const detail::collection_state>(
            detail::collection_state{std::move(info), map, std::type_index(typeid(V)), {}, false});

        b.bind_aggregate(map, std::make_shared<detail::real_map_binder<K, V>>(state_), loc);
        b.bind_aggregate(key::get<provider_map_of<K, V>>().with_annotation(q),
                         std::make_shared<detail::real_provider_map_binder<K, V>>(state_), loc);
        b.bind_aggregate(key::get<multimap_of<K, V>>().with_annotation(q),
                         std::make_shared<detail::real_multimap_binder<K, V>>(state_), loc);
        b.bind_aggregate(key::get<provider_multimap_of<K, V>>().with_annotation(q),
                         std::make_shared<detail::real_provider_multimap_binder<K, V>>(state_),
                         loc);
    }

    binder* binder_;
    std::shared_ptr<const detail::collection_state> state_;
};

// ---------------------------------------------------------------
// optional_binder
// ---------------------------------------------------------------

/// Declares that T may or may not be bound.  optional_of<T> is absent
/// when nothing is bound; set_binding() overrides set_default().
template <typename T>
class optional_binder {
public:
    static optional_binder new_optional_binder(
        binder& b, std::source_location loc = std::source_location::current()) {
        return optional_binder(b, std::nullopt, loc);
    }

    static optional_binder new_optional_binder(
        binder& b, qualifier q, std::source_location loc = std::source_location::current()) {
        return optional_binder(b, std::move(q), loc);
    }

    binding_builder<T> set_default(std::source_location loc = std::source_location::current()) {
        bind_direct(loc);
        return binder_->template bind<T>(*state_->default_key.annotation(), loc);
    }

    binding_builder<T> set_binding(std::source_location loc = std::source_location::current()) {
        bind_direct(loc);
        return binder_->template bind<T>(*state_->actual_key.annotation(), loc);
    }

    key optional_key() const { return state_->optional_key; }

    bool operator==(const optional_binder& other) const {
        return optional_key() == other.optional_key();
    }

private:
    optional_binder(binder& b, std::optional<qualifier> q, std::source_location loc)
        : binder_(&b) {
        key optional = key::get<optional_of<T>>().with_annotation(q);
        auto element_key = [&](element_kind kind) {
            element_info info;
            info.set_name = optional.to_string();
            info.kind = kind;
            return key::get<T>(qualifier::element(std::move(info)));
        };
        state_ = std::make_shared<const detail::optional_state>(detail::optional_state{
            optional, key::get<T>().with_annotation(q),
            element_key(element_kind::optional_default),
            element_key(element_kind::optional_actual), nullptr, nullptr, std::nullopt});

        b.bind_aggregate(optional, std::make_shared<detail::real_optional_binder<T>>(state_), loc);
        b.bind_aggregate(key::get<optional_provider_of<T>>().with_annotation(q),
                         std::make_shared<detail::real_optional_provider_binder<T>>(state_), loc);
    }

    void bind_direct(std::source_location loc) {
        if (direct_bound_) return;
        direct_bound_ = true;
        binder_->bind_aggregate(state_->direct_key,
                                std::make_shared<detail::real_optional_direct<T>>(state_), loc);
    }

    binder* binder_;
    std::shared_ptr<const detail::optional_state> state_;
    bool direct_bound_ = false;
};

} // namespace bindery
