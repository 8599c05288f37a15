#include "injector_state.hpp"

#include <algorithm>
#include <string>

namespace bindery::internal {

state_aggregation_context::state_aggregation_context(const injector_state& state)
    : state_(state)
{
    bindings_.reserve(state.explicit_order.size());
    for (const auto& e : state.explicit_order) bindings_.push_back(e->definition);
}

const std::vector<std::shared_ptr<const binding>>& state_aggregation_context::bindings() const {
    return bindings_;
}

std::shared_ptr<const binding> state_aggregation_context::find(const key& k) const {
    auto e = state_.find_explicit(k);
    return e ? e->definition : nullptr;
}

} // namespace bindery::internal

namespace bindery::detail {

namespace {

bool same_map_key(const element_info& a, const element_info& b) {
    if (!a.map_key_ops || !b.map_key_ops) return a.map_key_ops == b.map_key_ops;
    return a.map_key_ops->equals(a.map_key.get(), b.map_key.get());
}

} // namespace

std::vector<std::shared_ptr<const binding>>
select_contributions(const aggregation_context& ctx, const element_info& collection,
                     std::type_index element_type) {
    std::vector<std::shared_ptr<const binding>> out;
    for (const auto& b : ctx.bindings()) {
        const element_info* info = b->get_key().element();
        if (!info || !info->same_collection(collection)) continue;
        if (b->get_key().type_index() != element_type) continue;

        // The same contribution installed twice counts once.
        bool repeated = std::any_of(out.begin(), out.end(), [&](const auto& seen) {
            return seen->same_target(*b) && same_map_key(*seen->get_key().element(), *info);
        });
        if (!repeated) out.push_back(b);
    }
    return out;
}

key permit_key(const element_info& collection) {
    element_info info;
    info.set_name = collection.set_name;
    info.kind = element_kind::permit_duplicates;
    info.key_type = collection.key_type;
    return key::get<permit_marker>(qualifier::element(std::move(info)));
}

bool permits_duplicates(const aggregation_context& ctx, const element_info& collection) {
    return ctx.find(permit_key(collection)) != nullptr;
}

message null_set_element(const binding& element) {
    return message(error_id::null_element,
                   "Set injection failed due to null element bound at: "
                       + element.source().to_string(),
                   {element.source()});
}

message duplicate_set_element(const std::string& rendered) {
    return message(error_id::duplicate_element,
                   "Set injection failed due to duplicated element \"" + rendered + "\"");
}

message duplicate_map_keys(
    const std::vector<std::pair<std::string, std::vector<duplicate_map_entry>>>& dups) {
    std::string text = "Map injection failed due to duplicated key ";
    std::vector<element_source> sources;
    bool first = true;
    for (const auto& [rendered, entries] : dups) {
        text += first ? "\"" : "\n and key: \"";
        text += rendered + "\", from bindings:\n";
        first = false;
        for (std::size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) text += '\n';
            const element_source& source = entries[i].element->source();
            text += "\t at " + source.to_string() + " (" + entries[i].value + ")";
            sources.push_back(source);
        }
        text += '\n';
    }
    return message(error_id::duplicate_map_key, std::move(text), std::move(sources));
}

message null_map_value(const std::string& rendered_key, const binding& value) {
    return message(error_id::null_value_in_map,
                   "Map injection failed due to null value for key \"" + rendered_key
                       + "\", bound at: " + value.source().to_string(),
                   {value.source()});
}

message null_multimap_value(const std::string& rendered_key, const binding& value) {
    return message(error_id::null_value_in_map,
                   "Multimap injection failed due to null value for key \"" + rendered_key + "\"",
                   {value.source()});
}

std::string element_point(int index, const key& collection) {
    return "the " + internal::ordinal(index + 1) + " element of " + collection.to_string();
}

} // namespace bindery::detail
