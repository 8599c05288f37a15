#include "bindery/binding.hpp"
#include "bindery/element.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace bindery {

binding::binding(bindery::key k, element_source source, binding_target target,
                 bindery::scoping scoping)
    : key_(std::move(k))
    , source_(std::move(source))
    , target_(std::move(target))
    , scoping_(std::move(scoping))
{}

std::vector<dependency> binding::dependencies() const {
    return std::visit([](const auto& t) -> std::vector<dependency> {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, linked_key_target>) {
            return {dependency{t.target}};
        } else if constexpr (std::is_same_v<T, provider_key_target>) {
            return {dependency{t.provider_key}};
        } else if constexpr (std::is_same_v<T, provider_instance_target>) {
            return t.provider->dependencies();
        } else if constexpr (std::is_same_v<T, constructor_target>) {
            std::vector<dependency> out = t.constructor.dependencies;
            for (const auto& m : t.members) out.push_back(m.target);
            return out;
        } else {
            return {};
        }
    }, target_);
}

bool binding::same_target(const binding& other) const {
    if (!(scoping_ == other.scoping_) || target_.index() != other.target_.index()) {
        return false;
    }
    return std::visit([&](const auto& t) -> bool {
        using T = std::decay_t<decltype(t)>;
        const auto& o = std::get<T>(other.target_);
        if constexpr (std::is_same_v<T, untargetted_target>) {
            return true;
        } else if constexpr (std::is_same_v<T, instance_target>) {
            if (t.value == o.value) return true;
            return t.ops && t.ops == o.ops && t.ops->equals(t.value.get(), o.value.get());
        } else if constexpr (std::is_same_v<T, linked_key_target>) {
            return t.target == o.target;
        } else if constexpr (std::is_same_v<T, provider_key_target>) {
            return t.provider_key == o.provider_key;
        } else if constexpr (std::is_same_v<T, provider_instance_target>) {
            return t.provider == o.provider || t.provider->equals(*o.provider);
        } else if constexpr (std::is_same_v<T, constructor_target>) {
            return t.implementation == o.implementation
                && t.constructor.signature == o.constructor.signature;
        } else if constexpr (std::is_same_v<T, converted_constant_target>) {
            return t.source_key == o.source_key && t.text == o.text;
        } else {
            return t.environment == o.environment;
        }
    }, target_);
}

std::string binding::target_description() const {
    return std::visit([](const auto& t) -> std::string {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, untargetted_target>) {
            return "untargetted";
        } else if constexpr (std::is_same_v<T, instance_target>) {
            return "instance " + (t.ops ? t.ops->describe(t.value.get()) : std::string("?"));
        } else if constexpr (std::is_same_v<T, linked_key_target>) {
            return "linked to " + t.target.to_string();
        } else if constexpr (std::is_same_v<T, provider_key_target>) {
            return "provided by " + t.provider_key.to_string();
        } else if constexpr (std::is_same_v<T, provider_instance_target>) {
            return "provided by " + t.provider->to_string();
        } else if constexpr (std::is_same_v<T, constructor_target>) {
            return "constructed as " + t.implementation.to_string();
        } else if constexpr (std::is_same_v<T, converted_constant_target>) {
            return "converted from '" + t.text + "'";
        } else {
            return "exposed from private module " + t.environment->source.to_string();
        }
    }, target_);
}

std::string binding::to_string() const {
    std::string out = key_.to_string() + " -> " + target_description();
    if (scoping_.is_explicitly_scoped()) out += " in " + scoping_.to_string();
    return out + " at " + source_.to_string();
}

} // namespace bindery
