#include "bindery/key.hpp"

#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace bindery {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

std::size_t hash_combine(std::size_t seed, std::size_t value) noexcept {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace internal

std::string_view to_string(element_kind kind) noexcept {
    switch (kind) {
    case element_kind::multibinder:       return "multibinder";
    case element_kind::mapbinder:         return "mapbinder";
    case element_kind::optional_default:  return "optional default";
    case element_kind::optional_actual:   return "optional actual";
    case element_kind::permit_duplicates: return "permit duplicates";
    }
    return "unknown";
}

// ---------------------------------------------------------------
// qualifier
// ---------------------------------------------------------------

qualifier::qualifier(kind k, std::type_index marker, std::string value,
                     std::shared_ptr<const element_info> element)
    : kind_(k)
    , marker_(marker)
    , value_(std::move(value))
    , element_(std::move(element))
{
    hash_ = std::hash<int>{}(static_cast<int>(kind_));
    switch (kind_) {
    case kind::marker:
        hash_ = internal::hash_combine(hash_, marker_.hash_code());
        break;
    case kind::named:
        hash_ = internal::hash_combine(hash_, std::hash<std::string>{}(value_));
        break;
    case kind::element:
        hash_ = internal::hash_combine(hash_, std::hash<std::string>{}(element_->set_name));
        hash_ = internal::hash_combine(hash_, std::hash<int>{}(element_->unique_id));
        hash_ = internal::hash_combine(hash_, static_cast<std::size_t>(element_->kind));
        if (element_->key_type) {
            hash_ = internal::hash_combine(hash_, element_->key_type->hash_code());
        }
        break;
    }
}

qualifier qualifier::named(std::string value) {
    return qualifier(kind::named, std::type_index(typeid(void)), std::move(value), nullptr);
}

qualifier qualifier::element(element_info info) {
    return qualifier(kind::element, std::type_index(typeid(void)), {},
                     std::make_shared<const element_info>(std::move(info)));
}

std::string qualifier::to_string() const {
    switch (kind_) {
    case kind::marker:
        return "@" + internal::demangle(marker_);
    case kind::named:
        return "@named(\"" + value_ + "\")";
    case kind::element: {
        std::string out = "@element(set=" + element_->set_name
                          + ", id=" + std::to_string(element_->unique_id)
                          + ", kind=" + std::string(bindery::to_string(element_->kind));
        if (element_->map_key_ops) out += ", key=" + element_->describe_map_key();
        return out + ")";
    }
    }
    return {};
}

bool qualifier::operator==(const qualifier& other) const noexcept {
    if (kind_ != other.kind_ || hash_ != other.hash_) return false;
    switch (kind_) {
    case kind::marker:
        return marker_ == other.marker_;
    case kind::named:
        return value_ == other.value_;
    case kind::element:
        return element_->same_collection(*other.element_)
            && element_->unique_id == other.element_->unique_id;
    }
    return false;
}

// ---------------------------------------------------------------
// key
// ---------------------------------------------------------------

key::key(const type_handle* type, std::optional<qualifier> q)
    : type_(type)
    , annotation_(std::move(q))
{
    hash_ = type_->type.hash_code();
    if (annotation_) hash_ = internal::hash_combine(hash_, annotation_->hash());
}

std::string key::to_string() const {
    std::string out = type_->name();
    if (annotation_) out += " annotated with " + annotation_->to_string();
    return out;
}

bool key::operator==(const key& other) const noexcept {
    return hash_ == other.hash_ && type_->type == other.type_->type
        && annotation_ == other.annotation_;
}

std::ostream& operator<<(std::ostream& os, const key& k) {
    return os << k.to_string();
}

} // namespace bindery
