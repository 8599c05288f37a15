#include "bindery/scope.hpp"
#include "bindery/key.hpp"

#include <typeindex>

namespace bindery {

scoping scoping::for_annotation(std::type_index annotation) {
    if (annotation == std::type_index(typeid(bindery::singleton))) {
        return singleton();
    }
    return {scoping_kind::annotation, annotation, nullptr};
}

scoping scoping::for_instance(std::shared_ptr<bindery::scope> s) {
    return {scoping_kind::instance, std::nullopt, std::move(s)};
}

std::string scoping::to_string() const {
    switch (kind) {
    case scoping_kind::annotation:
        return "@" + internal::demangle(*annotation);
    case scoping_kind::instance:
        return instance ? instance->to_string() : std::string("null scope");
    default:
        return std::string(bindery::to_string(kind));
    }
}

} // namespace bindery
