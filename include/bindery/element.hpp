#pragma once

#include "export.hpp"
#include "fwd.hpp"
#include "binding.hpp"
#include "element_source.hpp"
#include "exceptions.hpp"
#include "key.hpp"

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <variant>
#include <vector>

namespace bindery {

/// `bind_scope<A>(s)`: scope annotation A is implemented by s.
struct scope_binding {
    std::type_index annotation;
    std::shared_ptr<bindery::scope> scope;
    element_source source;
};

/// `require_binding(k)`: k must be resolvable when the injector is built.
struct require_binding_statement {
    bindery::key target;
    element_source source;
};

/// Converts string constants to a target type.  Returns null to signal
/// "received null".
struct type_converter_binding {
    std::type_index type;
    std::function<instance_ptr(const std::string&)> convert;
    element_source source;
};

using element = std::variant<std::shared_ptr<const binding>,
                             message,
                             scope_binding,
                             std::shared_ptr<const private_elements>,
                             require_binding_statement,
                             type_converter_binding>;

/// One `expose()` call of a private module.
struct exposure {
    bindery::key target;
    element_source source;
};

/// Elements of a private module: bindings visible only inside it,
/// plus the keys it re-exports to the enclosing environment.
struct private_elements {
    std::vector<element> elements;
    std::vector<exposure> exposed;
    element_source source;
};

/// Evaluate modules into their elements without building an injector.
BINDERY_EXPORT std::vector<element> get_elements(const module_list& modules);

} // namespace bindery
