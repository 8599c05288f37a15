#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace bindery {

// Forward declarations
class key;
class qualifier;
class binding;
class binder;
class private_binder;
class module;
class private_module;
class injector;
class scope;
class message;
class introspector;
class provider_instance;
class multibinder_binding;
class map_binder_binding;
class optional_binder_binding;

struct element_source;
struct dependency;
struct type_description;
struct injector_options;
struct private_elements;

template <typename T>
class provider;

template <typename T>
class binding_builder;

template <typename R>
class binding_target_visitor;

template <typename R>
class multibindings_target_visitor;

/// Type-erased instance.  The stored pointer always points at the object
/// viewed as the type of the key it was provisioned for.
using instance_ptr = std::shared_ptr<void>;

/// Type-erased unscoped or scoped provisioning function.
using raw_provider = std::function<instance_ptr()>;

using module_ptr = std::shared_ptr<module>;
using module_list = std::vector<module_ptr>;

} // namespace bindery
