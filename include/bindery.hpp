#pragma once

/// @file bindery.hpp
/// Umbrella header for the bindery dependency-injection library.

#include "bindery/export.hpp"
#include "bindery/fwd.hpp"
#include "bindery/stage.hpp"
#include "bindery/key.hpp"
#include "bindery/dependency.hpp"
#include "bindery/provider.hpp"
#include "bindery/type_traits.hpp"
#include "bindery/introspector.hpp"
#include "bindery/scope.hpp"
#include "bindery/element_source.hpp"
#include "bindery/exceptions.hpp"
#include "bindery/binding.hpp"
#include "bindery/element.hpp"
#include "bindery/binder.hpp"
#include "bindery/multibinder.hpp"
#include "bindery/injector.hpp"
