#pragma once

#include "bindery/binder.hpp"
#include "bindery/element.hpp"

#include <vector>

namespace bindery::internal {

/// Evaluates modules with a recording binder.
struct recording {
    /// Elements of `modules` in declaration order.  Contribution ids are
    /// drawn from `next_id`.
    static std::vector<element> record(const module_list& modules, int& next_id,
                                       bool capture_stacktraces);
};

} // namespace bindery::internal
