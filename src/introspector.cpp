#include "bindery/introspector.hpp"

namespace bindery {

std::optional<type_description> type_introspector::introspect(const type_handle& type) const {
    type_description out;
    if (!type.describe || !type.describe(out)) return std::nullopt;
    return out;
}

} // namespace bindery
