#include "bindery/element_source.hpp"

#include <any>

#include <boost/stacktrace.hpp>

namespace bindery::internal {

std::any capture_stacktrace() {
    return std::any(boost::stacktrace::stacktrace());
}

} // namespace bindery::internal
