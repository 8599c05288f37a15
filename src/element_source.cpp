#include "bindery/element_source.hpp"

#include <string>

namespace bindery {

std::string element_source::to_string() const {
    std::string out;
    if (has_location()) {
        out = std::string(location.file_name()) + ":" + std::to_string(location.line());
    } else if (!declaring.empty()) {
        out = declaring;
    } else {
        out = "[unknown source]";
    }
    if (!module_stack.empty()) {
        out += " (via modules: ";
        for (std::size_t i = 0; i < module_stack.size(); ++i) {
            if (i > 0) out += " -> ";
            out += module_stack[i];
        }
        out += ")";
    }
    return out;
}

} // namespace bindery
