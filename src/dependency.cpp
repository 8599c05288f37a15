#include "bindery/dependency.hpp"

#include <string>

namespace bindery {

namespace internal {

std::string ordinal(int n) {
    const char* suffix = "th";
    if (n % 100 < 11 || n % 100 > 13) {
        switch (n % 10) {
        case 1: suffix = "st"; break;
        case 2: suffix = "nd"; break;
        case 3: suffix = "rd"; break;
        default: break;
        }
    }
    return std::to_string(n) + suffix;
}

std::string parameter_point(int index, const std::string& owner) {
    return "the " + ordinal(index + 1) + " parameter of " + owner;
}

} // namespace internal

std::string dependency::to_string() const {
    std::string out = target.to_string();
    if (is_provider) out = "provider<" + out + ">";
    if (optional) out += " (optional)";
    else if (nullable) out += " (nullable)";
    if (!injection_point.empty()) out += " for " + injection_point;
    return out;
}

} // namespace bindery
