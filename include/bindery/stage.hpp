#pragma once

#include <string_view>

namespace bindery {

/// Injector stage.  Decides which singletons are created while the
/// injector is built:
///   tool: none; the injector is only inspected
///   development: only bindings marked as_eager_singleton()
///   production: every singleton-scoped binding
enum class stage {
    tool,
    development,
    production
};

constexpr std::string_view to_string(stage s) noexcept {
    constexpr std::string_view names[] = {"tool", "development", "production"};
    return names[static_cast<int>(s)];
}

} // namespace bindery
