#pragma once

#include "fwd.hpp"

#include <memory>
#include <utility>

namespace bindery {

/// Lazy handle to one binding of an injector.  Copies compare equal;
/// two providers obtained for the same key of the same injector compare
/// equal as well.
template <typename T>
class provider {
public:
    provider() = default;
    explicit provider(std::shared_ptr<const raw_provider> fn) noexcept
        : fn_(std::move(fn)) {}

    /// Provision an instance.  Unscoped bindings produce a fresh one on
    /// every call.
    std::shared_ptr<T> get() const {
        return std::static_pointer_cast<T>((*fn_)());
    }

    std::shared_ptr<T> operator()() const { return get(); }

    explicit operator bool() const noexcept { return fn_ != nullptr; }

    const std::shared_ptr<const raw_provider>& raw() const noexcept { return fn_; }

    bool operator==(const provider& other) const noexcept { return fn_ == other.fn_; }

private:
    std::shared_ptr<const raw_provider> fn_;
};

} // namespace bindery
