#include "injector_state.hpp"

#include <string>
#include <utility>
#include <vector>

namespace bindery::internal {

namespace {

/// One binding being provisioned on this thread.
struct frame {
    const key* target;
    const dependency* via;
};

thread_local std::vector<frame> provision_stack;

class frame_guard {
public:
    frame_guard(const key* target, const dependency* via) {
        provision_stack.push_back({target, via});
    }
    ~frame_guard() { provision_stack.pop_back(); }

    frame_guard(const frame_guard&) = delete;
    frame_guard& operator=(const frame_guard&) = delete;
};

/// "while locating K" / "for POINT" lines, innermost first.
std::vector<std::string> current_chain() {
    std::vector<std::string> chain;
    for (auto it = provision_stack.rbegin(); it != provision_stack.rend(); ++it) {
        chain.push_back("while locating " + it->target->to_string());
        if (it->via && !it->via->injection_point.empty()) {
            chain.push_back("for " + it->via->injection_point);
        }
    }
    return chain;
}

} // namespace

instance_ptr call_entry(const entry& target, const dependency* via) {
    frame_guard guard(&target.get_key(), via);
    return target.scoped();
}

argument build_argument(const resolved_dependency& dep) {
    argument arg;
    if (!dep.target) {
        arg.absent = true;
        return arg;
    }
    if (dep.dep.is_provider) {
        arg.lazy = dep.target->external;
        return arg;
    }
    arg.value = call_entry(*dep.target, &dep.dep);
    if (!arg.value && !dep.dep.nullable) {
        frame_guard guard(&dep.target->get_key(), &dep.dep);
        detail::raise_provision_error(null_injected(dep.target->source(), dep.dep));
    }
    return arg;
}

arguments build_arguments(const std::vector<resolved_dependency>& deps) {
    arguments args;
    args.reserve(deps.size());
    for (const auto& dep : deps) args.push_back(build_argument(dep));
    return args;
}

std::shared_ptr<const raw_provider> make_external_provider(const entry_ptr& e) {
    std::weak_ptr<entry> weak = e;
    return std::make_shared<const raw_provider>([weak]() -> instance_ptr {
        auto target = weak.lock();
        if (!target || target->removed) {
            throw di_error("provider used after its binding was discarded");
        }
        if (target->state != link_state::linked) {
            throw di_error("provider for " + target->get_key().to_string()
                           + " used before its binding was linked");
        }
        return call_entry(*target, nullptr);
    });
}

} // namespace bindery::internal

namespace bindery::detail {

void raise_provision_error(message m) {
    throw provision_error({m.with_chain(internal::current_chain())});
}

} // namespace bindery::detail
