#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bindery.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace bindery;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct IConcurrent {
    virtual ~IConcurrent() = default;
};

struct ConcurrentImpl : IConcurrent {
    static std::atomic<int> construct_count;
    ConcurrentImpl() {
        ++construct_count;
        // Sleep briefly to widen the race window
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
};
std::atomic<int> ConcurrentImpl::construct_count{0};

struct Counted {
    static std::atomic<int> construct_count;
    Counted() { ++construct_count; }
};
std::atomic<int> Counted::construct_count{0};

struct EagerCounted {
    static std::atomic<int> construct_count;
    EagerCounted() { ++construct_count; }
};
std::atomic<int> EagerCounted::construct_count{0};

struct Flaky {
    static std::atomic<int> attempts;
    Flaky() {
        if (++attempts == 1) throw std::runtime_error("first attempt fails");
    }
};
std::atomic<int> Flaky::attempts{0};

struct RequestScoped {};
struct SessionScoped {};

struct RequestContext {
    using inject = bindery::inject<Counted>;
    explicit RequestContext(std::shared_ptr<Counted> c) : counted(std::move(c)) {}
    std::shared_ptr<Counted> counted;
};

/// Caches one instance per key until reset; outside enter()/exit()
/// it throws out_of_scope_error.
class RequestScope : public scope {
public:
    raw_provider scope_provider(const key& k, raw_provider unscoped) override {
        return [this, k, unscoped]() -> instance_ptr {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!active_) throw out_of_scope_error("Cannot access " + k.to_string() + " outside of a request");
                auto it = cache_.find(k);
                if (it != cache_.end()) return it->second;
            }
            // Not under mutex_: construction may re-enter this scope or
            // wait for the injector's lock.
            auto value = unscoped();
            std::lock_guard<std::mutex> lock(mutex_);
            return cache_.emplace(k, value).first->second;
        };
    }

    std::string to_string() const override { return "RequestScope"; }

    void enter() {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = true;
    }

    void exit() {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        cache_.clear();
    }

private:
    std::mutex mutex_;
    bool active_ = false;
    std::unordered_map<key, instance_ptr> cache_;
};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Scopes: singleton constructed once under contention", "[scopes]") {
    ConcurrentImpl::construct_count = 0;

    auto inj = create_injector({make_module([](binder& b) {
        b.bind<IConcurrent>().to<ConcurrentImpl>().in<singleton>();
    })});

    constexpr std::size_t N = 32;
    std::vector<std::jthread> threads;
    std::vector<std::shared_ptr<IConcurrent>> results(N);

    for (std::size_t i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            results[i] = inj->get_instance<IConcurrent>();
        });
    }
    threads.clear();

    REQUIRE(ConcurrentImpl::construct_count == 1);
    for (const auto& r : results) {
        REQUIRE(r == results[0]);
    }
}

TEST_CASE("Scopes: unscoped bindings produce fresh instances", "[scopes]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind<IConcurrent>().to<ConcurrentImpl>();
    })});
    REQUIRE(inj->get_instance<IConcurrent>() != inj->get_instance<IConcurrent>());
}

TEST_CASE("Scopes: singleton on the linked key is shared by its aliases", "[scopes]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind<ConcurrentImpl>().in<singleton>();
        b.bind<IConcurrent>().to<ConcurrentImpl>();
    })});
    auto direct = inj->get_instance<ConcurrentImpl>();
    REQUIRE(inj->get_instance<IConcurrent>().get() == direct.get());
}

TEST_CASE("Scopes: development stage creates only eager singletons", "[scopes]") {
    Counted::construct_count = 0;
    EagerCounted::construct_count = 0;

    auto inj = create_injector({make_module([](binder& b) {
        b.bind<Counted>().in<singleton>();
        b.bind<EagerCounted>().as_eager_singleton();
    })});

    REQUIRE(Counted::construct_count == 0);
    REQUIRE(EagerCounted::construct_count == 1);

    inj->get_instance<EagerCounted>();
    REQUIRE(EagerCounted::construct_count == 1);
}

TEST_CASE("Scopes: production stage creates every singleton", "[scopes]") {
    Counted::construct_count = 0;
    EagerCounted::construct_count = 0;

    auto inj = create_injector({make_module([](binder& b) {
        b.bind<Counted>().in<singleton>();
        b.bind<EagerCounted>().as_eager_singleton();
    })}, {.stage = stage::production});

    REQUIRE(Counted::construct_count == 1);
    REQUIRE(EagerCounted::construct_count == 1);
}

TEST_CASE("Scopes: tool stage creates nothing", "[scopes]") {
    EagerCounted::construct_count = 0;

    auto inj = create_injector({make_module([](binder& b) {
        b.bind<EagerCounted>().as_eager_singleton();
    })}, {.stage = stage::tool});

    REQUIRE(EagerCounted::construct_count == 0);
}

TEST_CASE("Scopes: failed singleton construction is not cached", "[scopes]") {
    Flaky::attempts = 0;

    auto inj = create_injector({make_module([](binder& b) {
        b.bind<Flaky>().in<singleton>();
    })});

    REQUIRE_THROWS_AS(inj->get_instance<Flaky>(), provision_error);
    auto second = inj->get_instance<Flaky>();
    REQUIRE(second != nullptr);
    REQUIRE(inj->get_instance<Flaky>() == second);
    REQUIRE(Flaky::attempts == 2);
}

TEST_CASE("Scopes: eager singleton failure fails creation", "[scopes]") {
    Flaky::attempts = 0;

    auto m = make_module([](binder& b) { b.bind<Flaky>().as_eager_singleton(); });
    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::error_injecting_constructor);
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::ContainsSubstring("first attempt fails"));
    }
}

TEST_CASE("Scopes: custom scope bound to an annotation", "[scopes]") {
    auto request = std::make_shared<RequestScope>();

    auto inj = create_injector({make_module([request](binder& b) {
        b.bind_scope<RequestScoped>(request);
        b.bind<Counted>().in<RequestScoped>();
    })});

    request->enter();
    auto first = inj->get_instance<Counted>();
    REQUIRE(inj->get_instance<Counted>() == first);
    request->exit();

    request->enter();
    REQUIRE(inj->get_instance<Counted>() != first);
    request->exit();
}

TEST_CASE("Scopes: custom scoped binding may depend on the same scope", "[scopes]") {
    auto request = std::make_shared<RequestScope>();

    auto inj = create_injector({make_module([request](binder& b) {
        b.bind_scope<RequestScoped>(request);
        b.bind<Counted>().in<RequestScoped>();
        b.bind<RequestContext>().in<RequestScoped>();
    })});

    request->enter();
    auto context = inj->get_instance<RequestContext>();
    REQUIRE(context->counted == inj->get_instance<Counted>());
    REQUIRE(inj->get_instance<RequestContext>() == context);
    request->exit();
}

TEST_CASE("Scopes: scope instance used directly", "[scopes]") {
    auto request = std::make_shared<RequestScope>();

    auto inj = create_injector({make_module([request](binder& b) {
        b.bind<Counted>().in(request);
    })});

    request->enter();
    REQUIRE(inj->get_instance<Counted>() == inj->get_instance<Counted>());
    request->exit();
}

TEST_CASE("Scopes: annotation without a bound scope is reported", "[scopes]") {
    auto m = make_module([](binder& b) { b.bind<Counted>().in<SessionScoped>(); });
    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::scope_not_found);
        REQUIRE(e.messages().front().text() == "No scope is bound to SessionScoped.");
    }
}

TEST_CASE("Scopes: out-of-scope access propagates to the caller", "[scopes]") {
    auto request = std::make_shared<RequestScope>();

    auto inj = create_injector({make_module([request](binder& b) {
        b.bind_scope<RequestScoped>(request);
        b.bind<Counted>().in<RequestScoped>();
    })});

    REQUIRE_THROWS_AS(inj->get_instance<Counted>(), out_of_scope_error);
}

TEST_CASE("Scopes: out-of-scope during eager creation fails creation", "[scopes]") {
    struct NeedsRequest {
        using inject = bindery::inject<Counted>;
        explicit NeedsRequest(std::shared_ptr<Counted>) {}
    };

    auto request = std::make_shared<RequestScope>();
    auto m = make_module([request](binder& b) {
        b.bind_scope<RequestScoped>(request);
        b.bind<Counted>().in<RequestScoped>();
        b.bind<NeedsRequest>().as_eager_singleton();
    });

    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::out_of_scope);
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::ContainsSubstring("outside of a request"));
    }
}
