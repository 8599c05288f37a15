#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bindery.hpp>
#include <memory>
#include <string>
#include <utility>

using namespace bindery;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct IDatabase {
    virtual ~IDatabase() = default;
    virtual std::string Url() const = 0;
};

struct ConfiguredDb : IDatabase {
    using inject = bindery::inject<annotated<std::string, name<"url">>>;
    explicit ConfiguredDb(std::shared_ptr<std::string> u) : url(std::move(u)) {}
    std::string Url() const override { return *url; }
    std::shared_ptr<std::string> url;
};

struct ConnectionPool {};

struct DatabaseModule : private_module {
    void configure(private_binder& b) override {
        b.bind<std::string>(named("url")).to_instance(std::string("postgres://db"));
        b.bind<ConnectionPool>().in<singleton>();
        b.bind<IDatabase>().to<ConfiguredDb>();
        b.expose<IDatabase>();
    }
};

struct Foot {
    std::string side;
};

struct Leg {
    using inject = bindery::inject<Foot>;
    explicit Leg(std::shared_ptr<Foot> f) : foot(std::move(f)) {}
    std::shared_ptr<Foot> foot;
};

/// Binds the same private key differently per instance and exposes a
/// leg under its own name.
struct LegModule : private_module {
    explicit LegModule(std::string side) : side_(std::move(side)) {}

    void configure(private_binder& b) override {
        b.bind<Foot>().to_instance(Foot{side_});
        b.bind<Leg>(named(side_)).to<Leg>();
        b.expose<Leg>(named(side_));
    }

private:
    std::string side_;
};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("PrivateModule: exposed binding is visible outside", "[private]") {
    auto inj = create_injector({std::make_shared<DatabaseModule>()});
    REQUIRE(inj->get_instance<IDatabase>()->Url() == "postgres://db");

    auto binding = inj->get_binding<IDatabase>();
    REQUIRE(std::holds_alternative<exposed_target>(binding->target()));
}

TEST_CASE("PrivateModule: unexposed bindings stay hidden", "[private]") {
    auto inj = create_injector({std::make_shared<DatabaseModule>()});

    REQUIRE_THROWS_AS(inj->get_instance<std::string>(named("url")), configuration_error);
    try {
        inj->get_instance<ConnectionPool>();
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE(e.messages().front().id() == error_id::child_binding_already_set);
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::ContainsSubstring("did you forget to expose the binding?"));
    }
    REQUIRE(inj->get_bindings().size() == 1);
}

TEST_CASE("PrivateModule: same private key bound differently per module", "[private]") {
    auto inj = create_injector({std::make_shared<LegModule>("left"),
                                std::make_shared<LegModule>("right")});

    REQUIRE(inj->get_instance<Leg>(named("left"))->foot->side == "left");
    REQUIRE(inj->get_instance<Leg>(named("right"))->foot->side == "right");
}

TEST_CASE("PrivateModule: exposing an unbound key is reported", "[private]") {
    struct LeakyModule : private_module {
        void configure(private_binder& b) override { b.expose<ConnectionPool>(); }
    };

    try {
        create_injector({std::make_shared<LeakyModule>()});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::bad_exposure);
        REQUIRE(e.messages().front().text()
                == "Could not expose() ConnectionPool, it must be explicitly bound.");
    }
}

TEST_CASE("PrivateModule: private bindings may use the enclosing ones", "[private]") {
    struct ClientModule : private_module {
        void configure(private_binder& b) override {
            b.bind<IDatabase>().to<ConfiguredDb>();
            b.expose<IDatabase>();
        }
    };

    auto inj = create_injector({
        make_module([](binder& b) {
            b.bind<std::string>(named("url")).to_instance(std::string("sqlite://memory"));
        }),
        std::make_shared<ClientModule>()});
    REQUIRE(inj->get_instance<IDatabase>()->Url() == "sqlite://memory");
}

TEST_CASE("PrivateModule: exposed key conflicts with an enclosing binding", "[private]") {
    auto m = make_module([](binder& b) {
        b.bind<IDatabase>().to_provider([] { return std::shared_ptr<IDatabase>(); });
    });

    try {
        create_injector({m, std::make_shared<DatabaseModule>()});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::binding_already_set);
    }
}

TEST_CASE("PrivateModule: exposed singleton is shared", "[private]") {
    struct PoolModule : private_module {
        void configure(private_binder& b) override {
            b.bind<ConnectionPool>().in<singleton>();
            b.expose<ConnectionPool>();
        }
    };

    auto inj = create_injector({std::make_shared<PoolModule>()});
    REQUIRE(inj->get_instance<ConnectionPool>() == inj->get_instance<ConnectionPool>());
}
