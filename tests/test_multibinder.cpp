#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bindery.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace bindery;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct IPlugin {
    virtual ~IPlugin() = default;
    virtual std::string Name() const = 0;
};

struct AuditPlugin : IPlugin {
    std::string Name() const override { return "audit"; }
};

struct MetricsPlugin : IPlugin {
    std::string Name() const override { return "metrics"; }
};

struct PluginHost {
    using inject = bindery::inject<set_of<IPlugin>>;
    explicit PluginHost(std::shared_ptr<set_of<IPlugin>> p) : plugins(std::move(p)) {}
    std::shared_ptr<set_of<IPlugin>> plugins;
};

static std::vector<std::string> values(const set_of<std::string>& set) {
    std::vector<std::string> out;
    for (const auto& v : set) out.push_back(*v);
    return out;
}

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Multibinder: contributions from several modules in order", "[multibinder]") {
    auto m1 = make_module([](binder& b) {
        auto set = multibinder<std::string>::new_set_binder(b);
        set.add_binding().to_instance(std::string("a"));
        set.add_binding().to_instance(std::string("b"));
    });
    auto m2 = make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b).add_binding().to_instance(std::string("c"));
    });

    auto inj = create_injector({m1, m2});
    auto set = inj->get_instance<set_of<std::string>>();
    REQUIRE(values(*set) == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(set->contains("b"));
    REQUIRE_FALSE(set->contains("z"));
}

TEST_CASE("Multibinder: install order decides iteration order", "[multibinder]") {
    auto m1 = make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b).add_binding().to_instance(std::string("a"));
    });
    auto m2 = make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b).add_binding().to_instance(std::string("b"));
    });

    auto forward = create_injector({m1, m2});
    REQUIRE(values(*forward->get_instance<set_of<std::string>>())
            == std::vector<std::string>{"a", "b"});

    auto reversed = create_injector({m2, m1});
    REQUIRE(values(*reversed->get_instance<set_of<std::string>>())
            == std::vector<std::string>{"b", "a"});
}

TEST_CASE("Multibinder: elements may be linked implementations", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        auto set = multibinder<IPlugin>::new_set_binder(b);
        set.add_binding().to<AuditPlugin>();
        set.add_binding().to<MetricsPlugin>();
    })});

    auto host = inj->get_instance<PluginHost>();
    REQUIRE(host->plugins->size() == 2);

    std::vector<std::string> names;
    for (const auto& p : *host->plugins) names.push_back(p->Name());
    REQUIRE(names == std::vector<std::string>{"audit", "metrics"});
}

TEST_CASE("Multibinder: provider set holds one provider per element", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        auto set = multibinder<IPlugin>::new_set_binder(b);
        set.add_binding().to<AuditPlugin>();
        set.add_binding().to<MetricsPlugin>();
    })});

    auto providers = inj->get_instance<provider_set_of<IPlugin>>();
    REQUIRE(providers->size() == 2);
    REQUIRE((*providers)[0].get()->Name() == "audit");
    REQUIRE((*providers)[1].get()->Name() == "metrics");
    // Unscoped elements: every get() builds a fresh plugin.
    REQUIRE((*providers)[0].get() != (*providers)[0].get());
}

TEST_CASE("Multibinder: declared set with no contributions is empty", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b);
    })});
    REQUIRE(inj->get_instance<set_of<std::string>>()->empty());
}

TEST_CASE("Multibinder: undeclared set is not synthesized", "[multibinder]") {
    auto inj = create_injector({});
    REQUIRE_THROWS_AS(inj->get_instance<set_of<std::string>>(), configuration_error);
}

TEST_CASE("Multibinder: equal values from distinct bindings fail", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        auto set = multibinder<std::string>::new_set_binder(b);
        set.add_binding().to_instance(std::string("a"));
        set.add_binding().to_provider([] { return std::make_shared<std::string>("a"); });
    })});

    try {
        inj->get_instance<set_of<std::string>>();
        FAIL("Expected provision_error");
    } catch (const provision_error& e) {
        REQUIRE(e.messages().front().id() == error_id::duplicate_element);
        REQUIRE(e.messages().front().text()
                == "Set injection failed due to duplicated element \"a\"");
    }
}

TEST_CASE("Multibinder: permit_duplicates keeps the first equal value", "[multibinder]") {
    auto m1 = make_module([](binder& b) {
        auto set = multibinder<std::string>::new_set_binder(b);
        set.add_binding().to_instance(std::string("a"));
        set.add_binding().to_provider([] { return std::make_shared<std::string>("a"); });
        set.add_binding().to_instance(std::string("b"));
    });
    auto m2 = make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b).permit_duplicates();
    });

    auto inj = create_injector({m1, m2});
    REQUIRE(values(*inj->get_instance<set_of<std::string>>())
            == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Multibinder: the same contribution from two modules counts once", "[multibinder]") {
    auto contribute = [](binder& b) {
        multibinder<std::string>::new_set_binder(b).add_binding().to_instance(std::string("x"));
    };

    auto inj = create_injector({make_module(contribute), make_module(contribute)});
    auto set = inj->get_instance<set_of<std::string>>();
    REQUIRE(set->size() == 1);
}

TEST_CASE("Multibinder: null element fails provisioning", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b).add_binding().to_provider(
            [] { return std::shared_ptr<std::string>(); });
    })});

    try {
        inj->get_instance<set_of<std::string>>();
        FAIL("Expected provision_error");
    } catch (const provision_error& e) {
        REQUIRE(e.messages().front().id() == error_id::null_element);
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::StartsWith("Set injection failed due to null element bound at: "));
    }
}

TEST_CASE("Multibinder: qualified sets are separate collections", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        multibinder<std::string>::new_set_binder(b).add_binding().to_instance(std::string("guest"));
        multibinder<std::string>::new_set_binder(b, named("admins"))
            .add_binding().to_instance(std::string("root"));
    })});

    REQUIRE(values(*inj->get_instance<set_of<std::string>>())
            == std::vector<std::string>{"guest"});
    REQUIRE(values(*inj->get_instance<set_of<std::string>>(named("admins")))
            == std::vector<std::string>{"root"});
}

TEST_CASE("Multibinder: binders for the same set compare equal", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        auto a = multibinder<std::string>::new_set_binder(b);
        auto c = multibinder<std::string>::new_set_binder(b);
        auto d = multibinder<std::string>::new_set_binder(b, named("other"));
        REQUIRE(a == c);
        REQUIRE_FALSE(a == d);
    })});
    REQUIRE(inj->get_instance<set_of<std::string>>()->empty());
}

TEST_CASE("Multibinder: singleton element is shared across provisions", "[multibinder]") {
    auto inj = create_injector({make_module([](binder& b) {
        multibinder<IPlugin>::new_set_binder(b).add_binding().to<AuditPlugin>().in<singleton>();
    })});

    auto first = inj->get_instance<set_of<IPlugin>>();
    auto second = inj->get_instance<set_of<IPlugin>>();
    REQUIRE(first != second);
    REQUIRE(*first->begin() == *second->begin());
}
