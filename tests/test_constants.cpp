#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bindery.hpp>
#include <memory>
#include <string>

using namespace bindery;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct Port {};

struct Duration {
    int seconds = 0;
};

struct Server {
    using inject = bindery::inject<annotated<int, Port>, annotated<bool, name<"tls">>>;
    Server(std::shared_ptr<int> p, std::shared_ptr<bool> t) : port(*p), tls(*t) {}
    int port;
    bool tls;
};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Constants: string constant converts to arithmetic types", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind_constant().annotated_with<Port>().to("8080");
        b.bind_constant().annotated_with(named("tls")).to("TRUE");
        b.bind_constant().annotated_with(named("ratio")).to("0.75");
    })});

    REQUIRE(*inj->get_instance<int>(qualifier::of<Port>()) == 8080);
    REQUIRE(*inj->get_instance<long>(qualifier::of<Port>()) == 8080L);
    REQUIRE(*inj->get_instance<bool>(named("tls")));
    REQUIRE(*inj->get_instance<double>(named("ratio")) == 0.75);
    REQUIRE(*inj->get_instance<std::string>(qualifier::of<Port>()) == "8080");
}

TEST_CASE("Constants: converted constants reach constructors", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind_constant().annotated_with<Port>().to("443");
        b.bind_constant().annotated_with(named("tls")).to("true");
    })});

    auto server = inj->get_instance<Server>();
    REQUIRE(server->port == 443);
    REQUIRE(server->tls);

    auto binding = inj->get_binding<int>(qualifier::of<Port>());
    const auto* converted = std::get_if<converted_constant_target>(&binding->target());
    REQUIRE(converted != nullptr);
    REQUIRE(converted->text == "443");
    REQUIRE(converted->source_key == key::get<std::string>(qualifier::of<Port>()));
}

TEST_CASE("Constants: arithmetic constants bind directly", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind_constant().annotated_with(named("retries")).to(3);
        b.bind_constant().annotated_with(named("factor")).to(2.5);
    })});

    REQUIRE(*inj->get_instance<int>(named("retries")) == 3);
    REQUIRE(*inj->get_instance<double>(named("factor")) == 2.5);
    REQUIRE(std::holds_alternative<instance_target>(
        inj->get_binding<int>(named("retries"))->target()));
}

TEST_CASE("Constants: unparsable text is a conversion error", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind_constant().annotated_with<Port>().to("abc");
    })});

    try {
        inj->get_instance<int>(qualifier::of<Port>());
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        const auto& msg = e.messages().front();
        REQUIRE(msg.id() == error_id::conversion_error);
        REQUIRE_THAT(msg.text(), Catch::Matchers::StartsWith("Error converting 'abc' (bound at "));
        REQUIRE_THAT(msg.text(), Catch::Matchers::EndsWith(
            ") to int.\n Reason: for input string: \"abc\""));
    }
}

TEST_CASE("Constants: out of range text is a conversion error", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind_constant().annotated_with<Port>().to("99999999999999999999");
    })});

    try {
        inj->get_instance<int>(qualifier::of<Port>());
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::EndsWith("Reason: value out of range"));
    }
}

TEST_CASE("Constants: user converter handles its type", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.convert_to<Duration>([](const std::string& text) {
            return Duration{std::stoi(text)};
        });
        b.bind_constant().annotated_with(named("timeout")).to("30");
    })});

    REQUIRE(inj->get_instance<Duration>(named("timeout"))->seconds == 30);
}

TEST_CASE("Constants: throwing converter is reported with its cause", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.convert_to<Duration>([](const std::string& text) {
            return Duration{std::stoi(text)};
        });
        b.bind_constant().annotated_with(named("timeout")).to("soon");
    })});

    try {
        inj->get_instance<Duration>(named("timeout"));
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE(e.messages().front().id() == error_id::conversion_error);
        REQUIRE(e.messages().front().cause() != nullptr);
    }
}

TEST_CASE("Constants: converter returning null is reported", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.convert_to<Duration>([](const std::string&) { return std::shared_ptr<Duration>(); });
        b.bind_constant().annotated_with(named("timeout")).to("30");
    })});

    try {
        inj->get_instance<Duration>(named("timeout"));
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE(e.messages().front().id() == error_id::converter_returned_null);
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::StartsWith("Received null converting '30' (bound at "));
    }
}

TEST_CASE("Constants: overlapping converters are ambiguous", "[constants]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.convert_to<Duration>([](const std::string& t) { return Duration{std::stoi(t)}; });
        b.convert_to<Duration>([](const std::string& t) { return Duration{std::stoi(t) * 60}; });
        b.bind_constant().annotated_with(named("timeout")).to("1");
    })});

    try {
        inj->get_instance<Duration>(named("timeout"));
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        const auto& msg = e.messages().front();
        REQUIRE(msg.id() == error_id::ambiguous_conversion);
        REQUIRE_THAT(msg.text(), Catch::Matchers::StartsWith("Multiple converters can convert '1'"));
        REQUIRE_THAT(msg.text(), Catch::Matchers::EndsWith(
            "Please adjust your type converter configuration to avoid overlapping matches."));
    }
}

TEST_CASE("Constants: constants must be annotated", "[constants]") {
    auto m = make_module([](binder& b) { b.bind_constant().to("8080"); });
    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::missing_constant_annotation);
    }
}

TEST_CASE("Constants: conversion failure during creation fails creation", "[constants]") {
    auto m = make_module([](binder& b) {
        b.bind_constant().annotated_with<Port>().to("http");
        b.bind<Server>();
        b.bind_constant().annotated_with(named("tls")).to("false");
    });
    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.messages().front().id() == error_id::conversion_error);
    }
}
