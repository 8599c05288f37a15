#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bindery.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace bindery;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct IStorage {
    virtual ~IStorage() = default;
};

struct DiskStorage : IStorage {};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Errors: creation error lists every message", "[errors]") {
    auto m = make_module([](binder& b) {
        b.add_error("first problem");
        b.add_error("second problem");
    });
    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        std::string what = e.what();
        REQUIRE_THAT(what, Catch::Matchers::StartsWith(
            "Unable to create injector, see the following errors:\n\n1) first problem\n  at "));
        REQUIRE_THAT(what, Catch::Matchers::ContainsSubstring("\n\n2) second problem\n  at "));
        REQUIRE_THAT(what, Catch::Matchers::EndsWith("\n\n2 errors"));
    }
}

TEST_CASE("Errors: format_messages numbers messages and counts them", "[errors]") {
    std::vector<message> messages{message(error_id::user_reported, "only one")};
    REQUIRE(format_messages("Configuration errors", messages)
            == "Configuration errors:\n\n1) only one\n\n1 error");
}

TEST_CASE("Errors: provision chain lines are indented", "[errors]") {
    message m = message(error_id::null_injected, "null").with_chain(
        {"while locating Foo", "for the 1st parameter of Bar's constructor", "while locating Bar"});
    REQUIRE(format_messages("Unable to provision, see the following errors", {m})
            == "Unable to provision, see the following errors:\n\n"
               "1) null\n"
               "  while locating Foo\n"
               "    for the 1st parameter of Bar's constructor\n"
               "  while locating Bar\n"
               "\n"
               "1 error");
}

TEST_CASE("Errors: hints are rendered on first read", "[errors]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind<IStorage>(named("primary")).to<DiskStorage>();
    })});

    try {
        inj->get_instance<IStorage>();
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        const auto& msg = e.messages().front();
        REQUIRE_FALSE(msg.is_rendered());
        REQUIRE_THAT(msg.text(), Catch::Matchers::StartsWith("No implementation for IStorage was bound."));
        REQUIRE(msg.is_rendered());
        REQUIRE_THAT(msg.text(), Catch::Matchers::ContainsSubstring(
            "Did you mean?\n    * IStorage annotated with @named(\"primary\") bound at "));
    }
}

TEST_CASE("Errors: unannotated generic type gets an annotation hint", "[errors]") {
    auto inj = create_injector({});
    try {
        inj->get_instance<std::string>();
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE_THAT(e.messages().front().text(), Catch::Matchers::EndsWith(
            "The key seems very generic, did you forget an annotation?"));
    }
}

TEST_CASE("Errors: many candidates are summarized", "[errors]") {
    auto inj = create_injector({make_module([](binder& b) {
        for (const char* n : {"a", "b", "c", "d", "e"}) {
            b.bind<int>(named(n)).to_instance(1);
        }
    })});
    try {
        inj->get_instance<int>();
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE_THAT(e.messages().front().text(),
                     Catch::Matchers::EndsWith("* 2 more bindings with other annotations."));
    }
}

TEST_CASE("Errors: concurrent readers see the same text", "[errors]") {
    auto inj = create_injector({make_module([](binder& b) {
        b.bind<IStorage>(named("primary")).to<DiskStorage>();
    })});

    std::vector<message> messages;
    try {
        inj->get_instance<IStorage>();
    } catch (const configuration_error& e) {
        messages = e.messages();
    }
    REQUIRE(messages.size() == 1);

    constexpr int N = 8;
    std::vector<std::string> seen(N);
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < N; ++i) {
            threads.emplace_back([&, i] { seen[i] = messages.front().text(); });
        }
    }
    for (const auto& s : seen) REQUIRE(s == seen.front());
}

TEST_CASE("Errors: registration stacktraces are captured on request", "[errors]") {
    auto m = make_module([](binder& b) {
        b.bind<int>(named("port")).to_instance(1);
        b.bind<int>(named("port")).to_instance(2);
    });

    try {
        create_injector({m}, {.capture_stacktraces = true});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE_THAT(e.full_diagnostic(),
                     Catch::Matchers::ContainsSubstring("Registration stacktrace for "));
        REQUIRE_THAT(e.full_diagnostic(), Catch::Matchers::StartsWith(e.what()));
    }
}

TEST_CASE("Errors: no stacktraces unless requested", "[errors]") {
    auto m = make_module([](binder& b) {
        b.bind<int>(named("port")).to_instance(1);
        b.bind<int>(named("port")).to_instance(2);
    });

    try {
        create_injector({m});
        FAIL("Expected creation_error");
    } catch (const creation_error& e) {
        REQUIRE(e.full_diagnostic() == std::string(e.what()));
    }
}

TEST_CASE("Errors: di_error appends the throw site", "[errors]") {
    di_error e("something failed");
    REQUIRE_THAT(std::string(e.what()), Catch::Matchers::StartsWith("something failed [at "));
    REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("test_errors.cpp"));
    REQUIRE(e.full_diagnostic() == std::string(e.what()));

    e.set_diagnostic_detail("detail");
    REQUIRE_THAT(e.full_diagnostic(), Catch::Matchers::EndsWith("\ndetail"));
}

TEST_CASE("Errors: error ids have stable names", "[errors]") {
    REQUIRE(to_string(error_id::binding_already_set) == "binding_already_set");
    REQUIRE(to_string(error_id::missing_implementation) == "missing_implementation");
    REQUIRE(to_string(error_id::out_of_scope) == "out_of_scope");
}

TEST_CASE("Errors: messages compare by id, text and sources", "[errors]") {
    message a(error_id::user_reported, "x");
    message b(error_id::user_reported, "x");
    message c(error_id::user_reported, "y");
    message d(error_id::module_exception, "x");
    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(a == d);
}
