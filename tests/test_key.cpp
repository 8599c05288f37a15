#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bindery.hpp>
#include <string>
#include <unordered_set>

using namespace bindery;

// ---------------------------------------------------------------
// Test types
// ---------------------------------------------------------------

struct IDatabase {
    virtual ~IDatabase() = default;
};

struct Primary {};
struct Secondary {};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Key: same type and qualifier are equal", "[key]") {
    REQUIRE(key::get<IDatabase>() == key::get<IDatabase>());
    REQUIRE(key::annotated<IDatabase, Primary>() == key::get<IDatabase>(qualifier::of<Primary>()));
    REQUIRE(key::get<int>(named("port")) == key::get<int>(named("port")));
}

TEST_CASE("Key: qualifier and type both participate in equality", "[key]") {
    REQUIRE_FALSE(key::get<IDatabase>() == key::annotated<IDatabase, Primary>());
    REQUIRE_FALSE(key::annotated<IDatabase, Primary>() == key::annotated<IDatabase, Secondary>());
    REQUIRE_FALSE(key::get<int>(named("port")) == key::get<long>(named("port")));
    REQUIRE_FALSE(key::get<int>(named("port")) == key::get<int>(named("timeout")));
}

TEST_CASE("Key: cv and reference qualifiers are stripped", "[key]") {
    REQUIRE(key::get<const IDatabase&>() == key::get<IDatabase>());
}

TEST_CASE("Key: equal keys hash equal and work in unordered containers", "[key]") {
    std::unordered_set<key> keys;
    keys.insert(key::get<IDatabase>());
    keys.insert(key::get<IDatabase>());
    keys.insert(key::annotated<IDatabase, Primary>());
    keys.insert(key::get<int>(named("port")));
    REQUIRE(keys.size() == 3);
    REQUIRE(key::get<int>(named("port")).hash() == key::get<int>(named("port")).hash());
}

TEST_CASE("Key: of_type keeps the qualifier", "[key]") {
    key k = key::get<std::string>(named("port"));
    REQUIRE(k.of_type<int>() == key::get<int>(named("port")));
    REQUIRE(k.with_annotation(std::nullopt) == key::get<std::string>());
}

TEST_CASE("Key: to_string shows type and qualifier", "[key]") {
    REQUIRE_THAT(key::get<IDatabase>().to_string(), Catch::Matchers::ContainsSubstring("IDatabase"));
    REQUIRE_THAT(key::get<int>(named("port")).to_string(),
                 Catch::Matchers::Equals("int annotated with @named(\"port\")"));
    REQUIRE_THAT(key::annotated<IDatabase, Primary>().to_string(),
                 Catch::Matchers::ContainsSubstring("annotated with @Primary"));
}

TEST_CASE("Key: type-level name qualifier matches named()", "[key]") {
    REQUIRE(qualifier_of<name<"primary">>() == named("primary"));
    REQUIRE(qualifier_of<Primary>() == qualifier::of<Primary>());
    REQUIRE_FALSE(qualifier_of<name<"primary">>() == qualifier::of<Primary>());
}

TEST_CASE("Key: element qualifiers differ by unique id", "[key]") {
    element_info a;
    a.set_name = "set";
    a.unique_id = 1;
    element_info b = a;
    b.unique_id = 2;
    element_info c = a;

    REQUIRE(qualifier::element(a) == qualifier::element(c));
    REQUIRE_FALSE(qualifier::element(a) == qualifier::element(b));

    element_info other_kind = a;
    other_kind.kind = element_kind::mapbinder;
    REQUIRE_FALSE(qualifier::element(a) == qualifier::element(other_kind));
    REQUIRE(a.same_collection(b));
    REQUIRE_FALSE(a.same_collection(other_kind));
}

TEST_CASE("Key: element qualifier renders its collection", "[key]") {
    element_info info;
    info.set_name = "set_of<int>";
    info.unique_id = 7;
    std::string text = qualifier::element(info).to_string();
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("set=set_of<int>"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("id=7"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("kind=multibinder"));
}

TEST_CASE("Key: value_ops compare by value when possible", "[key]") {
    std::string a = "x";
    std::string b = "x";
    std::string c = "y";
    const auto& ops = value_ops_for<std::string>();
    REQUIRE(ops.equals(&a, &b));
    REQUIRE_FALSE(ops.equals(&a, &c));
    REQUIRE(ops.describe(&a) == "x");

    IDatabase d1;
    IDatabase d2;
    const auto& identity = value_ops_for<IDatabase>();
    REQUIRE(identity.equals(&d1, &d1));
    REQUIRE_FALSE(identity.equals(&d1, &d2));
}
