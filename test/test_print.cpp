#include <catch2/catch_test_macros.hpp>
#include <cjb/parse.h>
#include <cjb/value.h>

#include <string>

using namespace cjb;

TEST_CASE("Compact output has no whitespace", "[print]") {
    auto obj = Value::object();
    obj.set("a", Value::integer(1));
    obj.set("b", Value::int_array({1, 2}));
    obj.set("c", Value::null());
    REQUIRE(obj.dump(Format::Compact) == R"({"a":1,"b":[1,2],"c":null})");
}

TEST_CASE("Pretty output uses cJSON's tab layout", "[print]") {
    auto obj = Value::object();
    obj.set("a", Value::integer(1));
    REQUIRE(obj.dump() == "{\n\t\"a\":\t1\n}");
    REQUIRE(Value::int_array({1, 2}).dump(Format::Pretty) == "[1, 2]");
}

TEST_CASE("Scalars print as JSON text", "[print]") {
    REQUIRE(Value::null().dump() == "null");
    REQUIRE(Value::boolean(false).dump() == "false");
    REQUIRE(Value::integer(25).dump() == "25");
    REQUIRE(Value::number(1.5).dump() == "1.5");
    REQUIRE(Value::string("say \"hi\"").dump() == R"("say \"hi\"")");
}

TEST_CASE("Raw values are emitted verbatim", "[print]") {
    auto obj = Value::object();
    obj.set("pre", Value::raw(R"({"x": 1})"));
    REQUIRE(obj.dump(Format::Compact) == R"({"pre":{"x": 1}})");
    // once printed, the raw text parses back as ordinary JSON
    auto reparsed = parse(obj.dump(Format::Compact));
    REQUIRE(reparsed.at("pre").at("x").as_int() == 1);
}

TEST_CASE("Buffered printing matches dump", "[print]") {
    auto doc = parse(R"({"list":[1,2,3],"name":"cjbind","nested":{"deep":[true,false,null]}})");
    REQUIRE(doc.dump_buffered(4) == doc.dump());
    REQUIRE(doc.dump_buffered(1024, Format::Compact) == doc.dump(Format::Compact));
    REQUIRE_THROWS_AS(doc.dump_buffered(-1), TypeMismatch);
}

TEST_CASE("Children print on their own", "[print]") {
    auto doc = parse(R"({"outer":{"inner":[1,2]}})");
    REQUIRE(doc.at("outer").dump(Format::Compact) == R"({"inner":[1,2]})");
}
