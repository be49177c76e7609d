#include <catch2/catch_test_macros.hpp>
#include <cjb/hooks.h>
#include <cjb/parse.h>
#include <cjb/value.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

using namespace cjb;

namespace {

long live_allocations = 0;

void* counting_malloc(std::size_t size) {
    ++live_allocations;
    return std::malloc(size);
}

void counting_free(void* ptr) {
    if (ptr == nullptr) return;
    --live_allocations;
    std::free(ptr);
}

// Counts cJSON allocations for the lifetime of the object.
struct CountingAllocator {
    CountingAllocator() {
        live_allocations = 0;
        set_allocator(counting_malloc, counting_free);
    }
    ~CountingAllocator() { reset_allocator(); }
};

Value build_document(int i) {
    auto doc = Value::object();
    doc.set("id", Value::integer(i));
    doc.set("name", Value::string("item " + std::to_string(i)));
    doc.set("tags", Value::string_array({"a", "b", "c"}));
    auto nested = Value::array();
    for (int k = 0; k < 5; ++k) nested.append(Value::number(k * 0.5));
    doc.set("nested", std::move(nested));
    return doc;
}

}  // namespace

TEST_CASE("Dropping the owner releases every allocation", "[ownership][memory]") {
    CountingAllocator counter;
    for (int i = 0; i < 200; ++i) {
        auto doc = build_document(i);
        REQUIRE(live_allocations > 0);
        auto text = doc.dump();
        auto reparsed = parse(text);
        REQUIRE(reparsed == doc);
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Failed parses leak nothing", "[ownership][memory]") {
    CountingAllocator counter;
    for (int i = 0; i < 50; ++i) {
        REQUIRE_THROWS_AS(parse(R"({"a":[1,2,{"b":})"), ParseError);
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Erase releases the removed subtree", "[ownership][memory]") {
    CountingAllocator counter;
    {
        auto doc = build_document(1);
        long before = live_allocations;
        doc.erase("nested");
        REQUIRE(live_allocations < before);
        doc.at("tags").erase(0);
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("A detached subtree is owned by the returned Value", "[ownership][memory]") {
    CountingAllocator counter;
    {
        auto doc = build_document(2);
        long before = live_allocations;
        {
            Value tags = doc.detach("tags");
            REQUIRE(tags.size() == 3);
            REQUIRE_FALSE(doc.has("tags"));
            // detached roots carry no member name
            REQUIRE_THROWS_AS(tags.key(), TypeMismatch);
            REQUIRE(live_allocations == before);
        }
        REQUIRE(live_allocations < before);
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Re-attaching moves the subtree without copying", "[ownership]") {
    CountingAllocator counter;
    {
        auto source = Value::int_array({10, 20, 30});
        auto target = Value::object();

        Value middle = source.detach(1);
        cJSON* handle = middle.handle();
        long before = live_allocations;

        target.set("moved", std::move(middle));
        REQUIRE(middle.handle() == nullptr);
        REQUIRE(target.at("moved").handle() == handle);
        REQUIRE(target.at("moved").as_int() == 20);
        // only the member name was allocated
        REQUIRE(live_allocations == before + 1);
        REQUIRE(source.dump(Format::Compact) == "[10,30]");
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("A refused insertion leaves ownership with the caller", "[ownership]") {
    CountingAllocator counter;
    {
        auto arr = Value::array();
        auto child = Value::string("orphan");
        REQUIRE_THROWS_AS(arr.insert(3, std::move(child)), NotFound);
        REQUIRE(child.handle() != nullptr);
        REQUIRE(child.as_string() == "orphan");
        REQUIRE(arr.empty());
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Trees are released when an exception unwinds", "[ownership][memory]") {
    CountingAllocator counter;
    auto build_then_fail = [] {
        auto doc = build_document(3);
        doc.at("name").as_int();  // throws TypeMismatch
    };
    REQUIRE_THROWS_AS(build_then_fail(), TypeMismatch);
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Move assignment frees the previous tree", "[ownership][memory]") {
    CountingAllocator counter;
    {
        auto a = build_document(4);
        auto b = Value::null();
        long both = live_allocations;
        a = std::move(b);
        REQUIRE(live_allocations < both);
        REQUIRE(a.is_null());
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Using a moved-from Value is a logic error", "[ownership]") {
    auto a = Value::object();
    Value b = std::move(a);
    REQUIRE(b.is_object());
    REQUIRE_THROWS_AS(a.kind(), std::logic_error);
    REQUIRE_THROWS_AS(a.dump(), std::logic_error);
}

TEST_CASE("release hands the handle to the caller", "[ownership]") {
    auto v = Value::string("raw handle");
    cJSON* h = v.release();
    REQUIRE(v.handle() == nullptr);
    // adopt it again so it is freed
    Value again(h);
    REQUIRE(again.as_string() == "raw handle");
}

TEST_CASE("A value cannot be attached inside itself", "[ownership][memory]") {
    CountingAllocator counter;
    {
        auto root = Value::array();
        root.append(Value::array());
        auto inner = root.at(0);
        REQUIRE_THROWS_AS(inner.append(std::move(root)), TypeMismatch);
        REQUIRE_THROWS_AS(inner.insert(0, std::move(root)), TypeMismatch);
        REQUIRE_THROWS_AS(root.append(std::move(root)), TypeMismatch);
        REQUIRE(root.handle() != nullptr);
        REQUIRE(root.dump(Format::Compact) == "[[]]");

        auto obj = Value::object();
        obj.set("child", Value::object());
        auto child = obj.at("child");
        REQUIRE_THROWS_AS(child.set("loop", std::move(obj)), TypeMismatch);
        REQUIRE_THROWS_AS(child.add("loop", std::move(obj)), TypeMismatch);
        REQUIRE(obj.dump(Format::Compact) == R"({"child":{}})");
    }
    REQUIRE(live_allocations == 0);
}

TEST_CASE("Replacing an element with its own root is refused", "[ownership]") {
    auto root = Value::array();
    root.append(Value::array());
    root.at(0).append(Value::integer(1));
    auto inner = root.at(0);
    REQUIRE_THROWS_AS(inner.replace(0, std::move(root)), TypeMismatch);
    REQUIRE(root.at(0).at(0).as_int() == 1);
}

TEST_CASE("Views cannot bind to a temporary owner", "[ownership]") {
    STATIC_REQUIRE_FALSE(std::is_constructible<ValueRef, Value&&>::value);
    STATIC_REQUIRE_FALSE(std::is_assignable<ValueRef&, Value&&>::value);
    STATIC_REQUIRE(std::is_constructible<ValueRef, Value&>::value);
    STATIC_REQUIRE(std::is_constructible<ValueRef, const Value&>::value);
}
