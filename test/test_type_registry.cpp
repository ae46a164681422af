// test_type_registry.cpp - Tests for TypeRegistry

#include <catch2/catch_all.hpp>
#include <objgraph/type_registry.h>

#include "test_types.h"

using namespace objgraph;
using namespace objgraph::test;

TEST_CASE("create tags the instance with its registered name", "[registry]") {
    TypeRegistry registry;
    registry.register_type<Item>("Item");

    ObjectPtr obj = registry.create("Item");
    REQUIRE(obj != nullptr);
    REQUIRE(obj->is_tagged());
    REQUIRE(obj->type_name() == "Item");
    REQUIRE(std::dynamic_pointer_cast<Item>(obj) != nullptr);
}

TEST_CASE("One class may be registered under several names", "[registry]") {
    TypeRegistry registry;
    registry.register_type<Item>("Item");
    registry.register_type<Item>("Crate");

    REQUIRE(registry.create("Item")->type_name() == "Item");
    REQUIRE(registry.create("Crate")->type_name() == "Crate");
}

TEST_CASE("A factory result already tagged with another name is refused", "[registry]") {
    TypeRegistry registry;
    registry.register_type<Item>("Item");
    registry.register_type("Crate", [&registry] { return registry.create("Item"); });

    REQUIRE_THROWS_AS(registry.create("Crate"), TypeMismatchError);
    REQUIRE_THROWS_AS(registry.default_instance("Crate"), TypeMismatchError);
    REQUIRE(registry.create("Item")->type_name() == "Item");
}

TEST_CASE("Unknown names", "[registry]") {
    TypeRegistry registry;

    try {
        (void)registry.create("Nonexistent");
        FAIL("expected UnknownTypeError");
    } catch (const UnknownTypeError& e) {
        REQUIRE(e.type_name() == "Nonexistent");
        REQUIRE(e.kind() == ErrorKind::UnknownType);
    }

    REQUIRE(registry.default_instance("Nonexistent") == nullptr);
}

TEST_CASE("A factory returning null is an unknown type", "[registry]") {
    TypeRegistry registry;
    registry.register_type("Broken", [] { return ObjectPtr{}; });
    REQUIRE_THROWS_AS(registry.create("Broken"), UnknownTypeError);
}

TEST_CASE("create_as checks the produced class", "[registry]") {
    TypeRegistry registry;
    registry.register_type<Item>("Item");

    REQUIRE(registry.create_as<Item>("Item") != nullptr);
    REQUIRE_THROWS_AS(registry.create_as<Room>("Item"), TypeMismatchError);
}

TEST_CASE("Registry bookkeeping", "[registry]") {
    TypeRegistry registry;
    register_test_types(registry);

    REQUIRE(registry.size() == 5);
    REQUIRE(registry.contains("Level"));
    REQUIRE((registry.type_names() ==
             std::vector<std::string>{"Character", "Item", "Level", "Room", "Scene"}));

    REQUIRE(registry.unregister_type("Level"));
    REQUIRE_FALSE(registry.unregister_type("Level"));
    REQUIRE_FALSE(registry.contains("Level"));
    REQUIRE_THROWS_AS(registry.create("Level"), UnknownTypeError);
}

TEST_CASE("Default instances are created lazily and cached", "[registry][defaults]") {
    TypeRegistry registry;
    int calls = 0;
    registry.register_type("Item", [&calls] {
        ++calls;
        return ObjectPtr(std::make_shared<Item>());
    });

    REQUIRE(calls == 0);

    const Object* first = registry.default_instance("Item");
    REQUIRE(first != nullptr);
    REQUIRE(first->type_name() == "Item");
    REQUIRE(calls == 1);

    REQUIRE(registry.default_instance("Item") == first);
    REQUIRE(calls == 1);

    SECTION("clear_default_cache forces a new default") {
        registry.clear_default_cache();
        (void)registry.default_instance("Item");
        REQUIRE(calls == 2);
    }

    SECTION("re-registration replaces the factory and drops the default") {
        registry.register_type("Item", [] {
            auto item = std::make_shared<Item>();
            item->value = 9;
            return ObjectPtr(item);
        });
        auto fresh = dynamic_cast<const Item*>(registry.default_instance("Item"));
        REQUIRE(fresh != nullptr);
        REQUIRE(fresh->value == 9);
        REQUIRE(calls == 1);
    }
}
