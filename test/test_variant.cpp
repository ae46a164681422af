// test_variant.cpp - Tests for Variant, Array and Dictionary

#include <catch2/catch_all.hpp>
#include <objgraph/variant.h>

#include "test_types.h"

using namespace objgraph;
using objgraph::test::Item;

TEST_CASE("Variant alternatives", "[variant]") {
    REQUIRE(Variant{}.type() == VariantType::Nil);
    REQUIRE(Variant{true}.type() == VariantType::Bool);
    REQUIRE(Variant{7}.type() == VariantType::Int);
    REQUIRE(Variant{uint8_t{7}}.type() == VariantType::Int);
    REQUIRE(Variant{7.0}.type() == VariantType::Float);
    REQUIRE(Variant{"s"}.type() == VariantType::String);
    REQUIRE(Variant{Array{}}.type() == VariantType::Array);
    REQUIRE(Variant{Dictionary{}}.type() == VariantType::Dictionary);
    REQUIRE(Variant{std::make_shared<Item>()}.type() == VariantType::Object);
    REQUIRE(variant_type_name(VariantType::Dictionary) == "Dictionary");
}

TEST_CASE("Variant checked accessors", "[variant]") {
    SECTION("matching alternative") {
        REQUIRE(Variant{5}.as_int() == 5);
        REQUIRE(Variant{"x"}.as_string() == "x");
    }

    SECTION("Int widens to Float") {
        REQUIRE(Variant{5}.as_float() == 5.0);
    }

    SECTION("Float does not narrow to Int") {
        REQUIRE_THROWS_AS(Variant{5.0}.as_int(), TypeMismatchError);
    }

    SECTION("wrong alternative") {
        REQUIRE_THROWS_AS(Variant{"x"}.as_bool(), TypeMismatchError);
        REQUIRE_THROWS_AS(Variant{1}.as_array(), TypeMismatchError);
        REQUIRE_THROWS_AS(Variant{1}.as_object(), TypeMismatchError);
    }

    SECTION("Nil reads as a null object") {
        REQUIRE(Variant{}.as_object() == nullptr);
    }
}

TEST_CASE("Variant equality is deep", "[variant]") {
    Array a;
    a.push_back(1);
    a.push_back("two");
    Array b;
    b.push_back(1);
    b.push_back("two");

    REQUIRE(Variant{a} == Variant{b});
    REQUIRE_FALSE(a.same_ref(b));

    b.push_back(3);
    REQUIRE(Variant{a} != Variant{b});

    REQUIRE(Variant{1} != Variant{1.0});
    REQUIRE(Variant{ObjectPtr{}} == Variant{ObjectPtr{}});
}

// ============================================================
// Array
// ============================================================

TEST_CASE("Array shares storage between handles", "[variant][array]") {
    Array scores;
    Array alias = scores;
    alias.push_back(10);

    REQUIRE(scores.size() == 1);
    REQUIRE(scores.same_ref(alias));
    REQUIRE(scores.at(0).as_int() == 10);
}

TEST_CASE("Typed Array", "[variant][array]") {
    Array scores{VariantType::Float};
    REQUIRE(scores.is_typed());

    SECTION("Int is stored as Float") {
        scores.push_back(3);
        REQUIRE(scores.at(0).is_float());
        REQUIRE(scores.at(0).as_float() == 3.0);
    }

    SECTION("incompatible element is rejected") {
        REQUIRE_THROWS_AS(scores.push_back("x"), TypeMismatchError);
        REQUIRE(scores.empty());
    }

    SECTION("set enforces the constraint") {
        scores.push_back(1.0);
        REQUIRE_THROWS_AS(scores.set(0, true), TypeMismatchError);
        REQUIRE(scores.at(0).as_float() == 1.0);
    }

    SECTION("out of range access") {
        REQUIRE_THROWS_AS(scores.at(3), std::out_of_range);
    }
}

TEST_CASE("Array::assign keeps the receiver's constraint", "[variant][array]") {
    Array target{VariantType::Float};
    target.push_back(9.0);

    Array source;
    source.push_back(1);
    source.push_back(2.5);

    target.assign(source);
    REQUIRE(target.element_type() == VariantType::Float);
    REQUIRE(target.size() == 2);
    REQUIRE(target.at(0).is_float());
    REQUIRE_FALSE(target.same_ref(source));

    SECTION("a failing element leaves the target untouched") {
        Array bad;
        bad.push_back(1.0);
        bad.push_back("nope");
        REQUIRE_THROWS_AS(target.assign(bad), TypeMismatchError);
        REQUIRE(target.size() == 2);
        REQUIRE(target.at(1).as_float() == 2.5);
    }
}

TEST_CASE("Object-typed Array accepts Nil", "[variant][array]") {
    Array items{VariantType::Object};
    items.push_back(nullptr);
    items.push_back(std::make_shared<Item>());

    REQUIRE(items.at(0).is_object());
    REQUIRE(items.at(0).as_object() == nullptr);
    REQUIRE_THROWS_AS(items.push_back(1), TypeMismatchError);
}

// ============================================================
// Dictionary
// ============================================================

TEST_CASE("Dictionary basics", "[variant][dictionary]") {
    Dictionary dict;
    dict.set("b", 2);
    dict.set("a", 1);
    dict.set("b", 3);

    REQUIRE(dict.size() == 2);
    REQUIRE(dict.find("b")->as_int() == 3);
    REQUIRE(dict.find("z") == nullptr);
    REQUIRE((dict.keys() == std::vector<std::string>{"a", "b"}));

    REQUIRE(dict.erase("a"));
    REQUIRE_FALSE(dict.erase("a"));
    REQUIRE_FALSE(dict.contains("a"));

    Dictionary alias = dict;
    alias.clear();
    REQUIRE(dict.empty());
}

TEST_CASE("Typed Dictionary", "[variant][dictionary]") {
    Dictionary names{VariantType::String};
    names.set("first", "Ada");
    REQUIRE_THROWS_AS(names.set("second", 2), TypeMismatchError);
    REQUIRE(names.size() == 1);

    Dictionary source;
    source.set("x", "1");
    source.set("y", 2);
    REQUIRE_THROWS_AS(names.assign(source), TypeMismatchError);
    REQUIRE(names.find("first") != nullptr);
}

TEST_CASE("Dictionary equality", "[variant][dictionary]") {
    Dictionary a;
    a.set("k", 1);
    Dictionary b;
    b.set("k", 1);
    REQUIRE(a == b);

    b.set("k", 2);
    REQUIRE(a != b);

    Dictionary c{VariantType::Int};
    c.set("k", 1);
    REQUIRE(a == c);
}

TEST_CASE("coerce_to", "[variant]") {
    REQUIRE(coerce_to(Variant{3}, VariantType::Nil, "ctx").is_int());
    REQUIRE(coerce_to(Variant{3}, VariantType::Float, "ctx").is_float());
    REQUIRE(coerce_to(Variant{}, VariantType::Object, "ctx").is_object());
    REQUIRE_THROWS_AS(coerce_to(Variant{"x"}, VariantType::Int, "ctx"), TypeMismatchError);
}
