// test_persistence.cpp - Tests for Persistence (save/load through files)

#include <catch2/catch_all.hpp>
#include <objgraph/persistence.h>
#include <objgraph/serialization.h>

#include "test_types.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

using namespace objgraph;
using namespace objgraph::test;

namespace fs = std::filesystem;

namespace {

/// Scratch directory removed at scope exit
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() /
                ("objgraph_test_" + std::to_string(std::random_device{}()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] fs::path file(const std::string& name) const { return path_ / name; }
    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::shared_ptr<Character> make_character(TypeRegistry& registry)
{
    auto c = registry.create_as<Character>("Character");
    c->name = "Ada";
    c->speed = 3.0;
    c->tags.push_back("pilot");
    c->stats.set("luck", 0.25);
    c->weapon = registry.create_as<Item>("Item");
    c->weapon->value = 11;
    return c;
}

void write_raw(const fs::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary);
    out << content;
}

} // namespace

TEST_CASE("Files round trip in every encoding", "[persistence]") {
    TypeRegistry registry;
    register_test_types(registry);
    Persistence persistence(registry);
    TempDir dir;

    auto source = make_character(registry);

    SECTION("json") {
        persistence.save_json(*source, dir.file("c.json"));
        auto loaded = std::dynamic_pointer_cast<Character>(persistence.load_json(dir.file("c.json")));
        REQUIRE(loaded != nullptr);
        REQUIRE(deep_equals(*loaded, *source));
    }

    SECTION("text") {
        persistence.save_text(*source, dir.file("c.txt"));
        auto loaded = std::dynamic_pointer_cast<Character>(persistence.load_text(dir.file("c.txt")));
        REQUIRE(loaded != nullptr);
        REQUIRE(deep_equals(*loaded, *source));
    }

    SECTION("binary") {
        persistence.save_binary(*source, dir.file("c.bin"));
        auto loaded = std::dynamic_pointer_cast<Character>(persistence.load_binary(dir.file("c.bin")));
        REQUIRE(loaded != nullptr);
        REQUIRE(deep_equals(*loaded, *source));
        REQUIRE(fs::file_size(dir.file("c.bin")) == persistence.to_binary(*source).size());
    }

    SECTION("saving overwrites") {
        persistence.save_json(*source, dir.file("c.json"));
        source->name = "Grace";
        persistence.save_json(*source, dir.file("c.json"));
        auto loaded = std::dynamic_pointer_cast<Character>(persistence.load_json(dir.file("c.json")));
        REQUIRE(loaded->name == "Grace");
    }
}

TEST_CASE("Saved JSON is the encoded Value", "[persistence]") {
    TypeRegistry registry;
    registry.register_type<Item>("Item");
    Persistence persistence(registry);
    TempDir dir;

    auto item = registry.create_as<Item>("Item");
    item->value = 5;
    persistence.save_json(*item, dir.file("item.json"));

    std::ifstream in(dir.file("item.json"), std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(decode_json(content) == Value::tagged("Item", {{"value", 5}}));
}

TEST_CASE("File errors", "[persistence][errors]") {
    TypeRegistry registry;
    register_test_types(registry);
    Persistence persistence(registry);
    TempDir dir;

    SECTION("missing file") {
        REQUIRE_THROWS_AS(persistence.load_json(dir.file("absent.json")), IoError);
        REQUIRE_THROWS_AS(persistence.load_binary(dir.file("absent.bin")), IoError);
    }

    SECTION("directory instead of a file") {
        REQUIRE_THROWS_AS(persistence.load_text(dir.path()), IoError);
    }

    SECTION("unwritable destination") {
        auto item = registry.create_as<Item>("Item");
        REQUIRE_THROWS_AS(persistence.save_json(*item, dir.file("no/such/dir/item.json")), IoError);
    }

    SECTION("corrupt content") {
        write_raw(dir.file("bad.json"), "{\"@type\": \"Item\", ");
        REQUIRE_THROWS_AS(persistence.load_json(dir.file("bad.json")), DecodeError);

        write_raw(dir.file("bad.bin"), "\x07\x01");
        REQUIRE_THROWS_AS(persistence.load_binary(dir.file("bad.bin")), DecodeError);
    }

    SECTION("well-formed but untagged content") {
        write_raw(dir.file("plain.json"), "{\"value\": 1}");
        REQUIRE_THROWS_AS(persistence.load_json(dir.file("plain.json")), MissingTypeTagError);
    }

    SECTION("unregistered type") {
        write_raw(dir.file("ghost.txt"), "@Ghost{}");
        REQUIRE_THROWS_AS(persistence.load_text(dir.file("ghost.txt")), UnknownTypeError);
    }
}

TEST_CASE("In-memory helpers", "[persistence]") {
    TypeRegistry registry;
    register_test_types(registry);
    Persistence persistence(registry);

    auto source = make_character(registry);

    REQUIRE(deep_equals(*persistence.from_json(persistence.to_json(*source)), *source));
    REQUIRE(deep_equals(*persistence.from_json(persistence.to_json(*source, true)), *source));
    REQUIRE(deep_equals(*persistence.from_text(persistence.to_text(*source)), *source));
    REQUIRE(deep_equals(*persistence.from_binary(persistence.to_binary(*source)), *source));

    SECTION("serializer options are honoured") {
        REQUIRE(persistence.to_json(*registry.create("Item"), true) == R"({"@type":"Item"})");

        SerializeOptions options;
        options.serialize_defaults = true;
        Persistence verbose(registry, options);
        REQUIRE(verbose.to_json(*registry.create("Item"), true) == R"({"@type":"Item","value":0})");
    }
}
