// main.cpp - objgraph walkthrough
//
// Registers a few game-style classes, then shows serialization with
// default elision, the three encodings, post-load hooks, and cloning.

#include <objgraph/cloner.h>
#include <objgraph/errors.h>
#include <objgraph/object.h>
#include <objgraph/persistence.h>
#include <objgraph/serialization.h>
#include <objgraph/serializer.h>
#include <objgraph/type_registry.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace objgraph;

// ============================================================
// Domain classes
// ============================================================

class Item : public Object
{
public:
    Item()
    {
        bind("name", name);
        bind("value", value);
    }

    std::string name;
    int64_t value = 0;
};

class Room : public Object
{
public:
    Room()
    {
        bind("_key", key);
        bind("size", size);
        bind("loot", loot);
    }

    std::string key;
    double size = 1.0;
    Array loot{VariantType::Object};
};

class Level : public Object
{
public:
    Level()
    {
        bind("title", title);
        bind("rooms", rooms);
    }

    // Rooms learn their key from the dictionary that holds them
    void on_loaded() override
    {
        for (const auto& k : rooms.keys()) {
            if (auto room = std::dynamic_pointer_cast<Room>(rooms.find(k)->as_object())) {
                room->key = k;
            }
        }
    }

    std::string title;
    Dictionary rooms{VariantType::Object};
};

// ============================================================
// Demos
// ============================================================

std::shared_ptr<Level> build_level(TypeRegistry& registry)
{
    auto level = registry.create_as<Level>("Level");
    level->title = "Castle";

    auto hall = registry.create_as<Room>("Room");
    hall->size = 12.5;
    auto sword = registry.create_as<Item>("Item");
    sword->name = "sword";
    sword->value = 30;
    hall->loot.push_back(sword);

    auto cellar = registry.create_as<Room>("Room");

    level->rooms.set("hall", hall);
    level->rooms.set("cellar", cellar);
    return level;
}

void demo_values(TypeRegistry& registry, const Level& level)
{
    std::cout << "\n=== Serialize to Value ===\n\n";

    Serializer serializer(registry);
    Value data = serializer.serialize(level);
    print_value(data, "", 1);

    std::cout << "\nThe cellar keeps only its type tag (all fields at default):\n";
    std::cout << "  " << encode_json(data.at("rooms").at("cellar"), true) << "\n";

    SerializeOptions options;
    options.serialize_defaults = true;
    serializer.set_options(options);
    std::cout << "With defaults written:\n";
    std::cout << "  " << encode_json(serializer.serialize(level).at("rooms").at("cellar"), true) << "\n";
}

void demo_encodings(Persistence& persistence, const Level& level)
{
    std::cout << "\n=== Encodings ===\n\n";

    std::cout << "--- JSON ---\n" << persistence.to_json(level) << "\n\n";
    std::cout << "--- Text ---\n" << persistence.to_text(level) << "\n\n";
    std::cout << "--- Binary ---\n" << persistence.to_binary(level).size() << " bytes\n";
}

void demo_files(Persistence& persistence, const Level& level)
{
    std::cout << "\n=== Save / Load ===\n\n";

    const auto path = std::filesystem::temp_directory_path() / "objgraph_demo_level.bin";
    persistence.save_binary(level, path);
    auto loaded = std::dynamic_pointer_cast<Level>(persistence.load_binary(path));
    std::filesystem::remove(path);

    std::cout << "Loaded '" << loaded->title << "', equal to the original: "
              << (deep_equals(*loaded, level) ? "yes" : "no") << "\n";
    for (const auto& k : loaded->rooms.keys()) {
        auto room = std::dynamic_pointer_cast<Room>(loaded->rooms.find(k)->as_object());
        std::cout << "  room key restored by on_loaded: " << room->key << "\n";
    }
}

void demo_clone(TypeRegistry& registry, const Level& level)
{
    std::cout << "\n=== Clone ===\n\n";

    Cloner cloner(registry);
    auto shallow = cloner.duplicate_as(level, false);
    auto deep = cloner.duplicate_as(level, true);

    std::cout << "shallow copy shares rooms: " << (shallow->rooms.same_ref(level.rooms) ? "yes" : "no") << "\n";
    std::cout << "deep copy shares rooms:    " << (deep->rooms.same_ref(level.rooms) ? "yes" : "no") << "\n";
}

void demo_errors(Persistence& persistence)
{
    std::cout << "\n=== Errors ===\n\n";

    const char* inputs[] = {
        R"({"@type": "Dragon"})",
        R"({"title": "untagged"})",
        R"({"@type": "Item", "value": "lots"})",
        R"({"@type": "Item",)",
    };
    for (const char* input : inputs) {
        try {
            (void)persistence.from_json(input);
        } catch (const Error& e) {
            std::cout << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        }
    }
}

int main()
{
    TypeRegistry registry;
    registry.register_type<Item>("Item");
    registry.register_type<Room>("Room");
    registry.register_type<Level>("Level");

    std::cout << "=== objgraph demo ===\n";
    std::cout << "Registered types:";
    for (const auto& name : registry.type_names()) {
        std::cout << " " << name;
    }
    std::cout << "\n";

    auto level = build_level(registry);
    Persistence persistence(registry);

    try {
        demo_values(registry, *level);
        demo_encodings(persistence, *level);
        demo_files(persistence, *level);
        demo_clone(registry, *level);
        demo_errors(persistence);
    } catch (const Error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
