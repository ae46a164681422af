// test_types.h - Object classes shared by the test suite

#pragma once

#include <objgraph/object.h>
#include <objgraph/type_registry.h>

#include <memory>
#include <string>
#include <vector>

namespace objgraph::test {

/// Order in which post-load hooks ran
inline std::vector<std::string>& hook_log()
{
    static std::vector<std::string> log;
    return log;
}

class Item : public Object {
public:
    Item() { bind("value", value); }

    int64_t value = 0;
};

/// Unsigned 64-bit member; only the lower half is representable as Int
class Counter : public Object {
public:
    Counter() { bind("hits", hits); }

    uint64_t hits = 0;
};

/// A room only knows its position through the Level holding it
class Room : public Object {
public:
    Room() {
        bind("_position", position);
        bind("size", size);
    }

    void on_loaded() override {
        ++loaded_calls;
        position_at_load = position;
        hook_log().push_back("Room");
    }

    std::string position;
    int64_t size = 1;

    // not bound
    int loaded_calls = 0;
    std::string position_at_load;
};

class Level : public Object {
public:
    Level() {
        bind("name", name);
        bind("rooms", rooms);
    }

    void on_loaded() override {
        for (const auto& key : rooms.keys()) {
            if (auto room = std::dynamic_pointer_cast<Room>(rooms.find(key)->as_object())) {
                room->position = key;
            }
        }
        hook_log().push_back("Level");
    }

    std::string name;
    Dictionary rooms{VariantType::Object};
};

class Character : public Object {
public:
    Character() {
        bind("name", name);
        bind("health", health);
        bind("speed", speed);
        bind("alive", alive);
        bind("tags", tags);
        bind("stats", stats);
        bind("weapon", weapon);
        bind("extra", extra);
        bind("_cache", cache);
    }

    std::string name = "nobody";
    int32_t health = 100;
    double speed = 1.5;
    bool alive = true;
    Array tags{VariantType::String};
    Dictionary stats{VariantType::Float};
    std::shared_ptr<Item> weapon;
    Variant extra;
    std::string cache;
};

/// Holds any objects, including untagged ones
class Scene : public Object {
public:
    Scene() {
        bind("actors", actors);
        bind("focus", focus);
    }

    Array actors{VariantType::Object};
    Variant focus;
};

inline void register_test_types(TypeRegistry& registry)
{
    registry.register_type<Item>("Item");
    registry.register_type<Room>("Room");
    registry.register_type<Level>("Level");
    registry.register_type<Character>("Character");
    registry.register_type<Scene>("Scene");
}

} // namespace objgraph::test
