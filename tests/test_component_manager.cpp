#include <catch2/catch.hpp>

#include <ECS/ComponentManager.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace Lumina::ECS;

namespace {

struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

struct Name {
    std::string value;
};

} // namespace

TEST_CASE("ComponentPool keeps rows packed on removal", "[ComponentPool]") {
    ComponentPool<int> pool;
    pool.Insert(Entity(0), 10);
    pool.Insert(Entity(1), 11);
    pool.Insert(Entity(2), 12);

    REQUIRE(pool.Remove(Entity(0)));
    REQUIRE(pool.Size() == 2);
    REQUIRE(*pool.Find(Entity(2)) == 12);
    REQUIRE(*pool.Find(Entity(1)) == 11);
    REQUIRE(pool.Find(Entity(0)) == nullptr);
    REQUIRE_FALSE(pool.Remove(Entity(0)));
}

TEST_CASE("ComponentPool does not report a row to a newer generation", "[ComponentPool]") {
    ComponentPool<int> pool;
    pool.Insert(Entity(4, 0), 1);

    REQUIRE_FALSE(pool.Has(Entity(4, 1)));
    REQUIRE(pool.Find(Entity(4, 1)) == nullptr);

    pool.Insert(Entity(4, 1), 2);
    REQUIRE(pool.Size() == 1);
    REQUIRE(*pool.Find(Entity(4, 1)) == 2);
    REQUIRE_FALSE(pool.Has(Entity(4, 0)));
}

TEST_CASE("IPool downcast is checked", "[ComponentPool]") {
    std::unique_ptr<IPool> pool = std::make_unique<ComponentPool<Position>>();
    REQUIRE(pool->As<Position>() != nullptr);
    REQUIRE(pool->As<Name>() == nullptr);
}

TEST_CASE("Add, get and remove a component", "[ComponentManager]") {
    ComponentManager cm;
    const Entity e(0);

    REQUIRE_FALSE(cm.HasComponent<Position>(e));
    REQUIRE_FALSE(cm.GetComponent<Position>(e));

    cm.AddComponent(e, Position{ 1.0f, 2.0f });
    REQUIRE(cm.HasComponent<Position>(e));
    REQUIRE(cm.GetComponent<Position>(e)->x == 1.0f);

    cm.AddComponent(e, Position{ 3.0f, 4.0f });
    REQUIRE(cm.GetComponent<Position>(e)->x == 3.0f);

    const auto removed = cm.RemoveComponent<Position>(e);
    REQUIRE(removed);
    REQUIRE(removed->y == 4.0f);
    REQUIRE_FALSE(cm.HasComponent<Position>(e));
    REQUIRE_FALSE(cm.RemoveComponent<Position>(e));
}

TEST_CASE("The null entity never gets a row", "[ComponentManager]") {
    ComponentManager cm;
    cm.AddComponent(NULL_ENTITY, Position{ 1.0f, 1.0f });

    REQUIRE_FALSE(cm.HasComponent<Position>(NULL_ENTITY));
    REQUIRE_FALSE(cm.GetComponent<Position>(NULL_ENTITY));
    REQUIRE(cm.RegisteredTypeCount() == 0);

    cm.AddComponent(Entity(0), Position{});
    cm.AddComponent(NULL_ENTITY, Position{});
    cm.WithStorage<Position>([](const ComponentPool<Position>* p) {
        REQUIRE(p->Size() == 1);
        REQUIRE(p->Entities().front() == Entity(0));
    });
}

TEST_CASE("Components of different types and entities are isolated", "[ComponentManager]") {
    ComponentManager cm;
    const Entity a(0);
    const Entity b(1);

    cm.AddComponent(a, Position{ 1.0f, 1.0f });
    cm.AddComponent(a, Name{ "a" });
    cm.AddComponent(b, Position{ 2.0f, 2.0f });

    cm.AddComponent(a, Position{ 9.0f, 9.0f });
    REQUIRE(cm.GetComponent<Name>(a)->value == "a");
    REQUIRE(cm.GetComponent<Position>(b)->x == 2.0f);

    cm.RemoveComponent<Name>(a);
    REQUIRE(cm.GetComponent<Position>(a)->x == 9.0f);
}

TEST_CASE("Scoped access sees nullptr for missing rows", "[ComponentManager]") {
    ComponentManager cm;
    const Entity e(0);

    const bool sawNull = cm.WithComponent<Position>(e, [](const Position* p) { return p == nullptr; });
    REQUIRE(sawNull);

    cm.AddComponent(e, Position{});
    cm.WithComponentMut<Position>(e, [](Position* p) {
        REQUIRE(p != nullptr);
        p->x += 5.0f;
    });
    REQUIRE(cm.GetComponent<Position>(e)->x == 5.0f);
}

TEST_CASE("A closure may touch a different component type", "[ComponentManager]") {
    ComponentManager cm;
    const Entity e(0);
    cm.AddComponent(e, Position{ 7.0f, 0.0f });
    cm.AddComponent(e, Name{ "n" });

    cm.WithComponentMut<Name>(e, [&](Name* n) {
        const auto pos = cm.GetComponent<Position>(e);
        n->value = pos ? "moved" : "missing";
    });
    REQUIRE(cm.GetComponent<Name>(e)->value == "moved");
}

TEST_CASE("RemoveAllComponents strips every pool", "[ComponentManager]") {
    ComponentManager cm;
    const Entity a(0);
    const Entity b(1);
    cm.AddComponent(a, Position{});
    cm.AddComponent(a, Name{ "a" });
    cm.AddComponent(b, Name{ "b" });

    cm.RemoveAllComponents(a);
    REQUIRE_FALSE(cm.HasComponent<Position>(a));
    REQUIRE_FALSE(cm.HasComponent<Name>(a));
    REQUIRE(cm.HasComponent<Name>(b));
    REQUIRE(cm.RegisteredTypeCount() == 2);
}

TEST_CASE("Register and Clear keep pools but drop rows", "[ComponentManager]") {
    ComponentManager cm;
    cm.Register<Position>();
    cm.Register<Position>();
    REQUIRE(cm.RegisteredTypeCount() == 1);

    cm.AddComponent(Entity(3), Position{});
    cm.Clear();
    REQUIRE_FALSE(cm.HasComponent<Position>(Entity(3)));
    REQUIRE(cm.RegisteredTypeCount() == 1);

    const size_t rows = cm.WithStorage<Position>([](const ComponentPool<Position>* p) {
        return p ? p->Size() : size_t(99);
    });
    REQUIRE(rows == 0);
}

TEST_CASE("Writers on different tables run concurrently", "[ComponentManager][threads]") {
    ComponentManager cm;
    constexpr uint32_t kCount = 2000;

    std::thread positions([&] {
        for (uint32_t i = 0; i < kCount; ++i) cm.AddComponent(Entity(i), Position{ float(i), 0.0f });
    });
    std::thread names([&] {
        for (uint32_t i = 0; i < kCount; ++i) cm.AddComponent(Entity(i), Name{ std::to_string(i) });
    });
    positions.join();
    names.join();

    REQUIRE(cm.GetComponent<Position>(Entity(kCount - 1))->x == float(kCount - 1));
    REQUIRE(cm.GetComponent<Name>(Entity(17))->value == "17");
    cm.WithStorage<Name>([&](const ComponentPool<Name>* p) { REQUIRE(p->Size() == kCount); });
}
