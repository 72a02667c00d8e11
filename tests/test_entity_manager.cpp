#include <catch2/catch.hpp>

#include <ECS/EntityManager.hpp>

#include <algorithm>
#include <atomic>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace Lumina::ECS;

TEST_CASE("EntityManager hands out fresh indices in order", "[EntityManager]") {
    EntityManager em;
    const Entity a = em.Create();
    const Entity b = em.Create();
    const Entity c = em.Create();

    REQUIRE(a.Index() == 0u);
    REQUIRE(b.Index() == 1u);
    REQUIRE(c.Index() == 2u);
    REQUIRE(a.Generation() == 0u);
    REQUIRE(em.AliveCount() == 3);
}

TEST_CASE("Create is alive and Destroy only succeeds once", "[EntityManager]") {
    EntityManager em;
    const Entity e = em.Create();
    REQUIRE(em.IsAlive(e));

    REQUIRE(em.Destroy(e));
    REQUIRE_FALSE(em.IsAlive(e));
    REQUIRE_FALSE(em.Destroy(e));
    REQUIRE(em.AliveCount() == 0);
}

TEST_CASE("Destroyed indices are reused last-in-first-out", "[EntityManager]") {
    EntityManager em;
    std::vector<Entity> es;
    for (int i = 0; i < 5; ++i) es.push_back(em.Create());

    em.Destroy(es[1]);
    em.Destroy(es[3]);

    const Entity first  = em.Create();
    const Entity second = em.Create();
    const Entity third  = em.Create();

    REQUIRE(first.Index()  == 3u);
    REQUIRE(second.Index() == 1u);
    REQUIRE(third.Index()  == 5u);
}

TEST_CASE("A reused index carries a new generation", "[EntityManager]") {
    EntityManager em;
    for (int i = 0; i < 3; ++i) (void)em.Create();
    const Entity last = Entity(2, 0);
    REQUIRE(em.Destroy(last));

    const Entity reborn = em.Create();
    REQUIRE(reborn.Index() == last.Index());
    REQUIRE(reborn.Generation() == last.Generation() + 1);
    REQUIRE(reborn != last);

    REQUIRE(em.IsAlive(reborn));
    REQUIRE_FALSE(em.IsAlive(last));
    REQUIRE_FALSE(em.Destroy(last));
    REQUIRE(em.IsAlive(reborn));
}

TEST_CASE("IsAlive rejects the null entity and unknown indices", "[EntityManager]") {
    EntityManager em(16);
    REQUIRE_FALSE(em.IsAlive(NULL_ENTITY));
    REQUIRE_FALSE(em.IsAlive(Entity(7)));
    REQUIRE_FALSE(em.Destroy(Entity(7)));
}

TEST_CASE("IterAlive is an ascending snapshot", "[EntityManager]") {
    EntityManager em;
    std::vector<Entity> es;
    for (int i = 0; i < 4; ++i) es.push_back(em.Create());
    em.Destroy(es[2]);

    const auto alive = em.IterAlive();
    REQUIRE(alive == std::vector<Entity>{ es[0], es[1], es[3] });

    (void)em.Create();
    em.Destroy(es[0]);
    REQUIRE(alive.size() == 3);
}

TEST_CASE("Clear returns to the empty state", "[EntityManager]") {
    EntityManager em;
    const Entity a = em.Create();
    (void)em.Create();
    em.Destroy(a);

    em.Clear();
    REQUIRE(em.AliveCount() == 0);
    REQUIRE(em.IterAlive().empty());
    REQUIRE(em.Create().Index() == 0u);
}

TEST_CASE("Concurrent Create never hands out the same index twice", "[EntityManager][threads]") {
    EntityManager em;
    constexpr int kThreads   = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::vector<Entity>> made(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const Entity e = em.Create();
                made[t].push_back(e);
                // Churn half of them through the free list.
                if (i % 2 == 0) {
                    em.Destroy(e);
                    made[t].pop_back();
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    std::unordered_set<uint32_t> indices;
    size_t total = 0;
    for (const auto& v : made) {
        for (const Entity e : v) {
            REQUIRE(em.IsAlive(e));
            indices.insert(e.Index());
            ++total;
        }
    }
    REQUIRE(indices.size() == total);
    REQUIRE(em.AliveCount() == total);
}

TEST_CASE("Clear racing Destroy and Create never duplicates a live index", "[EntityManager][threads]") {
    EntityManager em;
    constexpr int kRounds = 200;
    constexpr int kBatch  = 64;
    constexpr int kRefill = 200;

    for (int round = 0; round < kRounds; ++round) {
        std::vector<Entity> batch;
        for (int i = 0; i < kBatch; ++i) batch.push_back(em.Create());

        std::thread destroyer([&] {
            for (const Entity e : batch) em.Destroy(e);
        });
        std::thread creator([&] {
            for (int i = 0; i < kBatch / 2; ++i) (void)em.Create();
        });
        std::thread clearer([&] { em.Clear(); });
        destroyer.join();
        creator.join();
        clearer.join();

        // Nothing is destroyed from here on, so every Create() must land on
        // an index no live entity holds.
        const size_t before = em.AliveCount();
        std::unordered_set<uint32_t> refill;
        for (int i = 0; i < kRefill; ++i) {
            const Entity e = em.Create();
            INFO("round " << round << ", index " << e.Index());
            REQUIRE(refill.insert(e.Index()).second);
        }
        REQUIRE(em.AliveCount() == before + kRefill);

        em.Clear();
    }
}
