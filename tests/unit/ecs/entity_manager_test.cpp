#include <gtest/gtest.h>

#include <unordered_set>
#include <vector>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity_manager.hpp"
#include "arc/game/rpg_components.hpp"

using namespace arc::ecs;
using arc::game::EnemyTag;
using arc::game::Health;

// ===========================================================================
// EntityManager: creation
// ===========================================================================

TEST(EntityManagerTest, CreateReturnsValidEntity) {
    EntityManager mgr;
    Entity e = mgr.Create();
    EXPECT_TRUE(e.isValid());
    EXPECT_TRUE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.Count(), 1u);
}

TEST(EntityManagerTest, SequentialIndices) {
    EntityManager mgr;
    for (uint32_t i = 0; i < 5; ++i) {
        EXPECT_EQ(mgr.Create().id(), i);
    }
    EXPECT_EQ(mgr.Capacity(), 5u);
}

// ===========================================================================
// EntityManager: destruction and recycling
// ===========================================================================

TEST(EntityManagerTest, DestroyMakesEntityDead) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.Destroy(e);
    EXPECT_FALSE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.Count(), 0u);
}

TEST(EntityManagerTest, DestroyDeadEntityIsNoop) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.Create();
    mgr.Destroy(e);
    mgr.Destroy(e);
    EXPECT_EQ(mgr.Count(), 1u);
}

TEST(EntityManagerTest, RecycledSlotGetsNewVersion) {
    EntityManager mgr;
    Entity first = mgr.Create();
    mgr.Destroy(first);

    Entity second = mgr.Create();
    EXPECT_EQ(second.id(), first.id());
    EXPECT_EQ(second.version(), first.version() + 1);
    EXPECT_FALSE(mgr.IsAlive(first));
    EXPECT_TRUE(mgr.IsAlive(second));
}

TEST(EntityManagerTest, FreeListIsFifo) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    mgr.Create();

    mgr.Destroy(b);
    mgr.Destroy(a);

    EXPECT_EQ(mgr.Create().id(), b.id());
    EXPECT_EQ(mgr.Create().id(), a.id());
}

TEST(EntityManagerTest, IsAliveRejectsForeignHandles) {
    EntityManager mgr;
    mgr.Create();
    EXPECT_FALSE(mgr.IsAlive(Entity::invalid()));
    EXPECT_FALSE(mgr.IsAlive(Entity(50, 0)));
    EXPECT_FALSE(mgr.IsAlive(Entity(0, 7)));
}

TEST(EntityManagerTest, DestroyStripsRegisteredComponents) {
    EntityManager mgr;
    ComponentStorage<Health> health;
    ComponentStorage<EnemyTag> enemies;
    mgr.RegisterStorage(&health);
    mgr.RegisterStorage(&enemies);

    Entity e = mgr.Create();
    health.Add(e, 30);
    enemies.Add(e);

    mgr.Destroy(e);

    EXPECT_FALSE(health.Has(e));
    EXPECT_FALSE(enemies.Has(e));
    EXPECT_EQ(health.Size(), 0u);
}

// ===========================================================================
// EntityManager: deferred removal
// ===========================================================================

TEST(EntityManagerTest, DeferredDoesNotDestroyImmediately) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.DestroyDeferred(e);

    EXPECT_TRUE(mgr.IsAlive(e));
    EXPECT_TRUE(mgr.IsPendingDestroy(e));
}

TEST(EntityManagerTest, FlushDestroysQueuedAndReportsCount) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    Entity c = mgr.Create();

    mgr.DestroyDeferred(a);
    mgr.DestroyDeferred(c);

    EXPECT_EQ(mgr.FlushDeferred(), 2u);
    EXPECT_FALSE(mgr.IsAlive(a));
    EXPECT_TRUE(mgr.IsAlive(b));
    EXPECT_FALSE(mgr.IsAlive(c));
    EXPECT_FALSE(mgr.IsPendingDestroy(a));
}

TEST(EntityManagerTest, DoubleQueueDestroysOnce) {
    EntityManager mgr;
    Entity a = mgr.Create();
    mgr.DestroyDeferred(a);
    mgr.DestroyDeferred(a);

    EXPECT_EQ(mgr.FlushDeferred(), 1u);
    EXPECT_EQ(mgr.Count(), 0u);
}

TEST(EntityManagerTest, FlushSkipsEntitiesDestroyedInBetween) {
    EntityManager mgr;
    Entity a = mgr.Create();
    mgr.DestroyDeferred(a);
    mgr.Destroy(a);

    EXPECT_EQ(mgr.FlushDeferred(), 0u);
}

TEST(EntityManagerTest, FlushClearsQueue) {
    EntityManager mgr;
    Entity a = mgr.Create();
    mgr.DestroyDeferred(a);
    mgr.FlushDeferred();

    Entity b = mgr.Create();
    EXPECT_EQ(mgr.FlushDeferred(), 0u);
    EXPECT_TRUE(mgr.IsAlive(b));
}

TEST(EntityManagerTest, DeferredIgnoresDeadHandle) {
    EntityManager mgr;
    Entity a = mgr.Create();
    mgr.Destroy(a);
    mgr.DestroyDeferred(a);
    EXPECT_FALSE(mgr.IsPendingDestroy(a));
}
