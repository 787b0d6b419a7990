#pragma once

/// @file entity_manager.hpp
/// @brief Entity arena: creation, generation-checked liveness, batched removal.
///
/// Rules never remove an entity while a group is being walked. They queue
/// it with DestroyDeferred() and the frame driver flushes the queue once
/// every phase has finished iterating.

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace arc::ecs {

class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    /// Create an entity, reusing the oldest freed slot if any.
    [[nodiscard]] Entity Create();

    /// Destroy @p entity now and strip its components. Dead handles are ignored.
    void Destroy(Entity entity);

    /// Queue @p entity for the next FlushDeferred(). Queueing the same
    /// entity twice in one frame destroys it once.
    void DestroyDeferred(Entity entity);

    /// Destroy every queued entity; returns how many were destroyed.
    std::size_t FlushDeferred();

    /// True when @p entity is queued for removal this frame.
    [[nodiscard]] bool IsPendingDestroy(Entity entity) const noexcept;

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    /// Slots ever allocated, including freed ones.
    [[nodiscard]] std::size_t Capacity() const noexcept { return versions_.size(); }

    /// Storages registered here lose an entity's component when it dies.
    /// Not owned; each must outlive the manager's last Destroy().
    void RegisterStorage(IComponentStorage* storage);

private:
    void destroyInternal(Entity entity);

    std::vector<uint8_t> versions_;
    std::vector<bool> alive_;
    std::deque<uint32_t> freeList_;
    std::vector<Entity> pendingDestroy_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace arc::ecs
