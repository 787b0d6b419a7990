/// @file entity_manager.cpp
/// @brief Entity arena implementation.

#include "arc/ecs/entity_manager.hpp"

#include <algorithm>
#include <cassert>

namespace arc::ecs {

Entity EntityManager::Create() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        index = freeList_.front();
        freeList_.pop_front();
        alive_[index] = true;
    } else {
        index = static_cast<uint32_t>(versions_.size());
        assert(index <= Entity::kMaxId && "Entity index space exhausted");
        versions_.push_back(0);
        alive_.push_back(true);
    }

    ++count_;
    return Entity(index, versions_[index]);
}

void EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    destroyInternal(entity);
}

void EntityManager::DestroyDeferred(Entity entity) {
    if (!IsAlive(entity) || IsPendingDestroy(entity)) {
        return;
    }
    pendingDestroy_.push_back(entity);
}

std::size_t EntityManager::FlushDeferred() {
    auto pending = std::move(pendingDestroy_);
    pendingDestroy_.clear();

    std::size_t destroyed = 0;
    for (const auto& entity : pending) {
        if (IsAlive(entity)) {
            destroyInternal(entity);
            ++destroyed;
        }
    }
    return destroyed;
}

bool EntityManager::IsPendingDestroy(Entity entity) const noexcept {
    return std::find(pendingDestroy_.begin(), pendingDestroy_.end(), entity) !=
           pendingDestroy_.end();
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }

    const auto idx = entity.id();
    if (idx >= versions_.size()) {
        return false;
    }

    return alive_[idx] && versions_[idx] == entity.version();
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

void EntityManager::destroyInternal(Entity entity) {
    const auto idx = entity.id();

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    alive_[idx] = false;
    // Generation wraps 255 -> 0; slot kIdMask is never handed out, so a
    // wrapped handle cannot collide with the invalid sentinel.
    versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);

    freeList_.push_back(idx);
    --count_;
}

} // namespace arc::ecs
