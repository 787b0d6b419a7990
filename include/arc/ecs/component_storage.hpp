#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set storage for one entity attribute.
///
/// Presence of a component is what makes a rule apply to an entity, so
/// the storage offers TryGet() alongside the checked accessors: a null
/// result means "attribute absent, skip the rule".

#include "arc/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace arc::ecs {

/// Type-erased view used by EntityManager and Query.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Full handle (index and generation) owning dense slot @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;

    /// Structural version; changes on every add, remove and clear.
    [[nodiscard]] virtual uint32_t Version() const noexcept = 0;
};

/// Sparse-set component storage.
///
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   entities_[index]     -> owning entity handle
/// @endcode
///
/// Lookups compare the stored handle's generation, so a stale handle
/// to a recycled slot never reaches the new occupant's data.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }

    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    /// Add a component for @p entity, constructed from @p args.
    /// @pre `!Has(entity)`.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        const auto idx = static_cast<uint32_t>(dense_.size());

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;

        dense_.push_back(T{std::forward<Args>(args)...});
        entities_.push_back(entity);
        ++version_;

        return dense_.back();
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Component of @p entity, or nullptr when the attribute is absent.
    [[nodiscard]] T* TryGet(Entity entity) noexcept {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* TryGet(Entity entity) const noexcept {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        if (!entity.isValid()) {
            return false;
        }
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex &&
               entities_[sparse_[eid]] == entity;
    }

    /// Remove the component owned by @p entity (no-op when absent).
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            entities_[idx] = entities_[lastIdx];
            sparse_[entities_[idx].id()] = idx;
        }

        dense_.pop_back();
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;

        ++version_;
    }

    /// Existing component, or a new one built from @p args.
    template <typename... Args>
    T& GetOrAdd(Entity entity, Args&&... args) {
        if (auto* existing = TryGet(entity)) {
            return *existing;
        }
        return Add(entity, std::forward<Args>(args)...);
    }

    void Clear() override {
        dense_.clear();
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
        ++version_;
    }

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        assert(index < entities_.size());
        return entities_[index];
    }

    [[nodiscard]] uint32_t Version() const noexcept override { return version_; }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;
    std::vector<Entity> entities_;
    std::vector<uint32_t> sparse_;
    uint32_t version_ = 0;
};

}  // namespace arc::ecs
