#pragma once

/// @file query.hpp
/// @brief Group query over entities carrying a required attribute set.
///
/// The entity list is cached and rebuilt only when an included or
/// excluded storage changes structurally. Mutating component values
/// inside ForEach is expected; adding or removing components of an
/// included type while iterating is not.

#include <cstdint>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"

namespace arc::ecs {

/// Query<Includes...>: every entity holding all of @p Includes.
///
/// @code
///   Query<LevelProgress, CharacterStats> levelled(levels, stats);
///   levelled.ForEach([](Entity e, LevelProgress& lp, CharacterStats& cs) {
///       ...
///   });
/// @endcode
template <typename... Includes>
class Query {
    static_assert(sizeof...(Includes) > 0,
                  "Query must have at least one component type");

public:
    using const_iterator = typename std::vector<Entity>::const_iterator;

    explicit Query(ComponentStorage<Includes>&... storages)
        : storages_{&storages...} {}

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;
    Query(Query&&) noexcept = default;
    Query& operator=(Query&&) noexcept = default;

    /// Skip entities that hold a component in @p storage.
    Query& Exclude(const IComponentStorage& storage) {
        excludes_.push_back(&storage);
        cacheValid_ = false;
        return *this;
    }

    /// Invoke @p func(entity, includes&...) for every match.
    template <typename Func>
    void ForEach(Func&& func) {
        RefreshCache();
        // Iterate a snapshot so the callback may add or remove components
        // of unrelated types without disturbing this walk.
        const auto snapshot = cachedEntities_;
        for (Entity e : snapshot) {
            if (!(std::get<ComponentStorage<Includes>*>(storages_)->Has(e) && ...)) {
                continue;
            }
            func(e, std::get<ComponentStorage<Includes>*>(storages_)->Get(e)...);
        }
    }

    [[nodiscard]] std::size_t Count() const {
        RefreshCache();
        return cachedEntities_.size();
    }

    /// First match, or Entity::invalid().
    [[nodiscard]] Entity First() const {
        RefreshCache();
        return cachedEntities_.empty() ? Entity::invalid() : cachedEntities_.front();
    }

    /// Matching handles as a plain list.
    [[nodiscard]] std::vector<Entity> Collect() const {
        RefreshCache();
        return cachedEntities_;
    }

    [[nodiscard]] const_iterator begin() const {
        RefreshCache();
        return cachedEntities_.cbegin();
    }
    [[nodiscard]] const_iterator end() const { return cachedEntities_.cend(); }

private:
    [[nodiscard]] uint64_t computeVersionFingerprint() const noexcept {
        uint64_t fp = 0;
        std::apply(
            [&](auto*... ptrs) { ((fp += ptrs->Version()), ...); },
            storages_);
        for (const auto* ex : excludes_) {
            fp += ex->Version();
        }
        return fp;
    }

    void RefreshCache() const {
        const uint64_t fp = computeVersionFingerprint();
        if (cacheValid_ && cacheVersion_ == fp) {
            return;
        }

        cachedEntities_.clear();

        // Drive the walk from the smallest included storage.
        const IComponentStorage* smallest = nullptr;
        std::size_t smallestSize = std::numeric_limits<std::size_t>::max();
        std::apply(
            [&](auto*... ptrs) {
                auto pick = [&](const IComponentStorage* p) {
                    if (p->Size() < smallestSize) {
                        smallest = p;
                        smallestSize = p->Size();
                    }
                };
                (pick(ptrs), ...);
            },
            storages_);

        for (std::size_t i = 0; smallest != nullptr && i < smallestSize; ++i) {
            const Entity entity = smallest->EntityAt(i);

            bool matches = std::apply(
                [&](auto*... ptrs) { return (ptrs->Has(entity) && ...); },
                storages_);
            for (const auto* ex : excludes_) {
                if (!matches) {
                    break;
                }
                matches = !ex->Has(entity);
            }

            if (matches) {
                cachedEntities_.push_back(entity);
            }
        }

        cacheVersion_ = fp;
        cacheValid_ = true;
    }

    std::tuple<ComponentStorage<Includes>*...> storages_;
    std::vector<const IComponentStorage*> excludes_;

    mutable std::vector<Entity> cachedEntities_;
    mutable uint64_t cacheVersion_ = 0;
    mutable bool cacheValid_ = false;
};

} // namespace arc::ecs
