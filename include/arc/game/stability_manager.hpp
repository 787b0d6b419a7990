#pragma once

/// @file stability_manager.hpp
/// @brief Stagger gauge and the Stable -> Broken -> Stable state machine.
///
/// Damage drains the gauge. Draining it to zero breaks the entity for a
/// fixed wall-clock window; when the window lapses the gauge refills to
/// max. Outside a break the gauge regenerates per frame once a grace
/// period has passed since the last hit.

#include "arc/ecs/component_storage.hpp"
#include "arc/ecs/entity.hpp"
#include "arc/foundation/clock.hpp"
#include "arc/game/rpg_components.hpp"

namespace arc::game {

/// Outcome of ReduceStability().
struct StabilityHit {
    Stability stability;
    bool breakTriggered = false;  ///< True only on the >0 -> 0 transition.
};

class StabilityManager {
public:
    /// Default break window.
    static constexpr foundation::Milliseconds kDefaultBreakDuration{5000};

    /// Quiet time after a hit before regeneration resumes.
    static constexpr foundation::Milliseconds kRegenGrace{1000};

    StabilityManager(ecs::ComponentStorage<Stability>& stability,
                     ecs::ComponentStorage<BreakState>& breaks,
                     const foundation::IClock& clock,
                     foundation::Milliseconds regenGrace = kRegenGrace);

    // ── Pure rules ───────────────────────────────────────────────────────

    /// Full gauge from the table: grunt 100/10, boss 500/20, player 200/15.
    [[nodiscard]] static Stability Initialize(StabilityKind kind);

    /// Drain @p damage (negative treated as 0) and stamp the hit time.
    [[nodiscard]] static StabilityHit ReduceStability(const Stability& state, float damage,
                                                      foundation::WallTime now);

    /// Regenerate by `regenRate * dt`, capped at max, once the grace
    /// period since the last hit has passed.
    [[nodiscard]] static Stability RegenerateStability(const Stability& state,
                                                       foundation::FrameDelta dt,
                                                       foundation::WallTime now,
                                                       foundation::Milliseconds grace = kRegenGrace);

    /// True while @p state is broken and its window has not lapsed.
    [[nodiscard]] static bool IsBroken(const BreakState* state, foundation::WallTime now) noexcept;

    /// Remaining share of the break window in [0, 1]; 0 when not broken.
    [[nodiscard]] static float BreakProgress(const BreakState* state,
                                             foundation::Milliseconds duration,
                                             foundation::WallTime now) noexcept;

    // ── Entity operations ────────────────────────────────────────────────

    /// Break @p entity until now + @p duration.
    void ApplyBreakState(ecs::Entity entity,
                         foundation::Milliseconds duration = kDefaultBreakDuration);

    [[nodiscard]] bool IsBroken(ecs::Entity entity) const;

    /// Expire a lapsed break on @p entity, refilling its gauge.
    /// @return true if the entity is still broken.
    bool UpdateBreakState(ecs::Entity entity);

    /// Drain stability on @p entity and break it on depletion.
    /// Entities without Stability are ignored.
    /// @return true when this hit triggered a break.
    bool ProcessHit(ecs::Entity entity, float damage,
                    foundation::Milliseconds breakDuration = kDefaultBreakDuration);

    /// Per-frame sweep: expire lapsed breaks, then regenerate every
    /// gauge that is not broken.
    void Tick(foundation::FrameDelta dt);

private:
    ecs::ComponentStorage<Stability>& stability_;
    ecs::ComponentStorage<BreakState>& breaks_;
    const foundation::IClock& clock_;
    foundation::Milliseconds regenGrace_;
};

}  // namespace arc::game
