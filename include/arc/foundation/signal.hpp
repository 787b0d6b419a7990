#pragma once

/// @file signal.hpp
/// @brief Signal<Args...> carrying outward events from the rules core.
///
/// Combat text, score updates, camera shake and dialogue requests are
/// published through signals so the rules never depend on a renderer.

#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace arc::foundation {

/// Single-threaded signal. Slots run in connection order.
///
/// Example:
/// @code
///   Signal<int32_t> scoreUpdate;
///   auto id = scoreUpdate.connect([](int32_t score) { hud.setScore(score); });
///   scoreUpdate.emit(100);
///   scoreUpdate.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    SlotId connect(Slot slot) {
        auto id = nextId_++;
        slots_.emplace(id, std::move(slot));
        return id;
    }

    void disconnect(SlotId id) { slots_.erase(id); }

    /// Invoke every slot. Slots may connect or disconnect while the
    /// signal fires; such changes take effect on the next emit().
    void emit(Args... args) const {
        std::vector<Slot> snapshot;
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
        for (const auto& slot : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }

private:
    std::map<SlotId, Slot> slots_;
    SlotId nextId_ = 1;
};

} // namespace arc::foundation
