#pragma once

/// @file entity.hpp
/// @brief Entity handle for the ECS layer.
///
/// An entity is a 32-bit handle combining a slot index (24 bits) with a
/// generation counter (8 bits).  Enemies, towers and projectiles are all
/// entities.  Handles are safe to hold across ticks as weak references:
/// once the slot is recycled the generation no longer matches and
/// EntityManager::IsAlive() reports the handle as stale.

#include <cstdint>
#include <functional>
#include <limits>

namespace tds::ecs {

/// Compact entity handle: 24-bit index + 8-bit generation packed into 32 bits.
struct Entity {
    uint32_t raw = kInvalidRaw;

    // Bit layout constants.
    static constexpr uint32_t kIndexBits = 24;
    static constexpr uint32_t kGenerationBits = 8;
    static constexpr uint32_t kIndexMask = (1u << kIndexBits) - 1;     // 0x00FFFFFF
    static constexpr uint32_t kGenerationShift = kIndexBits;
    static constexpr uint32_t kInvalidRaw = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kMaxIndex = kIndexMask - 1;  // 0x00FFFFFF is reserved

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    /// Construct from a slot index and a generation.
    constexpr Entity(uint32_t index, uint8_t generation)
        : raw((static_cast<uint32_t>(generation) << kGenerationShift) | (index & kIndexMask)) {}

    /// Slot index (0 .. 16'777'214).
    [[nodiscard]] constexpr uint32_t index() const noexcept { return raw & kIndexMask; }

    /// Generation of the slot at the time the handle was issued.
    [[nodiscard]] constexpr uint8_t generation() const noexcept {
        return static_cast<uint8_t>(raw >> kGenerationShift);
    }

    /// True unless this is the invalid sentinel.  Says nothing about liveness.
    [[nodiscard]] constexpr bool isValid() const noexcept { return raw != kInvalidRaw; }

    /// The canonical invalid entity.
    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

static_assert(sizeof(Entity) == 4, "Entity must be exactly 32 bits");

} // namespace tds::ecs

// Hash support for unordered containers.
template <>
struct std::hash<tds::ecs::Entity> {
    std::size_t operator()(const tds::ecs::Entity& e) const noexcept {
        return std::hash<uint32_t>{}(e.raw);
    }
};
