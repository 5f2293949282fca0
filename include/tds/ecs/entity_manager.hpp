#pragma once

/// @file entity_manager.hpp
/// @brief Entity lifecycle management for the ECS.
///
/// EntityManager owns the canonical entity state: creation, generation-based
/// slot recycling, immediate and deferred destruction, and liveness checks.
/// It also holds references to all registered component storages so that
/// components are automatically cleaned up when an entity is destroyed.

#include "tds/ecs/component_storage.hpp"
#include "tds/ecs/entity.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace tds::ecs {

/// Manages the full lifecycle of entities.
///
/// When an entity is destroyed its slot is pushed onto a FIFO free list and
/// the slot generation is incremented, invalidating every outstanding handle
/// (projectile targets, tower selection) that still refers to it.
class EntityManager {
public:
    EntityManager() = default;

    // Non-copyable, movable.
    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Create a new entity, recycling the oldest freed slot if any.
    [[nodiscard]] Entity Create();

    /// Immediately destroy @p entity and remove all its components.
    /// Destroying a dead or stale entity is a no-op.
    void Destroy(Entity entity);

    /// Queue @p entity for destruction at the next `FlushDeferred()`.
    ///
    /// Used while a system iterates a storage, where immediate removal
    /// would reorder the dense array under it.
    void DestroyDeferred(Entity entity);

    /// Destroy every entity queued via `DestroyDeferred()`.
    ///
    /// Entities that died between queueing and flushing are skipped.
    void FlushDeferred();

    /// Destroy every entity, clear registered storages, and forget all slots.
    ///
    /// Storage registrations are kept.  Handles issued before the reset must
    /// not be used afterwards: slot generations restart at zero.
    void Reset();

    // ── Queries ──────────────────────────────────────────────────────

    /// Check whether @p entity is currently alive.
    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// Number of currently alive entities.
    [[nodiscard]] std::size_t Count() const noexcept;

    /// Number of slots ever allocated (alive or on the free list).
    [[nodiscard]] std::size_t Capacity() const noexcept;

    // ── Component storage registration ───────────────────────────────

    /// Register a storage so that destruction calls `storage->Remove(entity)`.
    ///
    /// The manager does **not** take ownership of the storage.
    void RegisterStorage(IComponentStorage* storage);

private:
    void destroyInternal(Entity entity);

    /// Current generation per slot.
    std::vector<uint8_t> generations_;

    /// Alive flag per slot.
    std::vector<bool> alive_;

    /// FIFO queue of recycled slots available for reuse.
    std::deque<uint32_t> freeList_;

    /// Entities queued for deferred destruction.
    std::vector<Entity> pendingDestroy_;

    /// Registered component storages for automatic cleanup.
    std::vector<IComponentStorage*> storages_;

    std::size_t count_ = 0;
};

}  // namespace tds::ecs
