/// @file entity_manager.cpp
/// @brief Entity lifecycle management implementation.

#include "tds/ecs/entity_manager.hpp"

#include <cassert>

namespace tds::ecs {

// ── Entity lifecycle ─────────────────────────────────────────────────

Entity EntityManager::Create() {
    uint32_t slot = 0;

    if (!freeList_.empty()) {
        slot = freeList_.front();
        freeList_.pop_front();
        alive_[slot] = true;
    } else {
        slot = static_cast<uint32_t>(generations_.size());
        assert(slot <= Entity::kMaxIndex && "Entity index space exhausted");
        generations_.push_back(0);
        alive_.push_back(true);
    }

    ++count_;
    return Entity(slot, generations_[slot]);
}

void EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    destroyInternal(entity);
}

void EntityManager::DestroyDeferred(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    pendingDestroy_.push_back(entity);
}

void EntityManager::FlushDeferred() {
    auto pending = std::move(pendingDestroy_);
    pendingDestroy_.clear();

    for (const auto& entity : pending) {
        if (IsAlive(entity)) {
            destroyInternal(entity);
        }
    }
}

void EntityManager::Reset() {
    for (auto* storage : storages_) {
        storage->Clear();
    }
    generations_.clear();
    alive_.clear();
    freeList_.clear();
    pendingDestroy_.clear();
    count_ = 0;
}

// ── Queries ──────────────────────────────────────────────────────────

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }

    const auto slot = entity.index();
    if (slot >= generations_.size()) {
        return false;
    }

    return alive_[slot] && generations_[slot] == entity.generation();
}

std::size_t EntityManager::Count() const noexcept {
    return count_;
}

std::size_t EntityManager::Capacity() const noexcept {
    return generations_.size();
}

// ── Component storage registration ───────────────────────────────────

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

// ── Private ──────────────────────────────────────────────────────────

void EntityManager::destroyInternal(Entity entity) {
    const auto slot = entity.index();

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    alive_[slot] = false;

    // Generation wraps 255 -> 0; the invalid sentinel is never produced
    // because slot 0x00FFFFFF is never allocated.
    generations_[slot] = static_cast<uint8_t>(generations_[slot] + 1);

    freeList_.push_back(slot);
    --count_;
}

} // namespace tds::ecs
