#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set based component storage for the ECS.
///
/// ComponentStorage<T> provides O(1) add / get / has / remove and
/// cache-friendly dense iteration over all components of type T.

#include "tds/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace tds::ecs {

/// Type-erased base for component pools, allowing EntityManager to
/// call Remove / Has / Clear without knowing the component type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Return the entity that owns the component at dense @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;
};

/// Sparse-set component storage.
///
/// Memory layout:
/// @code
///   sparse_  [entity.index] -> dense index  (or kInvalidIndex)
///   dense_   [index]        -> component data
///   owners_  [index]        -> full entity handle owning dense_[index]
/// @endcode
///
/// Removing swaps the last element into the hole, so dense order is not
/// stable across removals.  Systems that need a stable order (targeting
/// tie-breaks) must sort by a component field, not by dense position.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    /// Number of stored components.
    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }

    /// True when no components are stored.
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Add a component for @p entity, constructed from @p args.
    /// @pre `!Has(entity)`; adding a duplicate is undefined behavior.
    /// @return Mutable reference to the newly stored component.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        const auto idx = static_cast<uint32_t>(dense_.size());

        ensureSparseSize(entity.index());
        sparse_[entity.index()] = idx;

        dense_.emplace_back(std::forward<Args>(args)...);
        owners_.push_back(entity);

        return dense_.back();
    }

    /// Get a mutable reference to the component owned by @p entity.
    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.index()]];
    }

    /// Get a const reference to the component owned by @p entity.
    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.index()]];
    }

    /// Pointer to the component owned by @p entity, or nullptr.
    ///
    /// Unlike Has(), this also rejects handles whose generation no longer
    /// matches the stored owner, so it is safe for weak references.
    [[nodiscard]] T* Find(Entity entity) {
        if (!Has(entity)) {
            return nullptr;
        }
        auto idx = sparse_[entity.index()];
        return owners_[idx] == entity ? &dense_[idx] : nullptr;
    }

    [[nodiscard]] const T* Find(Entity entity) const {
        if (!Has(entity)) {
            return nullptr;
        }
        auto idx = sparse_[entity.index()];
        return owners_[idx] == entity ? &dense_[idx] : nullptr;
    }

    /// Check whether the slot of @p entity has a component in this storage.
    [[nodiscard]] bool Has(Entity entity) const override {
        auto slot = entity.index();
        return entity.isValid() && slot < sparse_.size() && sparse_[slot] != kInvalidIndex;
    }

    /// Remove the component owned by @p entity.
    /// Safe to call even if the entity has no component (no-op).
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.index()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            // Swap the removed element with the last element.
            dense_[idx] = std::move(dense_[lastIdx]);
            owners_[idx] = owners_[lastIdx];

            // Update the sparse entry for the moved entity.
            sparse_[owners_[idx].index()] = idx;
        }

        dense_.pop_back();
        owners_.pop_back();
        sparse_[entity.index()] = kInvalidIndex;
    }

    /// Remove all components.
    void Clear() override {
        dense_.clear();
        owners_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    /// Return the entity that owns the component at dense @p index.
    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        assert(index < owners_.size());
        return owners_[index];
    }

    /// Component at dense @p index.
    [[nodiscard]] T& At(std::size_t index) {
        assert(index < dense_.size());
        return dense_[index];
    }

    [[nodiscard]] const T& At(std::size_t index) const {
        assert(index < dense_.size());
        return dense_[index];
    }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t slot) {
        if (slot >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(slot) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;          ///< Packed component data.
    std::vector<Entity> owners_;    ///< dense index -> owning entity.
    std::vector<uint32_t> sparse_;  ///< entity index -> dense index.
};

}  // namespace tds::ecs
