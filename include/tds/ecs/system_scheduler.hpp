#pragma once

/// @file system_scheduler.hpp
/// @brief Staged, dependency-ordered system execution for the ECS.
///
/// SystemScheduler manages system registration, stage-based grouping,
/// dependency-driven topological ordering, and runtime enable/disable.
/// Everything runs on the calling thread: the simulation is single
/// threaded and every tick must observe the fixed system order.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tds::ecs {

// ── System type identification ──────────────────────────────────────────

/// Integer type used to identify system types at runtime.
using SystemTypeId = uint32_t;

/// Sentinel value meaning "no system type".
constexpr SystemTypeId kInvalidSystemTypeId = static_cast<SystemTypeId>(-1);

namespace detail {

/// Global counter for generating unique SystemTypeId values.
inline SystemTypeId nextSystemTypeId() noexcept {
    static std::atomic<SystemTypeId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

/// Obtain the unique SystemTypeId for system type `T`.
template <typename T>
struct SystemType {
    static SystemTypeId Id() noexcept {
        static const SystemTypeId value = detail::nextSystemTypeId();
        return value;
    }
};

// ── Execution stages ────────────────────────────────────────────────────

/// Execution stage for a system.  Stages run in declaration order.
enum class SystemStage : uint8_t {
    PreUpdate,   ///< Spawning: entities enter the world
    Update,      ///< Movement, pruning, combat
    PostUpdate   ///< Wave bookkeeping after combat has settled
};

// ── System interface ────────────────────────────────────────────────────

/// Abstract base class for ECS systems.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Execute this system's logic for the given time step.
    ///
    /// @param deltaTime  Simulated seconds for this tick.
    virtual void Execute(float deltaTime) = 0;

    /// Stage this system belongs to (default: Update).
    [[nodiscard]] virtual SystemStage GetStage() const { return SystemStage::Update; }

    /// Human-readable name for diagnostics.
    [[nodiscard]] virtual std::string_view GetName() const = 0;
};

// ── System scheduler ────────────────────────────────────────────────────

/// Manages system registration, dependency ordering, and staged execution.
///
/// Systems are grouped by stage and topologically sorted within each
/// stage according to explicit dependencies; systems without a constraint
/// between them keep registration order.  Circular dependencies are
/// detected by Build() and reported via GetLastError().
class SystemScheduler {
public:
    SystemScheduler() = default;

    // Non-copyable, movable.
    SystemScheduler(const SystemScheduler&) = delete;
    SystemScheduler& operator=(const SystemScheduler&) = delete;
    SystemScheduler(SystemScheduler&&) noexcept = default;
    SystemScheduler& operator=(SystemScheduler&&) noexcept = default;

    // ── Registration ────────────────────────────────────────────────

    /// Register a system of type `T`, constructing it in-place.
    ///
    /// Re-registering the same type is a no-op and returns the
    /// existing instance.
    template <typename T, typename... Args>
    T& Register(Args&&... args);

    /// Number of registered systems.
    [[nodiscard]] std::size_t SystemCount() const noexcept;

    // ── Dependencies ────────────────────────────────────────────────

    /// Declare that `before` must execute before `after`.
    ///
    /// @return false if either system is not registered or they belong
    ///         to different stages.
    bool AddDependency(SystemTypeId before, SystemTypeId after);

    /// Convenience: declare a dependency using system types.
    template <typename Before, typename After>
    bool AddDependency();

    // ── Enable / disable ────────────────────────────────────────────

    /// Enable or disable a system without changing the execution plan.
    void SetEnabled(SystemTypeId system, bool enabled);

    template <typename T>
    void SetEnabled(bool enabled);

    /// Check if a system is enabled.
    [[nodiscard]] bool IsEnabled(SystemTypeId system) const;

    // ── Execution ───────────────────────────────────────────────────

    /// Build the execution plan (topological sort per stage).
    ///
    /// @return false on circular dependency; see GetLastError().
    [[nodiscard]] bool Build();

    /// True after a successful Build() with no registration since.
    [[nodiscard]] bool IsBuilt() const noexcept { return built_; }

    /// Execute all enabled systems, stage by stage.
    ///
    /// @pre Build() returned true.
    void Execute(float deltaTime);

    /// Error message from the last failed Build().
    [[nodiscard]] const std::string& GetLastError() const noexcept;

    // ── Queries ─────────────────────────────────────────────────────

    /// Retrieve a registered system by type, or nullptr.
    template <typename T>
    [[nodiscard]] T* GetSystem();

    /// Execution order for a stage (after Build).
    [[nodiscard]] const std::vector<SystemTypeId>&
    GetExecutionOrder(SystemStage stage) const;

private:
    struct SystemEntry {
        std::unique_ptr<ISystem> instance;
        SystemTypeId typeId = kInvalidSystemTypeId;
        SystemStage stage = SystemStage::Update;
        bool enabled = true;
    };

    [[nodiscard]] bool topologicalSort(
        const std::vector<SystemTypeId>& ids,
        std::vector<SystemTypeId>& sorted);

    void executeStage(SystemStage stage, float deltaTime);

    std::unordered_map<SystemTypeId, SystemEntry> systems_;

    /// Systems grouped by stage (registration order within stage).
    std::unordered_map<SystemStage, std::vector<SystemTypeId>> stageGroups_;

    /// dependencies_[A] contains all B where A must run before B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> dependencies_;

    /// reverseDeps_[B] contains all A where A must run before B.
    std::unordered_map<SystemTypeId, std::unordered_set<SystemTypeId>> reverseDeps_;

    std::unordered_map<SystemStage, std::vector<SystemTypeId>> executionOrder_;

    bool built_ = false;
    std::string lastError_;

    static const std::vector<SystemTypeId> kEmptyOrder_;
};

// ── Template implementations ────────────────────────────────────────────

template <typename T, typename... Args>
T& SystemScheduler::Register(Args&&... args) {
    static_assert(std::is_base_of_v<ISystem, T>,
                  "T must derive from ISystem");

    const auto typeId = SystemType<T>::Id();

    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T&>(*it->second.instance);
    }

    auto system = std::make_unique<T>(std::forward<Args>(args)...);
    T& ref = *system;

    SystemEntry entry;
    entry.instance = std::move(system);
    entry.typeId = typeId;
    entry.stage = ref.GetStage();
    entry.enabled = true;

    stageGroups_[entry.stage].push_back(typeId);
    systems_.emplace(typeId, std::move(entry));

    built_ = false;

    return ref;
}

template <typename Before, typename After>
bool SystemScheduler::AddDependency() {
    return AddDependency(SystemType<Before>::Id(), SystemType<After>::Id());
}

template <typename T>
void SystemScheduler::SetEnabled(bool enabled) {
    SetEnabled(SystemType<T>::Id(), enabled);
}

template <typename T>
T* SystemScheduler::GetSystem() {
    const auto typeId = SystemType<T>::Id();
    if (auto it = systems_.find(typeId); it != systems_.end()) {
        return static_cast<T*>(it->second.instance.get());
    }
    return nullptr;
}

} // namespace tds::ecs
