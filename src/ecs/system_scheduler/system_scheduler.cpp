/// @file system_scheduler.cpp
/// @brief Staged system execution with dependency ordering.
///
/// Each stage is ordered independently with Kahn's algorithm.  Circular
/// dependencies are detected and reported with the names of the
/// involved systems.

#include "tds/ecs/system_scheduler.hpp"

#include <cassert>
#include <queue>
#include <sstream>

namespace tds::ecs {

// ── Static members ──────────────────────────────────────────────────────

const std::vector<SystemTypeId> SystemScheduler::kEmptyOrder_;

// ── Registration ────────────────────────────────────────────────────────

std::size_t SystemScheduler::SystemCount() const noexcept {
    return systems_.size();
}

// ── Dependencies ────────────────────────────────────────────────────────

bool SystemScheduler::AddDependency(SystemTypeId before, SystemTypeId after) {
    auto itBefore = systems_.find(before);
    auto itAfter = systems_.find(after);

    if (itBefore == systems_.end() || itAfter == systems_.end()) {
        return false;
    }

    // Stage order is implicit; cross-stage edges are rejected.
    if (itBefore->second.stage != itAfter->second.stage) {
        return false;
    }

    dependencies_[before].insert(after);
    reverseDeps_[after].insert(before);

    built_ = false;
    return true;
}

// ── Enable / disable ────────────────────────────────────────────────────

void SystemScheduler::SetEnabled(SystemTypeId system, bool enabled) {
    if (auto it = systems_.find(system); it != systems_.end()) {
        it->second.enabled = enabled;
    }
}

bool SystemScheduler::IsEnabled(SystemTypeId system) const {
    if (auto it = systems_.find(system); it != systems_.end()) {
        return it->second.enabled;
    }
    return false;
}

// ── Build ───────────────────────────────────────────────────────────────

bool SystemScheduler::Build() {
    lastError_.clear();
    executionOrder_.clear();

    for (const auto& [stage, ids] : stageGroups_) {
        std::vector<SystemTypeId> sorted;
        if (!topologicalSort(ids, sorted)) {
            built_ = false;
            return false;
        }
        executionOrder_[stage] = std::move(sorted);
    }

    built_ = true;
    return true;
}

bool SystemScheduler::topologicalSort(const std::vector<SystemTypeId>& ids,
                                      std::vector<SystemTypeId>& sorted) {
    std::unordered_set<SystemTypeId> stageSet(ids.begin(), ids.end());

    std::unordered_map<SystemTypeId, uint32_t> inDegree;
    for (auto id : ids) {
        inDegree[id] = 0;
    }

    for (auto id : ids) {
        if (auto it = reverseDeps_.find(id); it != reverseDeps_.end()) {
            for (auto dep : it->second) {
                if (stageSet.contains(dep)) {
                    ++inDegree[id];
                }
            }
        }
    }

    // Seed in registration order so unconstrained systems keep it.
    std::queue<SystemTypeId> ready;
    for (auto id : ids) {
        if (inDegree[id] == 0) {
            ready.push(id);
        }
    }

    sorted.clear();
    sorted.reserve(ids.size());

    while (!ready.empty()) {
        auto current = ready.front();
        ready.pop();
        sorted.push_back(current);

        auto it = dependencies_.find(current);
        if (it == dependencies_.end()) {
            continue;
        }

        // Release successors in registration order for a deterministic plan.
        for (auto candidate : ids) {
            if (!it->second.contains(candidate)) {
                continue;
            }
            if (--inDegree[candidate] == 0) {
                ready.push(candidate);
            }
        }
    }

    if (sorted.size() != ids.size()) {
        std::ostringstream oss;
        oss << "Circular dependency detected among systems: [";
        bool first = true;
        for (auto id : ids) {
            if (inDegree[id] != 0) {
                if (!first) {
                    oss << ", ";
                }
                oss << systems_.at(id).instance->GetName();
                first = false;
            }
        }
        oss << "]";
        lastError_ = oss.str();
        return false;
    }

    return true;
}

// ── Execution ───────────────────────────────────────────────────────────

void SystemScheduler::Execute(float deltaTime) {
    assert(built_ && "SystemScheduler::Build() must be called before Execute()");

    static constexpr SystemStage kStages[] = {
        SystemStage::PreUpdate,
        SystemStage::Update,
        SystemStage::PostUpdate,
    };

    for (auto stage : kStages) {
        executeStage(stage, deltaTime);
    }
}

void SystemScheduler::executeStage(SystemStage stage, float deltaTime) {
    auto it = executionOrder_.find(stage);
    if (it == executionOrder_.end()) {
        return;
    }
    for (auto typeId : it->second) {
        auto& entry = systems_.at(typeId);
        if (entry.enabled) {
            entry.instance->Execute(deltaTime);
        }
    }
}

// ── Error reporting ─────────────────────────────────────────────────────

const std::string& SystemScheduler::GetLastError() const noexcept {
    return lastError_;
}

// ── Queries ─────────────────────────────────────────────────────────────

const std::vector<SystemTypeId>& SystemScheduler::GetExecutionOrder(SystemStage stage) const {
    auto it = executionOrder_.find(stage);
    if (it != executionOrder_.end()) {
        return it->second;
    }
    return kEmptyOrder_;
}

}  // namespace tds::ecs
