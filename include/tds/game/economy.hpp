#pragma once

/// @file economy.hpp
/// @brief Money and lives bookkeeping.

#include <cstdint>
#include <limits>

#include "tds/foundation/game_result.hpp"
#include "tds/game/game_rules.hpp"

namespace tds::game {

/// Largest balance the economy holds; Earn() saturates here.
inline constexpr int64_t kMaxMoney = std::numeric_limits<int64_t>::max();

/// Convert a scaled reward to money, rounding to nearest and clamping to
/// `[0, kMaxMoney]`.  NaN maps to 0.
[[nodiscard]] int64_t RoundToMoney(double amount) noexcept;

/// Player money and lives.
///
/// Money never goes negative: Spend() rejects any amount above the
/// balance without touching it.  Money is 64-bit because kill rewards
/// scale with enemy hp, which grows without bound.
class Economy {
public:
    Economy() = default;
    explicit Economy(const EconomyRules& rules)
        : money_(rules.startMoney), lives_(rules.startLives) {}

    [[nodiscard]] int64_t Money() const noexcept { return money_; }
    [[nodiscard]] int32_t Lives() const noexcept { return lives_; }

    [[nodiscard]] bool CanAfford(int64_t amount) const noexcept { return amount <= money_; }

    /// Deduct @p amount.
    /// @return InsufficientFunds with no change if the balance is too low.
    foundation::GameResult<void> Spend(int64_t amount);

    /// Add @p amount (kill and wave rewards), saturating at kMaxMoney.
    /// Negative amounts are ignored.
    void Earn(int64_t amount) noexcept;

    /// Remove one life.
    /// @return true when no lives remain afterwards.
    bool LoseLife() noexcept;

    /// Wave completion payout for the current balance.
    ///
    /// The bonus is `floor(waveInterestRate * balance)` measured before
    /// the payout; the flat part is `waveRewardFlat`.
    struct WaveReward {
        int64_t reward = 0;
        int64_t bonus = 0;
    };
    [[nodiscard]] WaveReward ComputeWaveReward(const EconomyRules& rules) const;

private:
    int64_t money_ = 0;
    int32_t lives_ = 0;
};

}  // namespace tds::game
