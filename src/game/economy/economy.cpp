/// @file economy.cpp
/// @brief Money and lives bookkeeping.

#include "tds/game/economy.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace tds::game {

using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameResult;

int64_t RoundToMoney(double amount) noexcept {
    // 2^63 is exactly representable; anything at or above it saturates.
    constexpr double kCeiling = 9223372036854775808.0;
    if (!(amount > 0.0)) {
        return 0;
    }
    if (amount >= kCeiling) {
        return kMaxMoney;
    }
    return std::llround(amount);
}

GameResult<void> Economy::Spend(int64_t amount) {
    if (amount < 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot spend a negative amount"));
    }
    if (!CanAfford(amount)) {
        return GameResult<void>::err(
            GameError(ErrorCode::InsufficientFunds,
                      "need " + std::to_string(amount) + ", have " + std::to_string(money_)));
    }
    money_ -= amount;
    return GameResult<void>::ok();
}

void Economy::Earn(int64_t amount) noexcept {
    if (amount <= 0) {
        return;
    }
    money_ = amount > kMaxMoney - money_ ? kMaxMoney : money_ + amount;
}

bool Economy::LoseLife() noexcept {
    lives_ = std::max(lives_ - 1, 0);
    return lives_ <= 0;
}

Economy::WaveReward Economy::ComputeWaveReward(const EconomyRules& rules) const {
    WaveReward payout;
    payout.reward = rules.waveRewardFlat;
    payout.bonus = RoundToMoney(
        std::floor(static_cast<double>(money_) * static_cast<double>(rules.waveInterestRate)));
    return payout;
}

}  // namespace tds::game
