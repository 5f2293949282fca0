#pragma once

/// @file game_error.hpp
/// @brief Error value carried by GameResult.

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include "tds/foundation/error_code.hpp"

namespace tds::foundation {

/// Whether @p code reports a rejected player action.
///
/// Rejections (bad placement, missing funds, wave already running, game
/// over) leave the session untouched and are routine; every other code is
/// a load or internal fault.
constexpr bool isActionRejection(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0900:
        case 0x0A00:
        case 0x0B00:
            return true;
        default:
            return code == ErrorCode::GameIsOver;
    }
}

/// Error code plus a message for the log or the console.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool isRejection() const noexcept { return isActionRejection(code_); }

    /// One-line form, e.g. `Placement 0x0901: too close to the path`.
    [[nodiscard]] std::string describe() const {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%04X", static_cast<unsigned>(code_));
        std::string out(subsystem());
        out += ' ';
        out += hex;
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace tds::foundation
