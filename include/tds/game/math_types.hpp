#pragma once

/// @file math_types.hpp
/// @brief Lightweight 2D math types for the simulation layer.
///
/// The play field is a flat 960x540 rectangle, so a two-component vector
/// covers positions, velocities, and beam endpoints.

#include <cmath>

namespace tds::game {

/// Two-component floating-point vector.
struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    // Arithmetic operators.
    constexpr Vector2 operator+(const Vector2& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y};
    }
    constexpr Vector2 operator-(const Vector2& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y};
    }
    constexpr Vector2 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar};
    }

    constexpr Vector2& operator+=(const Vector2& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    constexpr Vector2& operator-=(const Vector2& rhs) noexcept {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    /// Dot product.
    [[nodiscard]] constexpr float Dot(const Vector2& rhs) const noexcept {
        return x * rhs.x + y * rhs.y;
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    /// Magnitude.
    [[nodiscard]] float Length() const noexcept { return std::hypot(x, y); }

    /// Return a normalized copy, or zero vector if length is near zero.
    [[nodiscard]] Vector2 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len};
    }

    /// The zero vector.
    [[nodiscard]] static constexpr Vector2 Zero() noexcept { return {}; }

    constexpr auto operator<=>(const Vector2&) const = default;
};

/// Scalar * Vector2.
constexpr Vector2 operator*(float scalar, const Vector2& v) noexcept {
    return v * scalar;
}

/// Euclidean distance between two points.
[[nodiscard]] inline float Distance(const Vector2& a, const Vector2& b) noexcept {
    return (a - b).Length();
}

}  // namespace tds::game
