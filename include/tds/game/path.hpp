#pragma once

/// @file path.hpp
/// @brief Segment-chain path that enemies follow by arc length.

#include <vector>

#include "tds/foundation/game_result.hpp"
#include "tds/game/math_types.hpp"

namespace tds::game {

/// One straight piece of the path.
struct PathSegment {
    Vector2 start;
    Vector2 end;
    float length = 0.0f;
    /// Arc length from the path start to `start`.
    float offset = 0.0f;
};

/// Immutable polyline parameterized by arc length.
///
/// Segment offsets are strictly increasing: Build() rejects zero-length
/// segments, so every arc length maps to exactly one segment.
class Path {
public:
    Path() = default;

    /// Build a path from ordered waypoints.
    /// @return InvalidArgument for fewer than two waypoints or a
    ///         zero-length segment.
    [[nodiscard]] static foundation::GameResult<Path> Build(std::vector<Vector2> waypoints);

    /// Point at arc length @p s, clamped to [0, Length()].
    [[nodiscard]] Vector2 PositionAt(float s) const;

    /// Shortest distance from @p point to any segment of the path.
    [[nodiscard]] float DistanceTo(const Vector2& point) const;

    /// Total arc length.
    [[nodiscard]] float Length() const noexcept { return length_; }

    [[nodiscard]] const std::vector<Vector2>& Waypoints() const noexcept { return waypoints_; }
    [[nodiscard]] const std::vector<PathSegment>& Segments() const noexcept { return segments_; }

private:
    std::vector<Vector2> waypoints_;
    std::vector<PathSegment> segments_;
    float length_ = 0.0f;
};

/// Distance from @p point to segment [a, b].
///
/// Projects onto the segment and clamps to its endpoints; a degenerate
/// segment yields the distance to @p a.
[[nodiscard]] float PointSegmentDistance(const Vector2& point, const Vector2& a, const Vector2& b);

}  // namespace tds::game
