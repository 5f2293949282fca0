/// @file path.cpp
/// @brief Path construction and arc-length queries.

#include "tds/game/path.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace tds::game {

using tds::foundation::ErrorCode;
using tds::foundation::GameError;
using tds::foundation::GameResult;

GameResult<Path> Path::Build(std::vector<Vector2> waypoints) {
    if (waypoints.size() < 2) {
        return GameResult<Path>::err(
            GameError(ErrorCode::InvalidArgument, "path needs at least two waypoints"));
    }

    Path path;
    float offset = 0.0f;
    for (std::size_t i = 0; i + 1 < waypoints.size(); ++i) {
        PathSegment seg;
        seg.start = waypoints[i];
        seg.end = waypoints[i + 1];
        seg.length = Distance(seg.start, seg.end);
        seg.offset = offset;

        if (seg.length <= 0.0f) {
            return GameResult<Path>::err(
                GameError(ErrorCode::InvalidArgument,
                          "path segment " + std::to_string(i) + " has zero length"));
        }

        offset += seg.length;
        path.segments_.push_back(seg);
    }

    path.length_ = offset;
    path.waypoints_ = std::move(waypoints);
    return GameResult<Path>::ok(std::move(path));
}

Vector2 Path::PositionAt(float s) const {
    if (segments_.empty()) {
        return {};
    }

    s = std::clamp(s, 0.0f, length_);

    for (const auto& seg : segments_) {
        if (s <= seg.offset + seg.length) {
            const float t = (s - seg.offset) / seg.length;
            return seg.start + (seg.end - seg.start) * t;
        }
    }
    return segments_.back().end;
}

float Path::DistanceTo(const Vector2& point) const {
    float best = std::numeric_limits<float>::max();
    for (const auto& seg : segments_) {
        best = std::min(best, PointSegmentDistance(point, seg.start, seg.end));
    }
    return best;
}

float PointSegmentDistance(const Vector2& point, const Vector2& a, const Vector2& b) {
    const Vector2 ab = b - a;
    const float lenSq = ab.LengthSquared();
    if (lenSq <= 0.0f) {
        return Distance(point, a);
    }

    const float t = std::clamp((point - a).Dot(ab) / lenSq, 0.0f, 1.0f);
    return Distance(point, a + ab * t);
}

}  // namespace tds::game
