#pragma once

#include <cmath>

namespace scribble {
    struct Vec2 {
        float x, y;

        Vec2() : x(0), y(0) {
        }

        Vec2(float X, float Y) : x(X), y(Y) {
        }
    };

    // Positions are normalized device coordinates, [-1,1] on both axes.
    using Point2D = Vec2;

    inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
    inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
    inline Vec2 operator*(Vec2 a, float s) { return {a.x * s, a.y * s}; }
    inline Vec2 operator/(Vec2 a, float s) { return {a.x / s, a.y / s}; }
    inline float dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }
    inline float length(Vec2 a) { return std::sqrt(dot(a, a)); }
    inline float distance(Vec2 a, Vec2 b) { return length(b - a); }

    // Two points closer than this are the same point as far as strokes go.
    constexpr float kVertexEpsilon = 1e-3f;

    // One drawable line instance. Stored as midpoint + (end - start) so the vertex
    // shader can expand a unit quad along the segment without a second fetch.
    struct LineSegment {
        Vec2 center;
        Vec2 direction;

        static LineSegment from_endpoints(Vec2 start, Vec2 end) {
            return {(start + end) * 0.5f, end - start};
        }

        Vec2 start() const { return center - direction * 0.5f; }
        Vec2 end() const { return center + direction * 0.5f; }
    };

    static_assert(sizeof(LineSegment) == sizeof(float) * 4, "LineSegment is uploaded as four packed floats");
} // namespace scribble
