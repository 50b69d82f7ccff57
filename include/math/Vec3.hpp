#pragma once

#include <cmath>

namespace math {

/**
 * Vec3: 3D vector in tracking space (meters)
 */
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    static Vec3 zero() { return {0.0f, 0.0f, 0.0f}; }

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
    Vec3 operator/(float s) const { return {x / s, y / s, z / s}; }

    Vec3& operator+=(const Vec3& o) {
        x += o.x; y += o.y; z += o.z;
        return *this;
    }

    [[nodiscard]] float length() const {
        return std::sqrt(x * x + y * y + z * z);
    }
};

inline float distance(const Vec3& a, const Vec3& b) {
    return (a - b).length();
}

/**
 * Quat: rotation quaternion (x, y, z, w), identity by default
 */
struct Quat {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 1.0f;
};

} // namespace math
