/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VOXELNAV_VECTOR_2D_HPP
#define VOXELNAV_VECTOR_2D_HPP

#include <cmath>

namespace VoxelNav {

// A 2D vector on the ground (XZ) plane. Height is carried separately by
// Position since navigation never looks at it.
class Vector2D {
public:
    // Constructors
    Vector2D() : m_x(0.0f), m_z(0.0f) {}
    Vector2D(float x, float z) : m_x(x), m_z(z) {}

    // Getters and setters
    float getX() const { return m_x; }
    float getZ() const { return m_z; }
    void setX(float x) { m_x = x; }
    void setZ(float z) { m_z = z; }

    float length() const { return std::sqrt(lengthSquared()); }
    float lengthSquared() const { return m_x * m_x + m_z * m_z; }

    Vector2D normalized() const {
        float lenSq = lengthSquared();
        if (lenSq < 0.0001f) return Vector2D(1.0f, 0.0f); // Default direction
        float invLen = 1.0f / std::sqrt(lenSq);
        return Vector2D(m_x * invLen, m_z * invLen);
    }

    float dot(const Vector2D& v2) const {
        return m_x * v2.m_x + m_z * v2.m_z;
    }

    // Yaw angle for a model facing +Z at angle 0
    float heading() const { return std::atan2(m_x, m_z); }

    // Operator overloads
    Vector2D operator+(const Vector2D& v2) const {
        return Vector2D(m_x + v2.m_x, m_z + v2.m_z);
    }

    friend Vector2D& operator+=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x += v2.m_x;
        v1.m_z += v2.m_z;
        return v1;
    }

    Vector2D operator*(float scalar) const {
        return Vector2D(m_x * scalar, m_z * scalar);
    }

    Vector2D& operator*=(float scalar) {
        m_x *= scalar;
        m_z *= scalar;
        return *this;
    }

    Vector2D operator-(const Vector2D& v2) const {
        return Vector2D(m_x - v2.m_x, m_z - v2.m_z);
    }

    friend Vector2D& operator-=(Vector2D& v1, const Vector2D& v2) {
        v1.m_x -= v2.m_x;
        v1.m_z -= v2.m_z;
        return v1;
    }

    Vector2D operator/(float scalar) const {
        return Vector2D(m_x / scalar, m_z / scalar);
    }

    bool operator==(const Vector2D& v2) const {
        return m_x == v2.m_x && m_z == v2.m_z;
    }

    static float distanceSquared(const Vector2D& a, const Vector2D& b) {
        float dx = a.m_x - b.m_x;
        float dz = a.m_z - b.m_z;
        return dx * dx + dz * dz;
    }

    static float distance(const Vector2D& a, const Vector2D& b) {
        return std::sqrt(distanceSquared(a, b));
    }

private:
    float m_x{0.0f};
    float m_z{0.0f};
};

} // namespace VoxelNav

#endif  // VOXELNAV_VECTOR_2D_HPP
