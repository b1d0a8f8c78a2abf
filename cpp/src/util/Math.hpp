#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <ostream>
#include <vector>

namespace amtraj {

struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    Vec3() = default;
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vec3& operator+=(const Vec3& other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    Vec3& operator/=(double scalar) {
        x /= scalar;
        y /= scalar;
        z /= scalar;
        return *this;
    }
};

inline bool operator==(const Vec3& lhs, const Vec3& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.z == rhs.z;
}

inline bool operator!=(const Vec3& lhs, const Vec3& rhs) {
    return !(lhs == rhs);
}

inline Vec3 operator+(Vec3 lhs, const Vec3& rhs) {
    lhs += rhs;
    return lhs;
}

inline Vec3 operator/(Vec3 lhs, double scalar) {
    lhs /= scalar;
    return lhs;
}

inline double dot(const Vec3& a, const Vec3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return Vec3{
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x};
}

struct Mat3 {
    // column-major: each column is one box vector.
    std::array<Vec3, 3> cols{};

    Mat3() = default;
    Mat3(const Vec3& c0, const Vec3& c1, const Vec3& c2) {
        cols[0] = c0;
        cols[1] = c1;
        cols[2] = c2;
    }

    double determinant() const {
        return dot(cols[0], cross(cols[1], cols[2]));
    }
};

// Unit cell parameters [a, b, c, alpha, beta, gamma] (degrees) to box vectors,
// with a along x and b in the xy plane.
inline Mat3 cellToBox(const std::array<double, 6>& cell) {
    const double deg2rad = 3.14159265358979323846 / 180.0;
    double a = cell[0];
    double b = cell[1];
    double c = cell[2];
    double ca = std::cos(cell[3] * deg2rad);
    double cb = std::cos(cell[4] * deg2rad);
    double cg = std::cos(cell[5] * deg2rad);
    double sg = std::sin(cell[5] * deg2rad);

    // exact zeros for the orthorhombic case
    if (cell[3] == 90.0) ca = 0.0;
    if (cell[4] == 90.0) cb = 0.0;
    if (cell[5] == 90.0) {
        cg = 0.0;
        sg = 1.0;
    }

    Vec3 a_vec{a, 0.0, 0.0};
    Vec3 b_vec{b * cg, b * sg, 0.0};
    double cx = c * cb;
    double cy = c * (ca - cb * cg) / sg;
    double cz = std::sqrt(std::max(0.0, c * c - cx * cx - cy * cy));
    Vec3 c_vec{cx, cy, cz};
    return Mat3{a_vec, b_vec, c_vec};
}

inline Vec3 centerOfGeometry(const std::vector<Vec3>& positions) {
    Vec3 sum;
    if (positions.empty()) {
        return sum;
    }
    for (const auto& p : positions) {
        sum += p;
    }
    return sum / static_cast<double>(positions.size());
}

inline std::ostream& operator<<(std::ostream& os, const Vec3& v) {
    os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    return os;
}

}  // namespace amtraj
