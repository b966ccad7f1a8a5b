#ifndef VGEDIT_MATH_VECTOR_MATH_H
#define VGEDIT_MATH_VECTOR_MATH_H

#include <array>
#include <cstddef>
#include <vector>

// Homogeneous vectors and affine matrices.
//
// Convention: row vector times matrix, v' = v * M. A composite built as
// A * B applies A first, then B. Matrices are stored row-major and the
// homogeneous coordinate of Vec2/Vec3 is an implicit 1.

namespace vgedit {

struct Vec2 {
    double x{0.0};
    double y{0.0};

    Vec2() = default;
    Vec2(double ax, double ay) : x(ax), y(ay) {}

    Vec2 operator+(const Vec2& o) const noexcept { return Vec2{x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const noexcept { return Vec2{x - o.x, y - o.y}; }
    Vec2 operator*(double s) const noexcept { return Vec2{x * s, y * s}; }
    Vec2 operator/(double s) const noexcept { return Vec2{x / s, y / s}; }
    Vec2 operator-() const noexcept { return Vec2{-x, -y}; }
    Vec2& operator+=(const Vec2& o) noexcept { x += o.x; y += o.y; return *this; }
    Vec2& operator-=(const Vec2& o) noexcept { x -= o.x; y -= o.y; return *this; }

    bool operator==(const Vec2& o) const noexcept { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const noexcept { return !(*this == o); }
};

struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    Vec3() = default;
    Vec3(double ax, double ay, double az) : x(ax), y(ay), z(az) {}

    Vec3 operator+(const Vec3& o) const noexcept { return Vec3{x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const noexcept { return Vec3{x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(double s) const noexcept { return Vec3{x * s, y * s, z * s}; }
    Vec3 operator-() const noexcept { return Vec3{-x, -y, -z}; }

    bool operator==(const Vec3& o) const noexcept { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const noexcept { return !(*this == o); }
};

// 3x3 affine matrix for 2D homogeneous coordinates.
struct Mat3 {
    std::array<double, 9> m{};

    static Mat3 identity() noexcept;

    double& at(std::size_t row, std::size_t col) noexcept { return m[row * 3 + col]; }
    double at(std::size_t row, std::size_t col) const noexcept { return m[row * 3 + col]; }

    Mat3 operator*(const Mat3& rhs) const noexcept;
};

// 4x4 affine matrix for 3D homogeneous coordinates.
struct Mat4 {
    std::array<double, 16> m{};

    static Mat4 identity() noexcept;

    double& at(std::size_t row, std::size_t col) noexcept { return m[row * 4 + col]; }
    double at(std::size_t row, std::size_t col) const noexcept { return m[row * 4 + col]; }

    Mat4 operator*(const Mat4& rhs) const noexcept;
};

double dot(const Vec2& a, const Vec2& b) noexcept;
double cross(const Vec2& a, const Vec2& b) noexcept;
double length(const Vec2& v) noexcept;
bool nearlyEqual(const Vec2& a, const Vec2& b, double tol) noexcept;

double degreesToRadians(double deg) noexcept;

// v * M
Vec2 transform(const Vec2& v, const Mat3& matrix) noexcept;
Vec3 transform(const Vec3& v, const Mat4& matrix) noexcept;

std::vector<Vec2> transformed(const std::vector<Vec2>& vertices, const Mat3& matrix);
std::vector<Vec3> transformed(const std::vector<Vec3>& vertices, const Mat4& matrix);

Mat3 translationMatrix(double dx, double dy) noexcept;
Mat3 scaleMatrix(double sx, double sy) noexcept;
// Counter-clockwise (right-hand) rotation about the origin.
Mat3 rotationMatrix(double angleDeg) noexcept;
// translate(-pivot) * matrix * translate(pivot)
Mat3 aroundPivot(const Mat3& matrix, const Vec2& pivot) noexcept;

Mat4 translationMatrix3D(const Vec3& offset) noexcept;
Mat4 scaleMatrix3D(const Vec3& factor) noexcept;
Mat4 rotationMatrixX(double angleDeg) noexcept;
Mat4 rotationMatrixY(double angleDeg) noexcept;
Mat4 rotationMatrixZ(double angleDeg) noexcept;
// Rx(ax) * Ry(ay) * Rz(az): X applied first, then Y, then Z.
Mat4 rotationMatrix3D(double angleXDeg, double angleYDeg, double angleZDeg) noexcept;
Mat4 aroundPivot3D(const Mat4& matrix, const Vec3& pivot) noexcept;

} // namespace vgedit

#endif // VGEDIT_MATH_VECTOR_MATH_H
