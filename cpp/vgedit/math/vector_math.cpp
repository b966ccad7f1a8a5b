#include "vgedit/math/vector_math.h"

#include <cmath>

namespace vgedit {

namespace {

constexpr double kPi = 3.14159265358979323846;

} // namespace

Mat3 Mat3::identity() noexcept {
    Mat3 out;
    out.m = {
        1.0, 0.0, 0.0,
        0.0, 1.0, 0.0,
        0.0, 0.0, 1.0,
    };
    return out;
}

Mat3 Mat3::operator*(const Mat3& rhs) const noexcept {
    Mat3 out;
    for (std::size_t r = 0; r < 3; ++r) {
        for (std::size_t c = 0; c < 3; ++c) {
            double sum = 0.0;
            for (std::size_t k = 0; k < 3; ++k) {
                sum += at(r, k) * rhs.at(k, c);
            }
            out.at(r, c) = sum;
        }
    }
    return out;
}

Mat4 Mat4::identity() noexcept {
    Mat4 out;
    out.m = {
        1.0, 0.0, 0.0, 0.0,
        0.0, 1.0, 0.0, 0.0,
        0.0, 0.0, 1.0, 0.0,
        0.0, 0.0, 0.0, 1.0,
    };
    return out;
}

Mat4 Mat4::operator*(const Mat4& rhs) const noexcept {
    Mat4 out;
    for (std::size_t r = 0; r < 4; ++r) {
        for (std::size_t c = 0; c < 4; ++c) {
            double sum = 0.0;
            for (std::size_t k = 0; k < 4; ++k) {
                sum += at(r, k) * rhs.at(k, c);
            }
            out.at(r, c) = sum;
        }
    }
    return out;
}

double dot(const Vec2& a, const Vec2& b) noexcept { return a.x * b.x + a.y * b.y; }
double cross(const Vec2& a, const Vec2& b) noexcept { return a.x * b.y - a.y * b.x; }
double length(const Vec2& v) noexcept { return std::sqrt(dot(v, v)); }

bool nearlyEqual(const Vec2& a, const Vec2& b, double tol) noexcept {
    return std::abs(a.x - b.x) <= tol && std::abs(a.y - b.y) <= tol;
}

double degreesToRadians(double deg) noexcept { return deg * (kPi / 180.0); }

Vec2 transform(const Vec2& v, const Mat3& matrix) noexcept {
    // w is implicitly 1 and affine matrices keep it at 1.
    return Vec2{
        v.x * matrix.at(0, 0) + v.y * matrix.at(1, 0) + matrix.at(2, 0),
        v.x * matrix.at(0, 1) + v.y * matrix.at(1, 1) + matrix.at(2, 1),
    };
}

Vec3 transform(const Vec3& v, const Mat4& matrix) noexcept {
    return Vec3{
        v.x * matrix.at(0, 0) + v.y * matrix.at(1, 0) + v.z * matrix.at(2, 0) + matrix.at(3, 0),
        v.x * matrix.at(0, 1) + v.y * matrix.at(1, 1) + v.z * matrix.at(2, 1) + matrix.at(3, 1),
        v.x * matrix.at(0, 2) + v.y * matrix.at(1, 2) + v.z * matrix.at(2, 2) + matrix.at(3, 2),
    };
}

std::vector<Vec2> transformed(const std::vector<Vec2>& vertices, const Mat3& matrix) {
    std::vector<Vec2> out;
    out.reserve(vertices.size());
    for (const Vec2& v : vertices) out.push_back(transform(v, matrix));
    return out;
}

std::vector<Vec3> transformed(const std::vector<Vec3>& vertices, const Mat4& matrix) {
    std::vector<Vec3> out;
    out.reserve(vertices.size());
    for (const Vec3& v : vertices) out.push_back(transform(v, matrix));
    return out;
}

Mat3 translationMatrix(double dx, double dy) noexcept {
    Mat3 out = Mat3::identity();
    out.at(2, 0) = dx;
    out.at(2, 1) = dy;
    return out;
}

Mat3 scaleMatrix(double sx, double sy) noexcept {
    Mat3 out = Mat3::identity();
    out.at(0, 0) = sx;
    out.at(1, 1) = sy;
    return out;
}

Mat3 rotationMatrix(double angleDeg) noexcept {
    const double a = degreesToRadians(angleDeg);
    const double c = std::cos(a);
    const double s = std::sin(a);
    // x' = x*c - y*s, y' = x*s + y*c
    Mat3 out = Mat3::identity();
    out.at(0, 0) = c;
    out.at(0, 1) = s;
    out.at(1, 0) = -s;
    out.at(1, 1) = c;
    return out;
}

Mat3 aroundPivot(const Mat3& matrix, const Vec2& pivot) noexcept {
    return translationMatrix(-pivot.x, -pivot.y) * matrix * translationMatrix(pivot.x, pivot.y);
}

Mat4 translationMatrix3D(const Vec3& offset) noexcept {
    Mat4 out = Mat4::identity();
    out.at(3, 0) = offset.x;
    out.at(3, 1) = offset.y;
    out.at(3, 2) = offset.z;
    return out;
}

Mat4 scaleMatrix3D(const Vec3& factor) noexcept {
    Mat4 out = Mat4::identity();
    out.at(0, 0) = factor.x;
    out.at(1, 1) = factor.y;
    out.at(2, 2) = factor.z;
    return out;
}

Mat4 rotationMatrixX(double angleDeg) noexcept {
    const double a = degreesToRadians(angleDeg);
    const double c = std::cos(a);
    const double s = std::sin(a);
    Mat4 out = Mat4::identity();
    out.at(1, 1) = c;
    out.at(1, 2) = s;
    out.at(2, 1) = -s;
    out.at(2, 2) = c;
    return out;
}

Mat4 rotationMatrixY(double angleDeg) noexcept {
    const double a = degreesToRadians(angleDeg);
    const double c = std::cos(a);
    const double s = std::sin(a);
    Mat4 out = Mat4::identity();
    out.at(0, 0) = c;
    out.at(0, 2) = -s;
    out.at(2, 0) = s;
    out.at(2, 2) = c;
    return out;
}

Mat4 rotationMatrixZ(double angleDeg) noexcept {
    const double a = degreesToRadians(angleDeg);
    const double c = std::cos(a);
    const double s = std::sin(a);
    Mat4 out = Mat4::identity();
    out.at(0, 0) = c;
    out.at(0, 1) = s;
    out.at(1, 0) = -s;
    out.at(1, 1) = c;
    return out;
}

Mat4 rotationMatrix3D(double angleXDeg, double angleYDeg, double angleZDeg) noexcept {
    return rotationMatrixX(angleXDeg) * rotationMatrixY(angleYDeg) * rotationMatrixZ(angleZDeg);
}

Mat4 aroundPivot3D(const Mat4& matrix, const Vec3& pivot) noexcept {
    return translationMatrix3D(-pivot) * matrix * translationMatrix3D(pivot);
}

} // namespace vgedit
