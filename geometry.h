#pragma once
#include <clipper2/clipper.h>
#include <string>
#include <vector>

constexpr double kPi = 3.14159265358979323846;

// Axis aligned box in drawing units (mm). An empty box has min > max.
struct BBox {
    double minX =  1e300;
    double minY =  1e300;
    double maxX = -1e300;
    double maxY = -1e300;

    bool empty() const { return minX > maxX || minY > maxY; }
    double width() const  { return empty() ? 0.0 : maxX - minX; }
    double height() const { return empty() ? 0.0 : maxY - minY; }

    void add(double x, double y);
    void add(const BBox& other);
};

BBox boxFromRect(const Clipper2Lib::RectD& r);
BBox boxOfPath(const Clipper2Lib::PathD& path);
BBox translateBox(const BBox& b, double dx, double dy);
Clipper2Lib::PathD boxOutline(const BBox& b);

// Exact bounds of a circular arc, angles in degrees counter clockwise.
BBox arcBounds(const Clipper2Lib::PointD& c, double r, double startDeg, double endDeg);

// 2D affine map: scale, then rotate, then translate.
struct Transform2D {
    double a = 1, b = 0, c = 0, d = 1;
    double tx = 0, ty = 0;

    Clipper2Lib::PointD apply(const Clipper2Lib::PointD& p) const {
        return { a * p.x + c * p.y + tx, b * p.x + d * p.y + ty };
    }
    static Transform2D insert(double x, double y, double sx, double sy, double rotDeg);
    Transform2D then(const Transform2D& outer) const;
};

BBox transformBox(const BBox& b, const Transform2D& t);

constexpr long long kMaxThousandths = 1000000000000000000LL;

// Round half away from zero to 3 decimals and return thousandths. The
// shortest decimal form of `v` is rounded, not its binary value. Saturates
// at +-kMaxThousandths.
long long thousandths(double v);
// "0.###": up to 3 decimals, trailing zeros trimmed.
std::string formatThickness(double v);
// Thickness text usable in a file name ("6.5" -> "6_5").
std::string fileSafeThickness(double v);

double estimateTextWidth(const std::string& text, double textHeight, double factor);
