#include "geometry.h"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

using namespace Clipper2Lib;

void BBox::add(double x, double y) {
    minX = std::min(minX, x);
    minY = std::min(minY, y);
    maxX = std::max(maxX, x);
    maxY = std::max(maxY, y);
}

void BBox::add(const BBox& o) {
    if (o.empty()) return;
    add(o.minX, o.minY);
    add(o.maxX, o.maxY);
}

// Clipper2 stores min y in `top`; take min/max so either convention works.
BBox boxFromRect(const RectD& r) {
    BBox b;
    b.add(r.left, r.top);
    b.add(r.right, r.bottom);
    return b;
}

BBox boxOfPath(const PathD& path) {
    if (path.empty()) return BBox{};
    return boxFromRect(GetBounds(path));
}

BBox translateBox(const BBox& b, double dx, double dy) {
    if (b.empty()) return b;
    return BBox{ b.minX + dx, b.minY + dy, b.maxX + dx, b.maxY + dy };
}

PathD boxOutline(const BBox& b) {
    return { {b.minX, b.minY}, {b.maxX, b.minY}, {b.maxX, b.maxY}, {b.minX, b.maxY} };
}

static double normDeg(double a) {
    a = std::fmod(a, 360.0);
    if (a < 0) a += 360.0;
    return a;
}

BBox arcBounds(const PointD& c, double r, double startDeg, double endDeg) {
    BBox bb;
    double s = normDeg(startDeg);
    double e = normDeg(endDeg);
    if (e <= s) e += 360.0;
    auto at = [&](double deg) {
        double rad = deg * kPi / 180.0;
        bb.add(c.x + r * std::cos(rad), c.y + r * std::sin(rad));
    };
    at(s);
    at(e);
    // quadrant extremes crossed by the sweep
    for (double q = 0.0; q < 720.0; q += 90.0)
        if (q > s && q < e) at(q);
    return bb;
}

Transform2D Transform2D::insert(double x, double y, double sx, double sy, double rotDeg) {
    double rad = rotDeg * kPi / 180.0;
    double cs = std::cos(rad), sn = std::sin(rad);
    Transform2D t;
    t.a = cs * sx;  t.c = -sn * sy;
    t.b = sn * sx;  t.d =  cs * sy;
    t.tx = x;       t.ty = y;
    return t;
}

Transform2D Transform2D::then(const Transform2D& o) const {
    Transform2D r;
    r.a  = o.a * a + o.c * b;
    r.c  = o.a * c + o.c * d;
    r.b  = o.b * a + o.d * b;
    r.d  = o.b * c + o.d * d;
    r.tx = o.a * tx + o.c * ty + o.tx;
    r.ty = o.b * tx + o.d * ty + o.ty;
    return r;
}

BBox transformBox(const BBox& b, const Transform2D& t) {
    if (b.empty()) return b;
    BBox out;
    for (const auto& p : boxOutline(b)) {
        PointD q = t.apply(p);
        out.add(q.x, q.y);
    }
    return out;
}

// Thousandths of a plain decimal ("-12.3456"), half away from zero.
static long long roundDecimalText(const char* first, const char* last) {
    bool neg = false;
    if (first != last && *first == '-') {
        neg = true;
        ++first;
    }
    long long whole = 0;
    while (first != last && *first != '.')
        whole = whole * 10 + (*first++ - '0');
    if (first != last) ++first;

    long long frac = 0;
    int digits = 0;
    bool up = false;
    for (; first != last; ++first, ++digits) {
        int d = *first - '0';
        if (digits < 3) frac = frac * 10 + d;
        else if (digits == 3) up = d >= 5;
    }
    for (; digits < 3; ++digits) frac *= 10;

    long long n = whole * 1000 + frac + (up ? 1 : 0);
    return neg ? -n : n;
}

long long thousandths(double v) {
    if (!std::isfinite(v)) return 0;
    if (std::fabs(v) >= 1e15) return v < 0 ? -kMaxThousandths : kMaxThousandths;
    // Shortest text that reads back as v, so 4.0005 rounds like the
    // decimal it was typed as.
    char buf[512];
    auto r = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
    if (r.ec != std::errc()) return std::llround(v * 1000.0);
    return roundDecimalText(buf, r.ptr);
}

std::string formatThickness(double v) {
    long long n = thousandths(v);
    std::string sign = n < 0 ? "-" : "";
    long long a = std::llabs(n);
    std::string s = sign + std::to_string(a / 1000);
    long long frac = a % 1000;
    if (frac == 0) return s;
    std::string f = std::to_string(frac);
    f.insert(0, 3 - f.size(), '0');
    while (!f.empty() && f.back() == '0') f.pop_back();
    return s + "." + f;
}

std::string fileSafeThickness(double v) {
    std::string s = formatThickness(v);
    std::replace(s.begin(), s.end(), '.', '_');
    std::replace(s.begin(), s.end(), ',', '_');
    return s;
}

double estimateTextWidth(const std::string& text, double textHeight, double factor) {
    if (text.empty() || textHeight <= 0.0) return 0.0;
    return static_cast<double>(text.size()) * textHeight * factor;
}
