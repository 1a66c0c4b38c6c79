// dxf_store.cpp - ASCII DXF reader/writer behind the DrawingStore interface
// --------------------------------------------------------------------
//   • HEADER: $INSUNITS only, coordinates are converted to mm on load
//   • BLOCKS: BLOCK/ENDBLK with base point
//   • ENTITIES: LINE, LWPOLYLINE, POLYLINE/VERTEX, CIRCLE, ARC, ELLIPSE,
//     SPLINE, TEXT, MTEXT, INSERT. Ellipses and splines become polylines.
// --------------------------------------------------------------------
#include "dxf_store.h"
#include "errors.h"
#include "file_util.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

using namespace Clipper2Lib;

double dxfUnitFactor(int code) {
    switch (code) {
        case 0: return 1.0;       // unitless, taken as mm
        case 1: return 25.4;      // inches
        case 2: return 25.4 * 12; // feet
        case 3: return 25.4 * 12 * 5280; // miles
        case 4: return 1.0;       // millimetres
        case 5: return 10.0;      // centimetres
        case 6: return 1000.0;    // metres
        case 7: return 1000000.0; // kilometres
        case 8: return 0.001;     // microns
        case 9: return 0.0254;    // mils
        default: return 1.0;
    }
}

namespace {

// Code/value pair reader with single element lookahead
struct DXFReader {
    std::istream& in;
    std::string code, value;
    bool has = false;
    explicit DXFReader(std::istream& f) : in(f) {}
    bool next() {
        if (has) { has = false; return true; }
        if (!std::getline(in, code) || !std::getline(in, value)) return false;
        code = trim(code);
        value = trim(value);
        return true;
    }
    void push() { has = true; }
    bool is(const char* c, const char* v) const { return code == c && value == v; }
};

double toD(const std::string& v) {
    double d = 0;
    if (!parseDouble(v, d))
        throw std::invalid_argument("bad number '" + v + "'");
    return d;
}

int toI(const std::string& v) {
    long long n = 0;
    if (!parseInt(v, n))
        throw std::invalid_argument("bad integer '" + v + "'");
    return static_cast<int>(n);
}

// Common properties shared by every entity type. Returns true if consumed.
bool commonProp(const DXFReader& rd, DrawingEntity& e) {
    if (rd.code == "8")  { e.layer = rd.value; return true; }
    if (rd.code == "62") { e.color = toI(rd.value); return true; }
    return false;
}

// Approximate elliptical arc, parameters in radians
PathD approxEllipse(PointD c, PointD maj, double ratio, double t1, double t2) {
    double ml = std::hypot(maj.x, maj.y);
    if (ml == 0) return {};
    PointD u{ maj.x / ml, maj.y / ml };
    double b = ml * ratio;
    if (t2 <= t1) t2 += 2 * kPi;
    int seg = std::max(8, int(std::ceil((t2 - t1) / (5.0 * kPi / 180.0))));
    PathD p;
    p.reserve(seg + 1);
    for (int i = 0; i <= seg; ++i) {
        double t = t1 + (t2 - t1) * i / seg;
        double ca = std::cos(t), sa = std::sin(t);
        p.push_back({ c.x + maj.x * ca - b * u.y * sa, c.y + maj.y * ca + b * u.x * sa });
    }
    return p;
}

// de Boor evaluation of a B-spline
PathD approxBSpline(const PathD& ctrl, const std::vector<double>& knots, int degree, int samples) {
    PathD poly;
    int n = int(ctrl.size()) - 1;
    if (degree < 1 || n < degree || int(knots.size()) < n + degree + 2) return poly;
    double t0 = knots[degree];
    double t1 = knots[n + 1];
    for (int s = 0; s < samples; ++s) {
        double t = t0 + (t1 - t0) * s / (samples - 1);
        int k = degree;
        while (k < n + 1 && !(t >= knots[k] && t < knots[k + 1])) ++k;
        if (k == n + 1) k = n;
        std::vector<PointD> d;
        d.reserve(degree + 1);
        for (int j = 0; j <= degree; ++j) d.push_back(ctrl[k - degree + j]);
        for (int r = 1; r <= degree; ++r)
            for (int j = degree; j >= r; --j) {
                int i = k - degree + j;
                double den = knots[i + degree - r + 1] - knots[i];
                double alpha = den == 0 ? 0 : (t - knots[i]) / den;
                d[j].x = (1 - alpha) * d[j - 1].x + alpha * d[j].x;
                d[j].y = (1 - alpha) * d[j - 1].y + alpha * d[j].y;
            }
        if (std::isfinite(d[degree].x) && std::isfinite(d[degree].y))
            poly.push_back(d[degree]);
    }
    return poly;
}

bool parseLine(DXFReader& rd, DrawingEntity& e) {
    std::array<double, 4> v{};
    std::array<bool, 4> have{};
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if      (rd.code == "10") { v[0] = toD(rd.value); have[0] = true; }
        else if (rd.code == "20") { v[1] = toD(rd.value); have[1] = true; }
        else if (rd.code == "11") { v[2] = toD(rd.value); have[2] = true; }
        else if (rd.code == "21") { v[3] = toD(rd.value); have[3] = true; }
    }
    if (!(have[0] && have[1] && have[2] && have[3])) return false;
    e.kind = EntityKind::Line;
    e.pts = { {v[0], v[1]}, {v[2], v[3]} };
    return true;
}

bool parseLWPolyline(DXFReader& rd, DrawingEntity& e) {
    e.kind = EntityKind::Polyline;
    bool pendingX = false;
    double x = 0;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if (rd.code == "70") e.closed = (toI(rd.value) & 1) != 0;
        else if (rd.code == "10") { x = toD(rd.value); pendingX = true; }
        else if (rd.code == "20" && pendingX) { e.pts.push_back({ x, toD(rd.value) }); pendingX = false; }
    }
    return !e.pts.empty();
}

// Classic POLYLINE entity (sequence of VERTEX, closed by SEQEND)
bool parsePolyline(DXFReader& rd, DrawingEntity& e) {
    e.kind = EntityKind::Polyline;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if (rd.code == "70") e.closed = (toI(rd.value) & 1) != 0;
    }
    while (rd.next()) {
        if (rd.is("0", "VERTEX")) {
            double x = 0, y = 0;
            bool have = false;
            while (rd.next()) {
                if (rd.code == "0") { rd.push(); break; }
                if (rd.code == "10") { x = toD(rd.value); have = true; }
                else if (rd.code == "20") y = toD(rd.value);
            }
            if (have) e.pts.push_back({ x, y });
        } else if (rd.is("0", "SEQEND")) {
            while (rd.next())
                if (rd.code == "0") { rd.push(); break; }
            break;
        } else if (rd.code == "0") {
            rd.push();
            break;
        }
    }
    return !e.pts.empty();
}

bool parseCircleOrArc(DXFReader& rd, DrawingEntity& e, bool arc) {
    bool haveC = false, haveR = false;
    e.kind = arc ? EntityKind::Arc : EntityKind::Circle;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if      (rd.code == "10") { e.center.x = toD(rd.value); haveC = true; }
        else if (rd.code == "20") e.center.y = toD(rd.value);
        else if (rd.code == "40") { e.radius = toD(rd.value); haveR = true; }
        else if (rd.code == "50") e.startAngle = toD(rd.value);
        else if (rd.code == "51") e.endAngle = toD(rd.value);
    }
    if (!arc) { e.startAngle = 0; e.endAngle = 360; }
    return haveC && haveR;
}

bool parseEllipse(DXFReader& rd, DrawingEntity& e) {
    PointD cen{0, 0}, maj{0, 0};
    double ratio = 1, t1 = 0, t2 = 2 * kPi;
    bool haveC = false, haveMaj = false;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if      (rd.code == "10") { cen.x = toD(rd.value); haveC = true; }
        else if (rd.code == "20") cen.y = toD(rd.value);
        else if (rd.code == "11") { maj.x = toD(rd.value); haveMaj = true; }
        else if (rd.code == "21") maj.y = toD(rd.value);
        else if (rd.code == "40") ratio = toD(rd.value);
        else if (rd.code == "41") t1 = toD(rd.value);
        else if (rd.code == "42") t2 = toD(rd.value);
    }
    if (!haveC || !haveMaj) return false;
    e.kind = EntityKind::Polyline;
    e.pts = approxEllipse(cen, maj, ratio, t1, t2);
    return !e.pts.empty();
}

bool parseSpline(DXFReader& rd, DrawingEntity& e) {
    PathD fit, ctrl;
    std::vector<double> knots;
    int degree = 3;
    bool fx = false, cx = false;
    double px = 0;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if      (rd.code == "10") { px = toD(rd.value); cx = true; }
        else if (rd.code == "20" && cx) { ctrl.push_back({ px, toD(rd.value) }); cx = false; }
        else if (rd.code == "11") { px = toD(rd.value); fx = true; }
        else if (rd.code == "21" && fx) { fit.push_back({ px, toD(rd.value) }); fx = false; }
        else if (rd.code == "40") knots.push_back(toD(rd.value));
        else if (rd.code == "70") e.closed = (toI(rd.value) & 1) != 0;
        else if (rd.code == "71") degree = toI(rd.value);
    }
    e.kind = EntityKind::Polyline;
    if (!fit.empty())
        e.pts = fit;
    else
        e.pts = approxBSpline(ctrl, knots, degree, 200);
    if (e.pts.empty())
        e.pts = ctrl;
    return !e.pts.empty();
}

bool parseText(DXFReader& rd, DrawingEntity& e) {
    e.kind = EntityKind::Text;
    std::string head;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if      (rd.code == "10") e.center.x = toD(rd.value);
        else if (rd.code == "20") e.center.y = toD(rd.value);
        else if (rd.code == "40") e.height = toD(rd.value);
        else if (rd.code == "3")  head += rd.value;   // MTEXT chunks come first
        else if (rd.code == "1")  e.text = rd.value;
    }
    e.text = head + e.text;
    return true;
}

bool parseInsert(DXFReader& rd, DrawingEntity& e) {
    e.kind = EntityKind::Insert;
    while (rd.next()) {
        if (rd.code == "0") { rd.push(); break; }
        if (commonProp(rd, e)) continue;
        if      (rd.code == "2")  e.blockName = rd.value;
        else if (rd.code == "10") e.center.x = toD(rd.value);
        else if (rd.code == "20") e.center.y = toD(rd.value);
        else if (rd.code == "41") e.scaleX = toD(rd.value);
        else if (rd.code == "42") e.scaleY = toD(rd.value);
        else if (rd.code == "50") e.rotation = toD(rd.value);
    }
    return !e.blockName.empty();
}

void skipEntity(DXFReader& rd) {
    while (rd.next())
        if (rd.code == "0") { rd.push(); break; }
}

// Reads one entity whose "0 <type>" pair was just consumed.
// Returns false for unsupported or malformed entities.
bool parseEntity(DXFReader& rd, const std::string& type, DrawingEntity& e) {
    try {
        if (type == "LINE")       return parseLine(rd, e);
        if (type == "LWPOLYLINE") return parseLWPolyline(rd, e);
        if (type == "POLYLINE")   return parsePolyline(rd, e);
        if (type == "CIRCLE")     return parseCircleOrArc(rd, e, false);
        if (type == "ARC")        return parseCircleOrArc(rd, e, true);
        if (type == "ELLIPSE")    return parseEllipse(rd, e);
        if (type == "SPLINE")     return parseSpline(rd, e);
        if (type == "TEXT" || type == "MTEXT") return parseText(rd, e);
        if (type == "INSERT")     return parseInsert(rd, e);
    } catch (const std::invalid_argument& ex) {
        spdlog::warn("[DXF] {} skipped: {}", type, ex.what());
        skipEntity(rd);
        return false;
    }
    spdlog::debug("[DXF] unsupported entity {} skipped", type);
    skipEntity(rd);
    return false;
}

// Entities up to the terminating "0 <endMarker>" (consumed).
void readEntityList(DXFReader& rd, const char* endMarker, std::vector<DrawingEntity>& out) {
    while (rd.next()) {
        if (rd.code != "0") continue;
        if (rd.value == endMarker) return;
        if (rd.value == "ENDSEC" || rd.value == "EOF") { rd.push(); return; }
        DrawingEntity e;
        std::string type = rd.value;
        if (parseEntity(rd, type, e))
            out.push_back(std::move(e));
    }
}

void readHeader(DXFReader& rd, int& insunits) {
    while (rd.next()) {
        if (rd.is("0", "ENDSEC")) return;
        if (rd.code == "9" && rd.value == "$INSUNITS") {
            if (rd.next() && rd.code == "70") {
                long long u = 0;
                if (parseInt(rd.value, u)) insunits = static_cast<int>(u);
            }
        }
    }
}

void readBlocks(DXFReader& rd, Drawing& d) {
    while (rd.next()) {
        if (rd.is("0", "ENDSEC")) return;
        if (!rd.is("0", "BLOCK")) continue;
        std::string name;
        PointD base{0, 0};
        while (rd.next()) {
            if (rd.code == "0") { rd.push(); break; }
            if (rd.code == "2") name = rd.value;
            else if (rd.code == "10" && !parseDouble(rd.value, base.x))
                spdlog::warn("[DXF] block {}: bad base x '{}'", name, rd.value);
            else if (rd.code == "20" && !parseDouble(rd.value, base.y))
                spdlog::warn("[DXF] block {}: bad base y '{}'", name, rd.value);
        }
        std::vector<DrawingEntity> ents;
        readEntityList(rd, "ENDBLK", ents);
        if (name.empty() || d.hasBlock(name)) {
            spdlog::warn("[DXF] block '{}' ignored (empty or duplicate name)", name);
            continue;
        }
        Block& b = d.addBlock(name, base);
        b.entities = std::move(ents);
    }
}

void scaleEntity(DrawingEntity& e, double f) {
    for (auto& p : e.pts) { p.x *= f; p.y *= f; }
    e.center.x *= f;
    e.center.y *= f;
    e.radius *= f;
    e.height *= f;
}

std::string num(double v) {
    std::ostringstream ss;
    ss << std::setprecision(12) << v;
    return ss.str();
}

void writeEntity(std::ostream& f, const DrawingEntity& e) {
    auto head = [&](const char* type) {
        f << "0\n" << type << "\n8\n" << (e.layer.empty() ? "0" : e.layer) << "\n";
        if (e.color != 256) f << "62\n" << e.color << "\n";
    };
    switch (e.kind) {
    case EntityKind::Line:
        if (e.pts.size() < 2) return;
        head("LINE");
        f << "10\n" << num(e.pts[0].x) << "\n20\n" << num(e.pts[0].y) << "\n30\n0\n"
          << "11\n" << num(e.pts[1].x) << "\n21\n" << num(e.pts[1].y) << "\n31\n0\n";
        break;
    case EntityKind::Polyline:
        if (e.pts.empty()) return;
        head("LWPOLYLINE");
        f << "90\n" << e.pts.size() << "\n70\n" << (e.closed ? 1 : 0) << "\n";
        for (const auto& p : e.pts)
            f << "10\n" << num(p.x) << "\n20\n" << num(p.y) << "\n";
        break;
    case EntityKind::Circle:
        head("CIRCLE");
        f << "10\n" << num(e.center.x) << "\n20\n" << num(e.center.y) << "\n30\n0\n"
          << "40\n" << num(e.radius) << "\n";
        break;
    case EntityKind::Arc:
        head("ARC");
        f << "10\n" << num(e.center.x) << "\n20\n" << num(e.center.y) << "\n30\n0\n"
          << "40\n" << num(e.radius) << "\n50\n" << num(e.startAngle)
          << "\n51\n" << num(e.endAngle) << "\n";
        break;
    case EntityKind::Text:
        head("TEXT");
        f << "10\n" << num(e.center.x) << "\n20\n" << num(e.center.y) << "\n30\n0\n"
          << "40\n" << num(e.height) << "\n1\n" << e.text << "\n";
        break;
    case EntityKind::Insert:
        head("INSERT");
        f << "2\n" << e.blockName << "\n"
          << "10\n" << num(e.center.x) << "\n20\n" << num(e.center.y) << "\n30\n0\n";
        if (e.scaleX != 1.0) f << "41\n" << num(e.scaleX) << "\n";
        if (e.scaleY != 1.0) f << "42\n" << num(e.scaleY) << "\n";
        if (e.rotation != 0.0) f << "50\n" << num(e.rotation) << "\n";
        break;
    }
}

} // namespace

Drawing readDxf(std::istream& in) {
    Drawing d;
    DXFReader rd(in);
    int insunits = 0;
    while (rd.next()) {
        if (!rd.is("0", "SECTION")) continue;
        if (!rd.next() || rd.code != "2") continue;
        if (rd.value == "HEADER")        readHeader(rd, insunits);
        else if (rd.value == "BLOCKS")   readBlocks(rd, d);
        else if (rd.value == "ENTITIES") readEntityList(rd, "ENDSEC", d.modelSpace());
    }
    double f = dxfUnitFactor(insunits);
    if (f != 1.0) {
        spdlog::info("[DXF] $INSUNITS={} -> scale {} to mm", insunits, f);
        for (auto& e : d.modelSpace()) scaleEntity(e, f);
        for (auto& b : d.blocks()) {
            b.base.x *= f;
            b.base.y *= f;
            for (auto& e : b.entities) scaleEntity(e, f);
        }
    }
    return d;
}

void writeDxf(std::ostream& f, const Drawing& d) {
    f << "0\nSECTION\n2\nHEADER\n9\n$ACADVER\n1\nAC1015\n9\n$INSUNITS\n70\n4\n0\nENDSEC\n";
    f << "0\nSECTION\n2\nBLOCKS\n";
    for (const auto& b : d.blocks()) {
        f << "0\nBLOCK\n8\n0\n2\n" << b.name << "\n70\n0\n"
          << "10\n" << num(b.base.x) << "\n20\n" << num(b.base.y) << "\n30\n0\n"
          << "3\n" << b.name << "\n";
        for (const auto& e : b.entities) writeEntity(f, e);
        f << "0\nENDBLK\n8\n0\n";
    }
    f << "0\nENDSEC\n";
    f << "0\nSECTION\n2\nENTITIES\n";
    for (const auto& e : d.modelSpace()) writeEntity(f, e);
    f << "0\nENDSEC\n0\nEOF\n";
}

Drawing DxfDrawingStore::open(const std::string& path) {
    std::ifstream fin(path);
    if (!fin)
        throw DrawingOpenError("cannot open drawing " + path);
    Drawing d = readDxf(fin);
    if (fin.bad())
        throw DrawingOpenError("read error on " + path);
    spdlog::debug("[DXF] {}: {} block(s), {} model entities",
                  path, d.blocks().size(), d.modelSpace().size());
    return d;
}

void DxfDrawingStore::save(const Drawing& drawing, const std::string& path) {
    std::ostringstream ss;
    writeDxf(ss, drawing);
    writeFileAtomically(path, ss.str());
    spdlog::debug("[DXF] wrote {}", path);
}
