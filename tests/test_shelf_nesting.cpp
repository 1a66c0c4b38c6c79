#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "errors.h"
#include "shelf_nesting.h"
#include <cmath>
#include <limits>
#include <random>

static NestOptions sheet(double w, double h) {
    NestOptions o;
    o.sheetWidth = w;
    o.sheetHeight = h;
    return o;
}

static NestPart plate(const std::string& name, double w, double h, long long q) {
    NestPart p;
    p.name = name;
    p.width = w;
    p.height = h;
    p.quantity = q;
    return p;
}

TEST_CASE("five plates on one sheet in two rows") {
    auto layout = shelfNest({ plate("P_a_Q5", 300, 200, 5) }, sheet(1000, 500));
    REQUIRE(layout.sheets.size() == 1);
    REQUIRE(layout.placements.size() == 5);
    const auto& p = layout.placements;
    REQUIRE(p[0].cellX == Approx(5));
    REQUIRE(p[1].cellX == Approx(310));
    REQUIRE(p[2].cellX == Approx(615));
    for (int i = 0; i < 3; ++i) REQUIRE(p[i].cellY == Approx(5));
    REQUIRE(p[3].cellX == Approx(5));
    REQUIRE(p[3].cellY == Approx(210));
    REQUIRE(p[4].cellX == Approx(310));
    REQUIRE(p[4].cellY == Approx(210));
}

TEST_CASE("fit check") {
    REQUIRE_NOTHROW(validateNesting({ plate("ok", 400, 300, 1) }, sheet(500, 500)));
    REQUIRE_NOTHROW(validateNesting({ plate("exact", 490, 490, 1) }, sheet(500, 500)));
    try {
        shelfNest({ plate("small", 10, 10, 3), plate("P_big_Q1", 495, 100, 1) }, sheet(500, 500));
        FAIL("expected FitError");
    } catch (const FitError& e) {
        REQUIRE(e.partName == "P_big_Q1");
        REQUIRE(e.width == Approx(495));
        REQUIRE(e.height == Approx(100));
        REQUIRE(e.usableWidth == Approx(490));
        REQUIRE(std::string(e.what()).find("P_big_Q1") != std::string::npos);
    }
    REQUIRE_THROWS_AS(shelfNest({ plate("tall", 10, 491, 1) }, sheet(500, 500)), FitError);
}

TEST_CASE("bad configuration") {
    std::vector<NestPart> one = { plate("a", 10, 10, 1) };
    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(shelfNest(one, sheet(0, 500)), ConfigurationError);
    REQUIRE_THROWS_AS(shelfNest(one, sheet(500, -1)), ConfigurationError);
    REQUIRE_THROWS_AS(shelfNest(one, sheet(nan, 500)), ConfigurationError);
    REQUIRE_THROWS_AS(shelfNest({}, sheet(0, 0)), ConfigurationError);

    NestOptions o = sheet(500, 500);
    o.sheetMargin = -1;
    REQUIRE_THROWS_AS(shelfNest(one, o), ConfigurationError);
    o = sheet(500, 500);
    o.partGap = nan;
    REQUIRE_THROWS_AS(shelfNest(one, o), ConfigurationError);
    o = sheet(500, 500);
    o.sheetGap = -5;
    REQUIRE_THROWS_AS(shelfNest(one, o), ConfigurationError);
    o = sheet(100, 100);
    o.sheetMargin = 50;
    REQUIRE_THROWS_AS(shelfNest(one, o), ConfigurationError);
}

TEST_CASE("oversized counts are a configuration error") {
    NestOptions o = sheet(500, 500);
    REQUIRE_THROWS_AS(shelfNest({ plate("P_huge_Q9000000000000000000", 10, 10, 9000000000000000000LL) }, o),
                      ConfigurationError);
    REQUIRE_THROWS_AS(shelfNest({ plate("a", 10, 10, kMaxInstances), plate("b", 10, 10, 1) }, o),
                      ConfigurationError);
    REQUIRE_THROWS_AS(shelfNest({ plate("a", 10, 10, std::numeric_limits<long long>::max()),
                                  plate("b", 10, 10, std::numeric_limits<long long>::max()) }, o),
                      ConfigurationError);
    REQUIRE_NOTHROW(validateNesting({ plate("a", 10, 10, kMaxInstances) }, o));
}

TEST_CASE("nothing to nest") {
    auto layout = shelfNest({ plate("zero", 10, 10, 0) }, sheet(500, 500));
    REQUIRE(layout.sheets.empty());
    REQUIRE(layout.placements.empty());
    REQUIRE(shelfNest({}, sheet(500, 500)).sheets.empty());
}

TEST_CASE("overflow opens a new sheet to the right") {
    NestOptions o = sheet(1000, 500);
    auto layout = shelfNest({ plate("P_q_Q5", 490, 240, 5) }, o);
    REQUIRE(layout.sheets.size() == 2);
    REQUIRE(layout.sheets[1].index == 2);
    REQUIRE(layout.sheets[1].originX == Approx(1050));
    REQUIRE(layout.sheets[0].placedCount == 4);
    const auto& last = layout.placements.back();
    REQUIRE(last.sheetIndex == 2);
    REQUIRE(last.cellX == Approx(5));
    REQUIRE(last.cellY == Approx(5));
    REQUIRE(last.insertX == Approx(1055));
}

TEST_CASE("insertion point corrects for the box minimum") {
    NestPart p = plate("P_off_Q1", 100, 50, 1);
    p.minX = 10;
    p.minY = -20;
    auto layout = shelfNest({ p }, sheet(500, 500));
    REQUIRE(layout.placements[0].insertX == Approx(5 - 10));
    REQUIRE(layout.placements[0].insertY == Approx(5 + 20));
}

TEST_CASE("instances sorted by height then width, stable") {
    std::vector<NestPart> parts = {
        plate("a", 100, 50, 2),
        plate("b", 120, 80, 1),
        plate("c", 200, 50, 1),
        plate("d", 100, 50, 1),
    };
    auto inst = expandInstances(parts);
    REQUIRE(inst.size() == 5);
    REQUIRE(inst[0].partIndex == 1);
    REQUIRE(inst[1].partIndex == 2);
    REQUIRE(inst[2].partIndex == 0);
    REQUIRE(inst[3].partIndex == 0);
    REQUIRE(inst[4].partIndex == 3);
}

TEST_CASE("every instance placed inside its sheet") {
    std::mt19937 rng(2024);
    std::uniform_real_distribution<double> size(5.0, 480.0);
    std::uniform_int_distribution<int> qty(0, 6);
    std::vector<NestPart> parts;
    long long total = 0;
    for (int i = 0; i < 40; ++i) {
        parts.push_back(plate("p" + std::to_string(i), size(rng), size(rng), qty(rng)));
        total += parts.back().quantity;
    }
    NestOptions o = sheet(1250, 500);
    o.sheetMargin = 7.5;
    o.partGap = 3;
    auto layout = shelfNest(parts, o);
    REQUIRE(static_cast<long long>(layout.placements.size()) == total);

    const double tol = 1e-6;
    for (const auto& pl : layout.placements) {
        const auto& part = parts[pl.partIndex];
        REQUIRE(pl.sheetIndex >= 1);
        REQUIRE(pl.sheetIndex <= static_cast<int>(layout.sheets.size()));
        REQUIRE(pl.cellX >= o.sheetMargin - tol);
        REQUIRE(pl.cellY >= o.sheetMargin - tol);
        REQUIRE(pl.cellX + part.width <= o.sheetWidth - o.sheetMargin + tol);
        REQUIRE(pl.cellY + part.height <= o.sheetHeight - o.sheetMargin + tol);
        const auto& s = layout.sheets[pl.sheetIndex - 1];
        REQUIRE(pl.insertX == Approx(s.originX + pl.cellX - part.minX));
    }

    // no two cells on the same sheet overlap
    for (size_t i = 0; i < layout.placements.size(); ++i)
        for (size_t j = i + 1; j < layout.placements.size(); ++j) {
            const auto& a = layout.placements[i];
            const auto& b = layout.placements[j];
            if (a.sheetIndex != b.sheetIndex) continue;
            const auto& pa = parts[a.partIndex];
            const auto& pb = parts[b.partIndex];
            bool apart = a.cellX + pa.width <= b.cellX + tol || b.cellX + pb.width <= a.cellX + tol ||
                         a.cellY + pa.height <= b.cellY + tol || b.cellY + pb.height <= a.cellY + tol;
            REQUIRE(apart);
        }
}

TEST_CASE("progress reports every placement") {
    std::vector<std::pair<size_t, size_t>> calls;
    auto layout = shelfNest({ plate("a", 100, 100, 3), plate("b", 50, 50, 2) }, sheet(500, 500),
                            [&](size_t placed, size_t total) { calls.emplace_back(placed, total); });
    REQUIRE(calls.size() == 5);
    for (size_t i = 0; i < calls.size(); ++i) {
        REQUIRE(calls[i].first == i + 1);
        REQUIRE(calls[i].second == 5);
    }
    REQUIRE(layout.placements.size() == 5);
}
