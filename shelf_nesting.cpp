#include "shelf_nesting.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {
constexpr double kEps = 1e-9;

void requireNonNegative(double v, const char* what) {
    if (!std::isfinite(v) || v < 0.0) {
        std::ostringstream ss;
        ss << what << " must be a finite non-negative number (got " << v << ")";
        throw ConfigurationError(ss.str());
    }
}
}

void validateNesting(const std::vector<NestPart>& parts, const NestOptions& opt) {
    if (!std::isfinite(opt.sheetWidth) || !std::isfinite(opt.sheetHeight) ||
        opt.sheetWidth <= 0.0 || opt.sheetHeight <= 0.0) {
        std::ostringstream ss;
        ss << "sheet size must be positive (got " << opt.sheetWidth << " x " << opt.sheetHeight << ")";
        throw ConfigurationError(ss.str());
    }
    requireNonNegative(opt.sheetMargin, "sheet margin");
    requireNonNegative(opt.partGap, "part gap");
    requireNonNegative(opt.sheetGap, "sheet gap");

    double usableW = opt.sheetWidth - 2.0 * opt.sheetMargin;
    double usableH = opt.sheetHeight - 2.0 * opt.sheetMargin;
    if (usableW <= 0.0 || usableH <= 0.0) {
        std::ostringstream ss;
        ss << "sheet margin " << opt.sheetMargin << " leaves no usable area on "
           << opt.sheetWidth << " x " << opt.sheetHeight;
        throw ConfigurationError(ss.str());
    }

    long long total = 0;
    for (const auto& p : parts) {
        if (p.quantity <= 0) continue;
        if (p.quantity > kMaxInstances - total) {
            std::ostringstream ss;
            ss << "more than " << kMaxInstances << " instances to nest (at part " << p.name << ")";
            throw ConfigurationError(ss.str());
        }
        total += p.quantity;
    }

    for (const auto& p : parts) {
        if (p.width <= usableW + kEps && p.height <= usableH + kEps) continue;
        std::ostringstream ss;
        ss << "part " << p.name << " (" << p.width << " x " << p.height
           << " mm) does not fit the usable sheet area " << usableW << " x " << usableH << " mm";
        throw FitError(ss.str(), p.name, p.width, p.height, usableW, usableH);
    }
}

double sheetFillPercent(const Sheet& s) {
    double usable = s.usableWidth * s.usableHeight;
    return usable > 0.0 ? s.usedArea / usable * 100.0 : 0.0;
}

std::vector<NestingInstance> expandInstances(const std::vector<NestPart>& parts) {
    std::vector<NestingInstance> inst;
    for (size_t i = 0; i < parts.size(); ++i)
        for (long long q = 0; q < parts[i].quantity; ++q)
            inst.push_back({ i, parts[i].width, parts[i].height });
    std::stable_sort(inst.begin(), inst.end(), [](const NestingInstance& a, const NestingInstance& b) {
        if (a.height != b.height) return a.height > b.height;
        return a.width > b.width;
    });
    return inst;
}

NestedLayout shelfNest(const std::vector<NestPart>& parts, const NestOptions& opt,
                       const NestProgress& progress) {
    validateNesting(parts, opt);

    NestedLayout layout;
    auto inst = expandInstances(parts);
    if (inst.empty()) return layout;

    const double right = opt.sheetWidth - opt.sheetMargin;
    const double top = opt.sheetHeight - opt.sheetMargin;

    auto newSheet = [&]() -> Sheet& {
        Sheet s;
        s.index = static_cast<int>(layout.sheets.size()) + 1;
        s.originX = (s.index - 1) * (opt.sheetWidth + opt.sheetGap);
        s.originY = 0.0;
        s.width = opt.sheetWidth;
        s.height = opt.sheetHeight;
        s.usableWidth = opt.sheetWidth - 2.0 * opt.sheetMargin;
        s.usableHeight = opt.sheetHeight - 2.0 * opt.sheetMargin;
        s.cursorX = opt.sheetMargin;
        s.cursorY = opt.sheetMargin;
        layout.sheets.push_back(s);
        spdlog::debug("[NEST] sheet {} opened at x={}", s.index, s.originX);
        return layout.sheets.back();
    };

    layout.placements.reserve(inst.size());
    Sheet* sheet = &newSheet();
    for (const auto& in : inst) {
        if (sheet->cursorX + in.width > right + kEps) {
            sheet->cursorX = opt.sheetMargin;
            sheet->cursorY += sheet->rowHeight + opt.partGap;
            sheet->rowHeight = 0.0;
        }
        if (sheet->cursorY + in.height > top + kEps)
            sheet = &newSheet();

        const NestPart& p = parts[in.partIndex];
        PlacedInstance pl;
        pl.partIndex = in.partIndex;
        pl.sheetIndex = sheet->index;
        pl.cellX = sheet->cursorX;
        pl.cellY = sheet->cursorY;
        pl.insertX = sheet->originX + pl.cellX - p.minX;
        pl.insertY = sheet->originY + pl.cellY - p.minY;
        layout.placements.push_back(pl);

        sheet->cursorX += in.width + opt.partGap;
        sheet->rowHeight = std::max(sheet->rowHeight, in.height);
        ++sheet->placedCount;
        sheet->usedArea += in.width * in.height;

        if (progress) progress(layout.placements.size(), inst.size());
    }
    spdlog::info("[NEST] {} instance(s) on {} sheet(s)", layout.placements.size(), layout.sheets.size());
    return layout;
}
