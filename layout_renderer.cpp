#include "layout_renderer.h"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

Drawing renderLayout(const Drawing& source, const std::vector<NestPart>& parts,
                     const NestedLayout& layout, const NestOptions& nest,
                     const RenderOptions& opt) {
    Drawing out;
    for (const auto& b : source.blocks()) {
        Block& nb = out.addBlock(b.name, b.base);
        nb.entities = b.entities;
    }

    auto& model = out.modelSpace();
    for (const auto& s : layout.sheets) {
        double x0 = s.originX, y0 = s.originY;
        double x1 = x0 + s.width, y1 = y0 + s.height;
        model.push_back(DrawingEntity::line(x0, y0, x1, y0));
        model.push_back(DrawingEntity::line(x1, y0, x1, y1));
        model.push_back(DrawingEntity::line(x1, y1, x0, y1));
        model.push_back(DrawingEntity::line(x0, y1, x0, y0));
        model.push_back(DrawingEntity::label("SHEET " + std::to_string(s.index),
                                             x0 + nest.sheetMargin, y1 - opt.sheetLabelOffset,
                                             opt.sheetLabelHeight));
        double fillX = std::max(x0 + nest.sheetMargin, x1 - opt.fillLabelInset);
        model.push_back(DrawingEntity::label(fillLabel(s), fillX, y1 - opt.sheetLabelOffset,
                                             opt.sheetLabelHeight));
    }
    for (const auto& p : layout.placements)
        model.push_back(DrawingEntity::insert(parts.at(p.partIndex).name, p.insertX, p.insertY));
    return out;
}

std::string fillLabel(const Sheet& s) {
    std::ostringstream ss;
    ss << "Fill: " << std::fixed << std::setprecision(1) << sheetFillPercent(s) << "%";
    return ss.str();
}

std::string nestedOutputPath(const std::string& sourcePath) {
    fs::path p(sourcePath);
    return (p.parent_path() / (p.stem().string() + "_nested.dxf")).string();
}

std::string placementReport(const std::vector<NestPart>& parts, const NestedLayout& layout) {
    std::ostringstream ss;
    ss << "sheet,part,x_mm,y_mm,width_mm,height_mm\n";
    ss << std::fixed << std::setprecision(3);
    for (const auto& p : layout.placements) {
        const NestPart& part = parts.at(p.partIndex);
        ss << p.sheetIndex << ',' << part.name << ',' << p.cellX << ',' << p.cellY << ','
           << part.width << ',' << part.height << "\n";
    }
    return ss.str();
}
