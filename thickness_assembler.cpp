#include "thickness_assembler.h"
#include "block_extractor.h"
#include "errors.h"
#include "file_util.h"
#include "geometry.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static std::string sanitize(const std::string& s) {
    std::string out = s;
    for (auto& c : out)
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    return out;
}

std::string plateBlockName(const std::string& fileName, long long quantity) {
    std::string stem = fs::path(fileName).stem().string();
    std::string safe = stem.empty() ? "Part" : sanitize(stem);
    return std::string(kPlatePrefix) + safe + "_Q" + std::to_string(std::max(1LL, quantity));
}

std::string thicknessDrawingName(double thicknessMm) {
    return "thickness_" + fileSafeThickness(thicknessMm) + ".dxf";
}

std::optional<double> thicknessFromDrawingName(const std::string& path) {
    static const std::string prefix = "thickness_";
    std::string stem = fs::path(path).stem().string();
    if (stem.size() <= prefix.size() || toUpper(stem.substr(0, prefix.size())) != toUpper(prefix))
        return std::nullopt;
    std::string t = stem.substr(prefix.size());
    std::replace(t.begin(), t.end(), '_', '.');
    double v = 0.0;
    if (!parseDouble(t, v) || v < 0.0) return std::nullopt;
    return v;
}

std::string resolveSourcePath(const std::string& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) return path;
    fs::path alt = fs::path(path).replace_extension(".dxf");
    if (alt.string() != path && fs::exists(alt, ec)) return alt.string();
    return path;
}

// Copies the blocks that `entities` reference, directly or through other
// blocks, from `src` into `dst` as "S_<owner>_<name>" and rewrites the
// references. Walks a worklist; every source block is copied at most once.
static void copyReferencedBlocks(const Drawing& src, Drawing& dst, const std::string& owner,
                                 std::vector<DrawingEntity>& entities) {
    std::unordered_map<std::string, std::string> renamed;   // upper source name -> new name
    std::vector<const Block*> pending;

    auto rename = [&](const std::string& name) -> std::string {
        std::string key = toUpper(name);
        auto it = renamed.find(key);
        if (it != renamed.end()) return it->second;
        const Block* blk = src.findBlock(name);
        if (!blk) return name;
        std::string base = "S_" + owner + "_" + blk->name;
        std::string fresh = base;
        for (int k = 2; dst.hasBlock(fresh); ++k)
            fresh = base + "_" + std::to_string(k);
        renamed.emplace(key, fresh);
        pending.push_back(blk);
        return fresh;
    };

    for (auto& e : entities)
        if (e.kind == EntityKind::Insert) e.blockName = rename(e.blockName);

    while (!pending.empty()) {
        const Block* blk = pending.back();
        pending.pop_back();
        std::vector<DrawingEntity> copy = blk->entities;
        for (auto& e : copy)
            if (e.kind == EntityKind::Insert) e.blockName = rename(e.blockName);
        std::string target = renamed.at(toUpper(blk->name));
        Block& b = dst.addBlock(target, blk->base);
        b.entities = std::move(copy);
    }
}

AssemblyResult ThicknessGroupAssembler::assemble(double thicknessMm,
                                                 const std::vector<UniquePart>& parts) {
    AssemblyResult res;
    colors_.reset();

    const std::string thicknessText = formatThickness(thicknessMm);
    const double h = opt_.textHeight;
    const double textY1 = -h - opt_.labelGap;
    const double textY2 = -2.0 * h - 2.0 * opt_.labelGap;
    double cursorX = 0.0;

    for (const auto& part : parts) {
        std::string path = resolveSourcePath(part.representativeSourcePath);
        Drawing src;
        try {
            src = store_.open(path);
        } catch (const DrawingOpenError& ex) {
            spdlog::warn("[ASSEMBLE] {} skipped: {}", part.fileName, ex.what());
            ++res.skippedParts;
            continue;
        }

        BBox box;
        for (const auto& e : src.modelSpace())
            if (auto b = store_.boundingBox(src, e)) box.add(*b);
        if (box.empty()) {
            spdlog::warn("[ASSEMBLE] {} skipped: no geometry in {}", part.fileName, path);
            ++res.skippedParts;
            continue;
        }

        std::string name = plateBlockName(part.fileName, part.totalQuantity);
        if (res.drawing.hasBlock(name)) {
            std::string stem = name.substr(0, name.rfind("_Q"));
            std::string qtag = name.substr(name.rfind("_Q"));
            for (int k = 2; res.drawing.hasBlock(name); ++k)
                name = stem + "_" + std::to_string(k) + qtag;
        }

        std::vector<DrawingEntity> ents = src.modelSpace();
        int color = colors_.next();
        for (auto& e : ents) e.color = color;
        copyReferencedBlocks(src, res.drawing, name, ents);
        res.drawing.cloneIntoBlock(name, ents);
        res.blockNames.push_back(name);

        std::string label1 = "Plate: " + thicknessText + " mm";
        std::string label2 = "Qty: " + std::to_string(part.totalQuantity);
        double w1 = estimateTextWidth(label1, h, opt_.textWidthFactor);
        double w2 = estimateTextWidth(label2, h, opt_.textWidthFactor);
        double columnWidth = std::max(box.width(), std::max(w1, w2));
        double center = cursorX + columnWidth / 2.0;

        auto& model = res.drawing.modelSpace();
        model.push_back(DrawingEntity::insert(name, center - (box.minX + box.maxX) / 2.0, -box.minY));
        model.push_back(DrawingEntity::label(label1, center - w1 / 2.0, textY1, h));
        model.push_back(DrawingEntity::label(label2, center - w2 / 2.0, textY2, h));

        spdlog::debug("[ASSEMBLE] {} -> {} ({:.1f} x {:.1f})", part.fileName, name,
                      box.width(), box.height());
        cursorX += columnWidth + opt_.columnMargin;
    }
    return res;
}
