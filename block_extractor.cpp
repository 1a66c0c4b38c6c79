#include "block_extractor.h"
#include "file_util.h"
#include <spdlog/spdlog.h>

bool isPlateBlockName(const std::string& name) {
    if (name.empty() || name[0] == '*') return false;
    return toUpper(name.substr(0, 2)) == kPlatePrefix;
}

long long decodeQuantity(const std::string& blockName) {
    size_t pos = toUpper(blockName).rfind("_Q");
    if (pos == std::string::npos) return 1;
    long long q = 0;
    std::string tail = blockName.substr(pos + 2);
    if (tail.empty() || tail.find_first_not_of("0123456789") != std::string::npos)
        return 1;
    if (!parseInt(tail, q) || q <= 0) return 1;
    return q;
}

std::optional<BBox> blockExtents(const Drawing& drawing, const Block& block,
                                 const DrawingStore& store) {
    BBox box;
    for (const auto& e : block.entities) {
        auto b = store.boundingBox(drawing, e);
        if (!b) continue;
        box.add(*b);
    }
    if (box.empty()) return std::nullopt;
    return translateBox(box, -block.base.x, -block.base.y);
}

ExtractionResult extractPlates(const Drawing& drawing, const DrawingStore& store) {
    ExtractionResult res;
    for (const auto& blk : drawing.blocks()) {
        if (!isPlateBlockName(blk.name)) {
            ++res.ignoredNames;
            continue;
        }
        auto box = blockExtents(drawing, blk, store);
        if (!box) {
            spdlog::warn("[EXTRACT] block {} has no measurable geometry, skipped", blk.name);
            ++res.withoutGeometry;
            continue;
        }
        PlateBlock p;
        p.name = blk.name;
        p.box = *box;
        p.width = box->width();
        p.height = box->height();
        if (!(p.width > 0.0) || !(p.height > 0.0)) {
            spdlog::warn("[EXTRACT] block {} is degenerate ({} x {}), skipped",
                         blk.name, p.width, p.height);
            ++res.degenerate;
            continue;
        }
        p.quantity = decodeQuantity(blk.name);
        spdlog::debug("[EXTRACT] {} {:.3f} x {:.3f} qty {}", p.name, p.width, p.height, p.quantity);
        res.plates.push_back(std::move(p));
    }
    return res;
}
