#include "drawing.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <spdlog/spdlog.h>

using namespace Clipper2Lib;

DrawingEntity DrawingEntity::line(double x1, double y1, double x2, double y2) {
    DrawingEntity e;
    e.kind = EntityKind::Line;
    e.pts = { {x1, y1}, {x2, y2} };
    return e;
}

DrawingEntity DrawingEntity::polyline(PathD pts, bool closed) {
    DrawingEntity e;
    e.kind = EntityKind::Polyline;
    e.pts = std::move(pts);
    e.closed = closed;
    return e;
}

DrawingEntity DrawingEntity::circle(double cx, double cy, double r) {
    DrawingEntity e;
    e.kind = EntityKind::Circle;
    e.center = {cx, cy};
    e.radius = r;
    return e;
}

DrawingEntity DrawingEntity::arc(double cx, double cy, double r, double a1, double a2) {
    DrawingEntity e = circle(cx, cy, r);
    e.kind = EntityKind::Arc;
    e.startAngle = a1;
    e.endAngle = a2;
    return e;
}

DrawingEntity DrawingEntity::label(std::string text, double x, double y, double height) {
    DrawingEntity e;
    e.kind = EntityKind::Text;
    e.text = std::move(text);
    e.center = {x, y};
    e.height = height;
    return e;
}

DrawingEntity DrawingEntity::insert(std::string block, double x, double y) {
    DrawingEntity e;
    e.kind = EntityKind::Insert;
    e.blockName = std::move(block);
    e.center = {x, y};
    return e;
}

static bool sameName(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

const Block* Drawing::findBlock(const std::string& name) const {
    for (const auto& b : blocks_)
        if (sameName(b.name, name)) return &b;
    return nullptr;
}

Block& Drawing::addBlock(std::string name, PointD base) {
    if (name.empty())
        throw std::invalid_argument("block name is empty");
    if (hasBlock(name))
        throw std::invalid_argument("duplicate block name " + name);
    blocks_.push_back(Block{ std::move(name), base, {} });
    return blocks_.back();
}

Block& Drawing::cloneIntoBlock(std::string name, const std::vector<DrawingEntity>& entities) {
    Block& b = addBlock(std::move(name));
    b.entities = entities;
    return b;
}

// Bounds of a non-insert entity in its own coordinates.
static std::optional<BBox> primitiveBounds(const DrawingEntity& e) {
    switch (e.kind) {
    case EntityKind::Line:
    case EntityKind::Polyline:
        if (e.pts.empty()) return std::nullopt;
        return boxOfPath(e.pts);
    case EntityKind::Circle:
        if (!(e.radius > 0.0)) return std::nullopt;
        return BBox{ e.center.x - e.radius, e.center.y - e.radius,
                     e.center.x + e.radius, e.center.y + e.radius };
    case EntityKind::Arc:
        if (!(e.radius > 0.0)) return std::nullopt;
        return arcBounds(e.center, e.radius, e.startAngle, e.endAngle);
    case EntityKind::Text:
    case EntityKind::Insert:
        break;
    }
    return std::nullopt;
}

static Transform2D insertTransform(const DrawingEntity& ins, const Block& blk) {
    Transform2D toBase;
    toBase.tx = -blk.base.x;
    toBase.ty = -blk.base.y;
    return toBase.then(Transform2D::insert(ins.center.x, ins.center.y,
                                           ins.scaleX, ins.scaleY, ins.rotation));
}

std::optional<BBox> Drawing::bounds(const DrawingEntity& e) const {
    if (e.kind != EntityKind::Insert)
        return primitiveBounds(e);

    // `chain` holds the blocks from the root down to `block`; its size is the depth.
    struct Item { const Block* block; Transform2D xf; std::vector<const Block*> chain; };
    std::vector<Item> work;
    if (const Block* root = findBlock(e.blockName))
        work.push_back({ root, insertTransform(e, *root), { root } });

    BBox box;
    while (!work.empty()) {
        Item it = std::move(work.back());
        work.pop_back();
        for (const auto& child : it.block->entities) {
            if (child.kind == EntityKind::Insert) {
                const Block* nb = findBlock(child.blockName);
                if (!nb) continue;
                if (std::find(it.chain.begin(), it.chain.end(), nb) != it.chain.end()) {
                    spdlog::debug("block {} inserts itself, ignored", nb->name);
                    continue;
                }
                if (static_cast<int>(it.chain.size()) >= kMaxInsertDepth) {
                    spdlog::debug("insert of {} nested deeper than {}, ignored",
                                  child.blockName, kMaxInsertDepth);
                    continue;
                }
                std::vector<const Block*> chain = it.chain;
                chain.push_back(nb);
                work.push_back({ nb, insertTransform(child, *nb).then(it.xf), std::move(chain) });
                continue;
            }
            if (auto b = primitiveBounds(child))
                box.add(transformBox(*b, it.xf));
        }
    }
    if (box.empty()) return std::nullopt;
    return box;
}
