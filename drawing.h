#pragma once
#include "geometry.h"
#include <deque>
#include <optional>
#include <string>
#include <vector>

enum class EntityKind { Line, Polyline, Circle, Arc, Text, Insert };

// One drawing entity. Fields not used by a kind keep their defaults.
struct DrawingEntity {
    EntityKind kind = EntityKind::Line;
    std::string layer = "0";
    int color = 256;                 // ACI, 256 = BYLAYER

    Clipper2Lib::PathD pts;          // line end points / polyline vertices
    bool closed = false;

    Clipper2Lib::PointD center{0, 0};  // circle, arc, text and insert position
    double radius = 0.0;
    double startAngle = 0.0;         // degrees
    double endAngle = 360.0;

    std::string text;
    double height = 0.0;

    std::string blockName;
    double scaleX = 1.0, scaleY = 1.0;
    double rotation = 0.0;           // degrees

    static DrawingEntity line(double x1, double y1, double x2, double y2);
    static DrawingEntity polyline(Clipper2Lib::PathD pts, bool closed);
    static DrawingEntity circle(double cx, double cy, double r);
    static DrawingEntity arc(double cx, double cy, double r, double a1, double a2);
    static DrawingEntity label(std::string text, double x, double y, double height);
    static DrawingEntity insert(std::string block, double x, double y);
};

// Named geometry group.
struct Block {
    std::string name;
    Clipper2Lib::PointD base{0, 0};
    std::vector<DrawingEntity> entities;
};

class Drawing {
public:
    std::vector<DrawingEntity>& modelSpace() { return model_; }
    const std::vector<DrawingEntity>& modelSpace() const { return model_; }

    std::deque<Block>& blocks() { return blocks_; }
    const std::deque<Block>& blocks() const { return blocks_; }
    const Block* findBlock(const std::string& name) const;
    bool hasBlock(const std::string& name) const { return findBlock(name) != nullptr; }

    // Throws std::invalid_argument on duplicate or empty names.
    Block& addBlock(std::string name, Clipper2Lib::PointD base = {0, 0});
    // Copies `entities` into a new block.
    Block& cloneIntoBlock(std::string name, const std::vector<DrawingEntity>& entities);

    // Box of one entity in this drawing's space. Text has none, inserts
    // resolve through their block; nested inserts are walked with a bounded
    // worklist. An insert of a block already on the path from the root is
    // skipped.
    std::optional<BBox> bounds(const DrawingEntity& e) const;

private:
    std::vector<DrawingEntity> model_;
    std::deque<Block> blocks_;
};

constexpr int kMaxInsertDepth = 16;
