#pragma once
#include "drawing_store.h"
#include "geometry.h"
#include <string>
#include <vector>

constexpr const char* kPlatePrefix = "P_";

// A nestable plate block. `box` is in insert space (block base at 0,0).
struct PlateBlock {
    std::string name;
    BBox box;
    double width = 0.0;
    double height = 0.0;
    long long quantity = 1;
};

struct ExtractionResult {
    std::vector<PlateBlock> plates;   // document order
    size_t ignoredNames = 0;          // no P_ prefix or '*' special block
    size_t withoutGeometry = 0;       // no entity with a box
    size_t degenerate = 0;            // zero width or height
};

bool isPlateBlockName(const std::string& name);

// Count from a trailing "_Q<n>" (either case); 1 when missing, unparsable or
// not positive.
long long decodeQuantity(const std::string& blockName);

// Bounds of a block's entities relative to its base point.
std::optional<BBox> blockExtents(const Drawing& drawing, const Block& block,
                                 const DrawingStore& store);

ExtractionResult extractPlates(const Drawing& drawing, const DrawingStore& store);
