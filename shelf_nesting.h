#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct NestOptions {
    double sheetWidth = 0.0;
    double sheetHeight = 0.0;
    double sheetMargin = 5.0;
    double partGap = 5.0;
    double sheetGap = 50.0;   // between neighbouring sheets along X
};

// One unique plate: measured box size, box minimum corner in insert space
// and how many copies to cut.
struct NestPart {
    std::string name;
    double width = 0.0;
    double height = 0.0;
    long long quantity = 1;
    double minX = 0.0;
    double minY = 0.0;
};

// One physical copy to place.
struct NestingInstance {
    size_t partIndex;
    double width;
    double height;
};

struct Sheet {
    int index = 1;             // 1-based
    double originX = 0.0;
    double originY = 0.0;
    double width = 0.0;
    double height = 0.0;
    double usableWidth = 0.0;
    double usableHeight = 0.0;
    double cursorX = 0.0;      // relative to origin
    double cursorY = 0.0;
    double rowHeight = 0.0;
    size_t placedCount = 0;
    double usedArea = 0.0;     // sum of placed box areas, mm^2
};

// Placed box area over usable area, in percent.
double sheetFillPercent(const Sheet& s);

struct PlacedInstance {
    size_t partIndex;
    int sheetIndex;
    double cellX, cellY;       // box corner relative to the sheet origin
    double insertX, insertY;   // world insertion point of the block
};

struct NestedLayout {
    std::vector<Sheet> sheets;
    std::vector<PlacedInstance> placements;
};

// Upper bound on the instances of one run.
constexpr long long kMaxInstances = 1000000;

using NestProgress = std::function<void(size_t placed, size_t total)>;

// Throws ConfigurationError for bad sheet size or constants or more than
// kMaxInstances copies in total, FitError for the first part that cannot fit
// the usable area.
void validateNesting(const std::vector<NestPart>& parts, const NestOptions& opt);

// Each part `quantity` times, stable sorted by height then width, descending.
std::vector<NestingInstance> expandInstances(const std::vector<NestPart>& parts);

// Greedy shelf packing over as many sheets as needed. Validates first, so
// either every instance is placed or nothing is.
NestedLayout shelfNest(const std::vector<NestPart>& parts, const NestOptions& opt,
                       const NestProgress& progress = nullptr);
