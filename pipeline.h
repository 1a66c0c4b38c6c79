#pragma once
#include "catalog_cache.h"
#include "color_picker.h"
#include "config.h"
#include "drawing_store.h"
#include "shelf_nesting.h"
#include <optional>
#include <string>
#include <vector>

struct ThicknessDrawing {
    double thicknessMm = 0.0;
    std::string path;
    size_t plates = 0;
    size_t skippedParts = 0;
    bool written = false;
};

struct CombineReport {
    size_t foldersScanned = 0;
    size_t foldersWithoutRecords = 0;
    size_t rowsRead = 0;
    size_t rowsSkipped = 0;
    size_t uniqueParts = 0;
    size_t partsSkipped = 0;
    std::string summaryPath;
    bool summaryWritten = false;
    std::vector<UniquePart> catalog;
    std::vector<ThicknessDrawing> drawings;

    bool noData() const { return uniqueParts == 0; }
};

struct NestReport {
    std::string sourcePath;
    std::string outputPath;
    size_t ignoredBlocks = 0;     // not plates, no geometry or degenerate
    size_t instances = 0;
    size_t sheets = 0;
    bool written = false;
    std::optional<double> thicknessMm;   // from a thickness_<t> file name
    NestOptions options;                 // as used for this run
    std::string logPath;
    bool logged = false;
    std::vector<NestPart> parts;
    NestedLayout layout;

    bool nothingToNest() const { return instances == 0; }
};

struct BatchReport {
    CombineReport combine;
    std::vector<NestReport> nested;
    std::vector<std::string> failures;   // one message per thickness that failed
    size_t quantityMismatches = 0;
};

// Aggregates <mainFolder>/*/parts.csv, writes all_parts.csv and one
// thickness_<t>.dxf per thickness. Throws std::runtime_error if
// `mainFolder` is not a directory.
CombineReport runCombine(const std::string& mainFolder, const Settings& settings,
                         DrawingStore& store, ColorPicker& colors);

// Nests the plate blocks of one drawing into <stem>_nested.dxf and appends a
// record to <stem>_nest_log.txt. ConfigurationError, FitError and
// DrawingOpenError propagate and nothing is written. A failed save is logged
// and leaves `written` false.
NestReport runNest(const std::string& drawingPath, const NestOptions& nest,
                   const RenderOptions& render, DrawingStore& store,
                   const NestProgress& progress = nullptr);

// Nesting options for one thickness in a batch: the per-thickness sheet, and
// with gapAtLeastThickness a part gap of at least the plate thickness.
NestOptions batchNestOptions(const Settings& settings, double thicknessMm);

// Combine, then nest every written thickness drawing. A failing thickness
// is recorded and the batch moves on.
BatchReport runBatch(const std::string& mainFolder, const Settings& settings,
                     DrawingStore& store, ColorPicker& colors, CatalogCache& cache);
