#include "pipeline.h"
#include "block_extractor.h"
#include "errors.h"
#include "geometry.h"
#include "layout_renderer.h"
#include "nest_log.h"
#include "part_catalog.h"
#include "thickness_assembler.h"
#include <algorithm>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static std::vector<std::string> jobFolders(const std::string& mainFolder) {
    std::error_code ec;
    if (!fs::is_directory(mainFolder, ec))
        throw std::runtime_error("not a directory: " + mainFolder);
    std::vector<std::string> dirs;
    for (const auto& e : fs::directory_iterator(mainFolder))
        if (e.is_directory(ec)) dirs.push_back(e.path().string());
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

CombineReport runCombine(const std::string& mainFolder, const Settings& settings,
                         DrawingStore& store, ColorPicker& colors) {
    CombineReport rep;
    auto folders = jobFolders(mainFolder);
    rep.foldersScanned = folders.size();
    if (folders.empty())
        spdlog::warn("[COMBINE] {} has no job folders", mainFolder);

    PartCatalogAggregator agg;
    for (const auto& f : folders) agg.addFolder(f);
    rep.foldersWithoutRecords = agg.foldersWithoutRecords();
    rep.rowsRead = agg.rowsRead();
    rep.rowsSkipped = agg.rowsSkipped();
    rep.catalog = agg.catalog();
    rep.uniqueParts = rep.catalog.size();
    if (rep.noData()) {
        spdlog::warn("[COMBINE] no parts.csv with data under {}", mainFolder);
        return rep;
    }

    rep.summaryPath = (fs::path(mainFolder) / kSummaryFileName).string();
    try {
        writeSummary(rep.summaryPath, rep.catalog);
        rep.summaryWritten = true;
        spdlog::info("[COMBINE] wrote {} ({} part(s))", rep.summaryPath, rep.uniqueParts);
    } catch (const PersistenceError& ex) {
        spdlog::error("[COMBINE] {}", ex.what());
    }

    ThicknessGroupAssembler assembler(store, colors, settings.assembly);
    for (const auto& group : groupByThickness(rep.catalog)) {
        ThicknessDrawing td;
        td.thicknessMm = group.first;
        td.path = (fs::path(mainFolder) / thicknessDrawingName(group.first)).string();

        AssemblyResult res = assembler.assemble(group.first, group.second);
        td.plates = res.blockNames.size();
        td.skippedParts = res.skippedParts;
        rep.partsSkipped += res.skippedParts;

        if (td.plates == 0) {
            spdlog::warn("[COMBINE] thickness {} mm: no part could be assembled, no drawing",
                         formatThickness(group.first));
        } else {
            try {
                store.save(res.drawing, td.path);
                td.written = true;
                spdlog::info("[COMBINE] wrote {} ({} plate(s))", td.path, td.plates);
            } catch (const PersistenceError& ex) {
                spdlog::error("[COMBINE] {}", ex.what());
            }
        }
        rep.drawings.push_back(td);
    }
    return rep;
}

NestReport runNest(const std::string& drawingPath, const NestOptions& nest,
                   const RenderOptions& render, DrawingStore& store,
                   const NestProgress& progress) {
    NestReport rep;
    rep.sourcePath = drawingPath;
    rep.options = nest;
    rep.thicknessMm = thicknessFromDrawingName(drawingPath);

    Drawing src = store.open(drawingPath);
    ExtractionResult ex = extractPlates(src, store);
    rep.ignoredBlocks = ex.ignoredNames + ex.withoutGeometry + ex.degenerate;

    for (const auto& p : ex.plates) {
        NestPart np;
        np.name = p.name;
        np.width = p.width;
        np.height = p.height;
        np.quantity = p.quantity;
        np.minX = p.box.minX;
        np.minY = p.box.minY;
        rep.parts.push_back(np);
    }

    rep.layout = shelfNest(rep.parts, nest, progress);
    rep.instances = rep.layout.placements.size();
    rep.sheets = rep.layout.sheets.size();
    if (rep.nothingToNest()) {
        spdlog::warn("[NEST] {}: nothing to nest", drawingPath);
        return rep;
    }

    Drawing out = renderLayout(src, rep.parts, rep.layout, nest, render);
    rep.outputPath = nestedOutputPath(drawingPath);
    try {
        store.save(out, rep.outputPath);
        rep.written = true;
        spdlog::info("[NEST] wrote {}", rep.outputPath);
    } catch (const PersistenceError& e) {
        spdlog::error("[NEST] {}", e.what());
        return rep;
    }

    rep.logPath = nestLogPath(drawingPath);
    try {
        appendNestLog(rep.logPath, nestLogEntry(rep));
        rep.logged = true;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("[NEST] {} not updated: {}", rep.logPath, e.what());
    }
    return rep;
}

NestOptions batchNestOptions(const Settings& settings, double thicknessMm) {
    NestOptions o = settings.nestFor(thicknessMm);
    if (settings.gapAtLeastThickness && thicknessMm > o.partGap)
        o.partGap = thicknessMm;
    return o;
}

BatchReport runBatch(const std::string& mainFolder, const Settings& settings,
                     DrawingStore& store, ColorPicker& colors, CatalogCache& cache) {
    BatchReport rep;
    rep.combine = runCombine(mainFolder, settings, store, colors);
    cache.invalidate(mainFolder);
    if (rep.combine.noData()) return rep;

    std::vector<UniquePart> catalog;
    bool haveCatalog = false;
    if (rep.combine.summaryWritten) {
        try {
            catalog = cache.load(mainFolder);
            haveCatalog = true;
        } catch (const std::runtime_error& e) {
            spdlog::warn("[BATCH] quantity check disabled: {}", e.what());
        }
    }

    for (const auto& td : rep.combine.drawings) {
        if (!td.written) continue;
        std::string t = formatThickness(td.thicknessMm);
        NestOptions opt = batchNestOptions(settings, td.thicknessMm);
        NestReport nr;
        try {
            nr = runNest(td.path, opt, settings.render, store);
        } catch (const FitError& e) {
            rep.failures.push_back("thickness " + t + " mm: " + e.what());
            spdlog::error("[BATCH] thickness {} mm: {}", t, e.what());
            continue;
        } catch (const ConfigurationError& e) {
            rep.failures.push_back("thickness " + t + " mm: " + e.what());
            spdlog::error("[BATCH] thickness {} mm: {}", t, e.what());
            continue;
        } catch (const DrawingOpenError& e) {
            rep.failures.push_back("thickness " + t + " mm: " + e.what());
            spdlog::error("[BATCH] thickness {} mm: {}", t, e.what());
            continue;
        }

        if (haveCatalog) {
            long long expected = 0;
            for (const auto& p : catalog)
                if (thousandths(p.thicknessMm) == thousandths(td.thicknessMm))
                    expected += std::max(1LL, p.totalQuantity);
            if (expected != static_cast<long long>(nr.instances)) {
                ++rep.quantityMismatches;
                spdlog::warn("[BATCH] thickness {} mm: catalog lists {} piece(s), drawing yields {}"
                             " ({} part(s) skipped while assembling)",
                             t, expected, nr.instances, td.skippedParts);
            }
        }
        rep.nested.push_back(std::move(nr));
    }
    return rep;
}
