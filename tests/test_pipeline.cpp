#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "block_extractor.h"
#include "dxf_store.h"
#include "nest_log.h"
#include "pipeline.h"
#include "test_support.h"

// Two job folders sharing plateX at 3 mm, plus plateY at 5 mm.
static void makeJob(const fs::path& root, DrawingStore& store) {
    writeText(root / "A" / kPartsFileName,
              "FileName,PlateThickness_mm,Quantity\nplateX.dwg,3,2\nplateY.dwg,5,1\n");
    writeText(root / "B" / kPartsFileName,
              "FileName,PlateThickness_mm,Quantity\nplateX.dwg,3,3\n");
    fs::create_directories(root / "C");
    store.save(rectDrawing(0, 0, 300, 200), (root / "A" / "plateX.dxf").string());
    store.save(rectDrawing(0, 0, 150, 150), (root / "A" / "plateY.dxf").string());
    store.save(rectDrawing(0, 0, 999, 999), (root / "B" / "plateX.dxf").string());
}

static Settings sheetSettings(double w, double h) {
    Settings s;
    s.nest.sheetWidth = w;
    s.nest.sheetHeight = h;
    return s;
}

TEST_CASE("combine then nest end to end") {
    TempDir tmp;
    DxfDrawingStore store;
    makeJob(tmp.path, store);
    Settings settings = sheetSettings(1000, 500);
    FixedColorPicker colors(3);

    CombineReport c = runCombine(tmp.str(), settings, store, colors);
    REQUIRE(c.foldersScanned == 3);
    REQUIRE(c.foldersWithoutRecords == 1);
    REQUIRE(c.rowsRead == 3);
    REQUIRE(c.rowsSkipped == 0);
    REQUIRE(c.uniqueParts == 2);
    REQUIRE(c.summaryWritten);
    REQUIRE(readText(tmp.path / kSummaryFileName) ==
            "FileName,PlateThickness_mm,Quantity,Folder\n"
            "plateX.dwg,3,5,A\n"
            "plateY.dwg,5,1,A\n");

    REQUIRE(c.drawings.size() == 2);
    REQUIRE(c.drawings[0].written);
    REQUIRE(c.drawings[1].written);
    REQUIRE(fs::exists(tmp.path / "thickness_3.dxf"));
    REQUIRE(fs::exists(tmp.path / "thickness_5.dxf"));

    // the first-seen record supplies the geometry (folder A, 300 x 200)
    Drawing t3 = store.open((tmp.path / "thickness_3.dxf").string());
    REQUIRE(t3.hasBlock("P_plateX_Q5"));
    auto plates = extractPlates(t3, store);
    REQUIRE(plates.plates.size() == 1);
    REQUIRE(plates.plates[0].width == Approx(300));
    REQUIRE(plates.plates[0].quantity == 5);

    size_t progressCalls = 0;
    NestReport n = runNest((tmp.path / "thickness_3.dxf").string(), settings.nest, settings.render,
                           store, [&](size_t, size_t) { ++progressCalls; });
    REQUIRE(n.written);
    REQUIRE(n.instances == 5);
    REQUIRE(n.sheets == 1);
    REQUIRE(progressCalls == 5);
    REQUIRE(fs::path(n.outputPath) == tmp.path / "thickness_3_nested.dxf");

    Drawing nested = store.open(n.outputPath);
    size_t inserts = 0;
    for (const auto& e : nested.modelSpace())
        if (e.kind == EntityKind::Insert && e.blockName == "P_plateX_Q5") ++inserts;
    REQUIRE(inserts == 5);
    REQUIRE(nested.hasBlock("P_plateX_Q5"));

    REQUIRE(n.logged);
    REQUIRE(fs::path(n.logPath) == tmp.path / "thickness_3_nest_log.txt");
    std::string log = readText(tmp.path / "thickness_3_nest_log.txt");
    REQUIRE(log.find("Nest run: thickness_3.dxf") != std::string::npos);
    REQUIRE(log.find("Sheet: 1000 x 500 mm") != std::string::npos);
    REQUIRE(log.find("Thickness(mm): 3") != std::string::npos);
    REQUIRE(log.find("Gap(mm): 5") != std::string::npos);
    REQUIRE(log.find("Sheets used: 1") != std::string::npos);
    REQUIRE(log.find("Total parts: 5") != std::string::npos);
    REQUIRE(log.find("Placed area(m2): 0.300") != std::string::npos);
    REQUIRE(log.find("Output: thickness_3_nested.dxf") != std::string::npos);

    // a second run appends
    runNest((tmp.path / "thickness_3.dxf").string(), settings.nest, settings.render, store);
    log = readText(tmp.path / "thickness_3_nest_log.txt");
    size_t runs = 0;
    for (size_t at = log.find("Nest run:"); at != std::string::npos; at = log.find("Nest run:", at + 1))
        ++runs;
    REQUIRE(runs == 2);
}

TEST_CASE("nest log entry") {
    NestReport r;
    r.sourcePath = "/jobs/plates.dxf";
    r.outputPath = "/jobs/plates_nested.dxf";
    r.options.sheetWidth = 1000;
    r.options.sheetHeight = 500;
    r.options.partGap = 2.5;
    r.instances = 3;
    r.sheets = 2;
    Sheet a;
    a.usableWidth = 990;
    a.usableHeight = 490;
    a.usedArea = 250000;
    Sheet b = a;
    b.usedArea = 0;
    r.layout.sheets = { a, b };
    REQUIRE(nestLogEntry(r) ==
            "Nest run: plates.dxf\n"
            "  Sheet: 1000 x 500 mm\n"
            "  Gap(mm): 2.5\n"
            "  Margin(mm): 5\n"
            "  Sheets used: 2\n"
            "  Total parts: 3\n"
            "  Placed area(m2): 0.250\n"
            "  Fill: 51.5%, 0.0%\n"
            "  Output: plates_nested.dxf\n" +
            std::string(70, '-'));
    REQUIRE(fs::path(nestLogPath("/jobs/thickness_6_5.dxf")) == fs::path("/jobs/thickness_6_5_nest_log.txt"));
}

TEST_CASE("batch gap follows the plate thickness") {
    Settings s = sheetSettings(1000, 500);
    REQUIRE(batchNestOptions(s, 8).partGap == Approx(8));
    REQUIRE(batchNestOptions(s, 3).partGap == Approx(5));
    REQUIRE(batchNestOptions(s, 8).sheetWidth == Approx(1000));
    s.sheetsByThickness["8"] = { 3000, 1500 };
    REQUIRE(batchNestOptions(s, 8).sheetWidth == Approx(3000));
    s.gapAtLeastThickness = false;
    REQUIRE(batchNestOptions(s, 8).partGap == Approx(5));
}

TEST_CASE("combine is repeatable") {
    TempDir tmp;
    DxfDrawingStore store;
    makeJob(tmp.path, store);
    FixedColorPicker colors(1);
    runCombine(tmp.str(), Settings(), store, colors);
    std::string first = readText(tmp.path / kSummaryFileName);
    runCombine(tmp.str(), Settings(), store, colors);
    REQUIRE(readText(tmp.path / kSummaryFileName) == first);
}

TEST_CASE("plate too large writes nothing") {
    TempDir tmp;
    DxfDrawingStore store;
    makeJob(tmp.path, store);
    FixedColorPicker colors(1);
    runCombine(tmp.str(), Settings(), store, colors);

    NestOptions small;
    small.sheetWidth = 200;
    small.sheetHeight = 200;
    REQUIRE_THROWS_AS(runNest((tmp.path / "thickness_3.dxf").string(), small, RenderOptions(), store),
                      FitError);
    REQUIRE_FALSE(fs::exists(tmp.path / "thickness_3_nested.dxf"));

    NestOptions none;
    REQUIRE_THROWS_AS(runNest((tmp.path / "thickness_3.dxf").string(), none, RenderOptions(), store),
                      ConfigurationError);
    REQUIRE_THROWS_AS(runNest((tmp.path / "missing.dxf").string(), small, RenderOptions(), store),
                      DrawingOpenError);
}

TEST_CASE("no parts data") {
    TempDir tmp;
    fs::create_directories(tmp.path / "empty");
    writeText(tmp.path / "headerOnly" / kPartsFileName, "FileName,PlateThickness_mm,Quantity\n");
    MemoryDrawingStore store;
    FixedColorPicker colors(1);
    CombineReport c = runCombine(tmp.str(), Settings(), store, colors);
    REQUIRE(c.noData());
    REQUIRE(c.foldersWithoutRecords == 2);
    REQUIRE_FALSE(c.summaryWritten);
    REQUIRE_FALSE(fs::exists(tmp.path / kSummaryFileName));
    REQUIRE(store.files.empty());

    REQUIRE_THROWS_AS(runCombine((tmp.path / "nope").string(), Settings(), store, colors),
                      std::runtime_error);
}

TEST_CASE("failed drawing save is reported") {
    TempDir tmp;
    writeText(tmp.path / "A" / kPartsFileName, "FileName,PlateThickness_mm,Quantity\nq.dwg,2,4\n");
    MemoryDrawingStore store;
    store.files[(tmp.path / "A" / "q.dwg").string()] = rectDrawing(0, 0, 40, 40);
    store.failSave.insert((tmp.path / "thickness_2.dxf").string());
    FixedColorPicker colors(1);
    CombineReport c = runCombine(tmp.str(), Settings(), store, colors);
    REQUIRE(c.summaryWritten);
    REQUIRE(c.drawings.size() == 1);
    REQUIRE(c.drawings[0].plates == 1);
    REQUIRE_FALSE(c.drawings[0].written);
}

TEST_CASE("failed nested save leaves written false") {
    MemoryDrawingStore store;
    Drawing d;
    d.addBlock("P_a_Q2").entities.push_back(DrawingEntity::line(0, 0, 50, 30));
    store.files["/m/t.dxf"] = d;
    store.failSave.insert((fs::path("/m") / "t_nested.dxf").string());
    NestOptions opt;
    opt.sheetWidth = 500;
    opt.sheetHeight = 500;
    NestReport n = runNest("/m/t.dxf", opt, RenderOptions(), store);
    REQUIRE(n.instances == 2);
    REQUIRE_FALSE(n.written);
    REQUIRE(store.files.size() == 1);
}

TEST_CASE("nothing to nest") {
    MemoryDrawingStore store;
    Drawing d;
    d.addBlock("FRAME").entities.push_back(DrawingEntity::line(0, 0, 50, 30));
    store.files["/m/t.dxf"] = d;
    NestOptions opt;
    opt.sheetWidth = 500;
    opt.sheetHeight = 500;
    NestReport n = runNest("/m/t.dxf", opt, RenderOptions(), store);
    REQUIRE(n.nothingToNest());
    REQUIRE(n.ignoredBlocks == 1);
    REQUIRE_FALSE(n.written);
    REQUIRE(store.files.size() == 1);
}

TEST_CASE("batch continues past a failing thickness") {
    TempDir tmp;
    DxfDrawingStore store;
    makeJob(tmp.path, store);
    Settings settings = sheetSettings(1000, 500);
    settings.sheetsByThickness["5"] = { 100, 100 };
    FixedColorPicker colors(2);
    CatalogCache cache(4);

    BatchReport b = runBatch(tmp.str(), settings, store, colors, cache);
    REQUIRE(b.combine.uniqueParts == 2);
    REQUIRE(b.failures.size() == 1);
    REQUIRE(b.failures[0].find("thickness 5 mm") != std::string::npos);
    REQUIRE(b.nested.size() == 1);
    REQUIRE(b.nested[0].instances == 5);
    REQUIRE(b.quantityMismatches == 0);
    REQUIRE(fs::exists(tmp.path / "thickness_3_nested.dxf"));
    REQUIRE_FALSE(fs::exists(tmp.path / "thickness_5_nested.dxf"));

    // a second batch re-reads the rewritten catalog
    writeText(tmp.path / "B" / kPartsFileName, "FileName,PlateThickness_mm,Quantity\nplateX.dwg,3,7\n");
    b = runBatch(tmp.str(), settings, store, colors, cache);
    REQUIRE(b.nested.size() == 1);
    REQUIRE(b.nested[0].instances == 9);
    REQUIRE(b.quantityMismatches == 0);
}
