// main.cpp - platenest command line
//   platenest combine <main folder>   merge parts.csv files, write all_parts.csv
//                                     and one thickness_<t>.dxf per thickness
//   platenest nest <drawing.dxf>      shelf nest the P_ blocks onto sheets
//   platenest batch <main folder>     combine, then nest every thickness drawing
#include "catalog_cache.h"
#include "color_picker.h"
#include "config.h"
#include "dxf_store.h"
#include "errors.h"
#include "file_util.h"
#include "geometry.h"
#include "layout_renderer.h"
#include "pipeline.h"
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <random>

struct CLI {
    std::string command;
    std::string path;
    std::string csv;          // placement report for `nest`
    Settings settings;
    bool verbose = false;
};

static void requireNumber(const cxxopts::ParseResult& r, const char* key, double& out) {
    if (r.count(key)) out = r[key].as<double>();
}

static CLI parse(int ac, char** av) {
    CLI c;
    cxxopts::Options options(av[0], "Plate catalog merge and sheet nesting");
    options.positional_help("<combine|nest|batch> <path>");
    options.add_options()
        ("command", "combine, nest or batch", cxxopts::value<std::string>())
        ("path", "main folder (combine, batch) or drawing (nest)", cxxopts::value<std::string>())
        ("s,sheet", "sheet size WxH in mm", cxxopts::value<std::string>())
        ("preset", "named sheet preset", cxxopts::value<std::string>())
        ("margin", "sheet margin in mm (default 5)", cxxopts::value<double>())
        ("gap", "gap between parts in mm (default 5)", cxxopts::value<double>())
        ("sheet-gap", "gap between sheets in mm (default 50)", cxxopts::value<double>())
        ("text-height", "label text height in mm (default 20)", cxxopts::value<double>())
        ("seed", "colour seed", cxxopts::value<unsigned>())
        ("config", "JSON settings file", cxxopts::value<std::string>())
        ("csv", "placement report CSV (nest)", cxxopts::value<std::string>())
        ("v,verbose", "verbose", cxxopts::value<bool>()->default_value("false"))
        ("h,help", "print help");
    options.parse_positional({ "command", "path" });

    auto result = options.parse(ac, av);
    if (result.count("help") || ac == 1) {
        std::cout << options.help() << "\n";
        std::cout << "Presets:";
        for (const auto& p : builtinPresets()) std::cout << ' ' << p.name;
        std::cout << "\n";
        std::exit(0);
    }
    if (!result.count("command") || !result.count("path"))
        throw std::runtime_error("use --help for usage");

    c.command = result["command"].as<std::string>();
    c.path = result["path"].as<std::string>();
    c.verbose = result["verbose"].as<bool>();
    if (result.count("csv")) c.csv = result["csv"].as<std::string>();

    Settings& s = c.settings;
    if (result.count("config")) applyConfigFile(result["config"].as<std::string>(), s);

    if (result.count("preset")) {
        auto name = result["preset"].as<std::string>();
        const SheetPreset* p = s.findPreset(name);
        if (!p) throw ConfigurationError("unknown sheet preset " + name);
        s.nest.sheetWidth = p->width;
        s.nest.sheetHeight = p->height;
    }
    if (result.count("sheet")) {
        auto sheet = result["sheet"].as<std::string>();
        if (!parseSheetSize(sheet, s.nest.sheetWidth, s.nest.sheetHeight))
            throw ConfigurationError("bad sheet size '" + sheet + "', expected WxH");
    }
    requireNumber(result, "margin", s.nest.sheetMargin);
    requireNumber(result, "gap", s.nest.partGap);
    requireNumber(result, "sheet-gap", s.nest.sheetGap);
    requireNumber(result, "text-height", s.assembly.textHeight);
    if (result.count("seed")) s.colorSeed = result["seed"].as<unsigned>();
    return c;
}

static void printCombine(const CombineReport& r) {
    std::cout << "folders " << r.foldersScanned << " (without records " << r.foldersWithoutRecords
              << "), rows " << r.rowsRead << " (skipped " << r.rowsSkipped << ")\n";
    if (r.noData()) {
        std::cout << "no data\n";
        return;
    }
    std::cout << "unique parts " << r.uniqueParts << ", skipped while assembling "
              << r.partsSkipped << "\n";
    if (r.summaryWritten) std::cout << "  ->  " << r.summaryPath << "\n";
    for (const auto& d : r.drawings)
        std::cout << "thickness " << formatThickness(d.thicknessMm) << " mm: " << d.plates
                  << " plate(s)" << (d.written ? "  ->  " + d.path : std::string(" (not written)"))
                  << "\n";
}

static void printNest(const NestReport& r) {
    if (r.nothingToNest()) {
        std::cout << r.sourcePath << ": nothing to nest\n";
        return;
    }
    std::cout << r.sourcePath << ": placed " << r.instances << " on " << r.sheets
              << " sheet(s), ignored blocks " << r.ignoredBlocks;
    if (r.written) std::cout << "  ->  " << r.outputPath;
    std::cout << "\n";
    for (const auto& sh : r.layout.sheets)
        std::cout << "  sheet " << sh.index << ": " << fillLabel(sh) << "\n";
    if (r.logged) std::cout << "  log  ->  " << r.logPath << "\n";
}

int main(int argc, char* argv[])
{
    try {
        spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");
        spdlog::set_level(spdlog::level::warn);
        CLI cli = parse(argc, argv);
        spdlog::set_level(cli.verbose ? spdlog::level::info : spdlog::level::warn);
        const Settings& s = cli.settings;
        if (cli.verbose)
            spdlog::info("Sheet: {}x{} mm, margin={} gap={} sheet gap={}",
                         s.nest.sheetWidth, s.nest.sheetHeight, s.nest.sheetMargin,
                         s.nest.partGap, s.nest.sheetGap);

        DxfDrawingStore store;
        VisibleColorPicker colors(s.colorSeed ? *s.colorSeed : std::random_device{}());

        if (cli.command == "combine") {
            printCombine(runCombine(cli.path, s, store, colors));
            return 0;
        }
        if (cli.command == "nest") {
            auto progress = [](size_t placed, size_t total) {
                spdlog::debug("[NEST] placed {}/{}", placed, total);
            };
            NestReport r = runNest(cli.path, s.nest, s.render, store, progress);
            printNest(r);
            if (!cli.csv.empty() && !r.nothingToNest()) {
                writeFileAtomically(cli.csv, placementReport(r.parts, r.layout));
                std::cout << "placement report  ->  " << cli.csv << "\n";
            }
            if (!r.nothingToNest() && !r.written)
                throw PersistenceError("could not write " + r.outputPath);
            return 0;
        }
        if (cli.command == "batch") {
            CatalogCache cache(8);
            BatchReport r = runBatch(cli.path, s, store, colors, cache);
            printCombine(r.combine);
            for (const auto& n : r.nested) printNest(n);
            for (const auto& f : r.failures) std::cout << "FAILED " << f << "\n";
            if (r.quantityMismatches)
                std::cout << "quantity mismatches: " << r.quantityMismatches << "\n";
            return r.failures.empty() ? 0 : 1;
        }
        throw std::runtime_error("unknown command '" + cli.command + "', use --help for usage");
    }
    catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 1;
    }
}
