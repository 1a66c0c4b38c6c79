#pragma once
#include "layout_renderer.h"
#include "shelf_nesting.h"
#include "thickness_assembler.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct SheetPreset {
    std::string name;
    double width = 0.0;
    double height = 0.0;
};

struct SheetSize {
    double width = 0.0;
    double height = 0.0;
};

// Run settings: built-in defaults, then a JSON file, then the command line.
struct Settings {
    NestOptions nest;
    AssemblyOptions assembly;
    RenderOptions render;
    std::optional<uint32_t> colorSeed;
    std::vector<SheetPreset> presets;
    std::map<std::string, SheetSize> sheetsByThickness;   // "0.###" thickness key
    bool gapAtLeastThickness = true;   // batch: part gap raised to the plate thickness

    Settings();

    // Nesting options with the sheet size for `thicknessMm`, if one is set.
    NestOptions nestFor(double thicknessMm) const;
    // Case-insensitive lookup.
    const SheetPreset* findPreset(const std::string& name) const;
};

std::vector<SheetPreset> builtinPresets();

// Parses "WxH" (also 'X' or '*'). Returns false on malformed input.
bool parseSheetSize(const std::string& text, double& width, double& height);

// Overlays the keys present in `jsonText` onto `s`. Unknown keys are
// ignored. Throws ConfigurationError on bad JSON or wrongly typed values.
void applyConfigText(const std::string& jsonText, Settings& s);
// Same, reading the text from `path`.
void applyConfigFile(const std::string& path, Settings& s);
