#include "config.h"
#include "errors.h"
#include "file_util.h"
#include "geometry.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

std::vector<SheetPreset> builtinPresets() {
    return {
        { "1500x3000", 3000.0, 1500.0 },
        { "1250x2500", 2500.0, 1250.0 },
        { "1000x2000", 2000.0, 1000.0 },
    };
}

Settings::Settings() : presets(builtinPresets()) {}

NestOptions Settings::nestFor(double thicknessMm) const {
    NestOptions o = nest;
    auto it = sheetsByThickness.find(formatThickness(thicknessMm));
    if (it != sheetsByThickness.end()) {
        o.sheetWidth = it->second.width;
        o.sheetHeight = it->second.height;
    }
    return o;
}

const SheetPreset* Settings::findPreset(const std::string& name) const {
    std::string key = toUpper(trim(name));
    for (const auto& p : presets)
        if (toUpper(p.name) == key) return &p;
    return nullptr;
}

bool parseSheetSize(const std::string& text, double& width, double& height) {
    auto x = text.find_first_of("xX*");
    if (x == std::string::npos) return false;
    double w = 0, h = 0;
    if (!parseDouble(text.substr(0, x), w) || !parseDouble(text.substr(x + 1), h))
        return false;
    width = w;
    height = h;
    return true;
}

namespace {

double number(const json& v, const std::string& what) {
    if (!v.is_number())
        throw ConfigurationError("config: '" + what + "' must be a number");
    return v.get<double>();
}

void readNumber(const json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it != j.end()) out = number(*it, key);
}

SheetSize readSize(const json& v, const std::string& what) {
    if (!v.is_object())
        throw ConfigurationError("config: '" + what + "' must be an object with width and height");
    auto w = v.find("width");
    auto h = v.find("height");
    if (w == v.end() || h == v.end())
        throw ConfigurationError("config: '" + what + "' needs width and height");
    return { number(*w, what + ".width"), number(*h, what + ".height") };
}

}

void applyConfigText(const std::string& jsonText, Settings& s) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("config: ") + e.what());
    }
    if (!j.is_object())
        throw ConfigurationError("config: top level must be an object");

    auto sheet = j.find("sheet");
    if (sheet != j.end()) {
        SheetSize sz = readSize(*sheet, "sheet");
        s.nest.sheetWidth = sz.width;
        s.nest.sheetHeight = sz.height;
    }
    readNumber(j, "sheetMargin", s.nest.sheetMargin);
    readNumber(j, "partGap", s.nest.partGap);
    readNumber(j, "sheetGap", s.nest.sheetGap);
    readNumber(j, "textHeight", s.assembly.textHeight);
    readNumber(j, "textWidthFactor", s.assembly.textWidthFactor);
    readNumber(j, "columnMargin", s.assembly.columnMargin);
    readNumber(j, "labelGap", s.assembly.labelGap);
    readNumber(j, "sheetLabelHeight", s.render.sheetLabelHeight);
    readNumber(j, "sheetLabelOffset", s.render.sheetLabelOffset);

    auto autoGap = j.find("gapAtLeastThickness");
    if (autoGap != j.end()) {
        if (!autoGap->is_boolean())
            throw ConfigurationError("config: 'gapAtLeastThickness' must be true or false");
        s.gapAtLeastThickness = autoGap->get<bool>();
    }

    auto seed = j.find("colorSeed");
    if (seed != j.end()) {
        if (!seed->is_number_integer() || seed->get<long long>() < 0)
            throw ConfigurationError("config: 'colorSeed' must be a non-negative integer");
        s.colorSeed = static_cast<uint32_t>(seed->get<unsigned long long>());
    }

    auto presets = j.find("presets");
    if (presets != j.end()) {
        if (!presets->is_array())
            throw ConfigurationError("config: 'presets' must be an array");
        for (const auto& p : *presets) {
            if (!p.is_object() || p.find("name") == p.end() || !p["name"].is_string())
                throw ConfigurationError("config: every preset needs a string 'name'");
            SheetPreset sp;
            sp.name = p["name"].get<std::string>();
            SheetSize sz = readSize(p, "presets." + sp.name);
            sp.width = sz.width;
            sp.height = sz.height;
            bool replaced = false;
            for (auto& existing : s.presets)
                if (toUpper(existing.name) == toUpper(sp.name)) { existing = sp; replaced = true; }
            if (!replaced) s.presets.push_back(sp);
        }
    }

    auto byT = j.find("sheetsByThickness");
    if (byT != j.end()) {
        if (!byT->is_object())
            throw ConfigurationError("config: 'sheetsByThickness' must be an object");
        for (auto it = byT->begin(); it != byT->end(); ++it) {
            double t = 0;
            if (!parseDouble(it.key(), t))
                throw ConfigurationError("config: bad thickness key '" + it.key() + "'");
            s.sheetsByThickness[formatThickness(t)] = readSize(it.value(), "sheetsByThickness." + it.key());
        }
    }
}

void applyConfigFile(const std::string& path, Settings& s) {
    std::ifstream f(path);
    if (!f)
        throw ConfigurationError("cannot open config " + path);
    std::stringstream buf;
    buf << f.rdbuf();
    applyConfigText(buf.str(), s);
    spdlog::info("[CONFIG] loaded {}", path);
}
