#pragma once
#include "color_picker.h"
#include "drawing_store.h"
#include "part_catalog.h"
#include <optional>
#include <string>
#include <vector>

struct AssemblyOptions {
    double textHeight = 20.0;
    double textWidthFactor = 0.6;
    double columnMargin = 50.0;   // between columns
    double labelGap = 5.0;        // plate bottom to label, label to label
};

struct AssemblyResult {
    Drawing drawing;
    std::vector<std::string> blockNames;   // one per assembled part
    size_t skippedParts = 0;               // unreadable source or no geometry
};

// "P_<file stem, non-alphanumerics as '_'>_Q<max(1, quantity)>".
std::string plateBlockName(const std::string& fileName, long long quantity);

// "thickness_<t>.dxf" with '.' and ',' in <t> replaced by '_'.
std::string thicknessDrawingName(double thicknessMm);

// Inverse of thicknessDrawingName: 6.5 from ".../thickness_6_5.dxf".
std::optional<double> thicknessFromDrawingName(const std::string& path);

// Lays out one thickness: each part's model space becomes one plate block,
// inserted bottom-on-Y=0 in its own column with two labels underneath.
class ThicknessGroupAssembler {
public:
    ThicknessGroupAssembler(DrawingStore& store, ColorPicker& colors,
                            AssemblyOptions opt = AssemblyOptions())
        : store_(store), colors_(colors), opt_(opt) {}

    AssemblyResult assemble(double thicknessMm, const std::vector<UniquePart>& parts);

private:
    DrawingStore& store_;
    ColorPicker& colors_;
    AssemblyOptions opt_;
};

// Path to open for a catalog entry: the recorded path if it exists, else the
// same stem with a .dxf extension if that exists, else the recorded path.
std::string resolveSourcePath(const std::string& path);
