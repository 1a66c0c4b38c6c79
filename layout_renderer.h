#pragma once
#include "drawing.h"
#include "shelf_nesting.h"
#include <string>
#include <vector>

struct RenderOptions {
    double sheetLabelHeight = 15.0;
    double sheetLabelOffset = 20.0;   // label baseline below the sheet top
    double fillLabelInset = 220.0;    // fill label start left of the sheet's right edge
};

// Builds the nested drawing: the source's blocks, one insert per placement,
// four boundary lines, a "SHEET n" label and a "Fill: x%" label per sheet.
Drawing renderLayout(const Drawing& source, const std::vector<NestPart>& parts,
                     const NestedLayout& layout, const NestOptions& nest,
                     const RenderOptions& opt = RenderOptions());

// "Fill: 61.8%"
std::string fillLabel(const Sheet& s);

// <dir>/<stem>_nested.dxf
std::string nestedOutputPath(const std::string& sourcePath);

// CSV "sheet,part,x_mm,y_mm,width_mm,height_mm", positions relative to the
// sheet's lower left corner.
std::string placementReport(const std::vector<NestPart>& parts, const NestedLayout& layout);
