#pragma once
#include "drawing_store.h"
#include <iosfwd>
#include <string>

// ASCII DXF backed store (HEADER, BLOCKS and ENTITIES sections).
class DxfDrawingStore : public DrawingStore {
public:
    Drawing open(const std::string& path) override;
    void save(const Drawing& drawing, const std::string& path) override;
};

// Stream level entry points, also used by the tests.
Drawing readDxf(std::istream& in);
void writeDxf(std::ostream& out, const Drawing& drawing);

// Millimetres per drawing unit for a $INSUNITS code.
double dxfUnitFactor(int code);
