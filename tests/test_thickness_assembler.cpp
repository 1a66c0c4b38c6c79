#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "block_extractor.h"
#include "thickness_assembler.h"
#include "test_support.h"

static UniquePart part(const std::string& name, double t, long long qty, const std::string& path) {
    UniquePart p;
    p.fileName = name;
    p.thicknessMm = t;
    p.totalQuantity = qty;
    p.representativeSourcePath = path;
    p.sourceFolder = "A";
    return p;
}

static const DrawingEntity* findInsert(const Drawing& d, const std::string& block) {
    for (const auto& e : d.modelSpace())
        if (e.kind == EntityKind::Insert && e.blockName == block) return &e;
    return nullptr;
}

TEST_CASE("plate block and drawing names") {
    REQUIRE(plateBlockName("plateX.dwg", 5) == "P_plateX_Q5");
    REQUIRE(plateBlockName("plate-X 1.dwg", 2) == "P_plate_X_1_Q2");
    REQUIRE(plateBlockName("bracket.dwg", 0) == "P_bracket_Q1");
    REQUIRE(plateBlockName("", 3) == "P_Part_Q3");
    REQUIRE(thicknessDrawingName(6.5) == "thickness_6_5.dxf");
    REQUIRE(thicknessDrawingName(3) == "thickness_3.dxf");
}

TEST_CASE("thickness from drawing name") {
    REQUIRE(thicknessFromDrawingName("/x/thickness_6_5.dxf") == 6.5);
    REQUIRE(thicknessFromDrawingName("thickness_3.dxf") == 3.0);
    REQUIRE(thicknessFromDrawingName("THICKNESS_12.dxf") == 12.0);
    REQUIRE_FALSE(thicknessFromDrawingName("plates.dxf"));
    REQUIRE_FALSE(thicknessFromDrawingName("thickness_.dxf"));
    REQUIRE_FALSE(thicknessFromDrawingName("thickness_3_nested.dxf"));
}

TEST_CASE("columns, labels and bottom alignment") {
    MemoryDrawingStore store;
    store.files["/src/a.dxf"] = rectDrawing(0, 0, 100, 50);
    store.files["/src/b.dxf"] = rectDrawing(10, 10, 40, 210);
    FixedColorPicker colors(4);
    ThicknessGroupAssembler asm3(store, colors);

    auto res = asm3.assemble(3, { part("a.dxf", 3, 2, "/src/a.dxf"),
                                  part("b.dxf", 3, 7, "/src/b.dxf") });
    REQUIRE(res.skippedParts == 0);
    REQUIRE(res.blockNames == std::vector<std::string>{ "P_a_Q2", "P_b_Q7" });
    const Drawing& d = res.drawing;
    REQUIRE(d.modelSpace().size() == 6);

    // "Plate: 3 mm" is 11 characters, 11 * 20 * 0.6 = 132 > 100
    const DrawingEntity* a = findInsert(d, "P_a_Q2");
    REQUIRE(a);
    REQUIRE(a->center.x == Approx(16));
    REQUIRE(a->center.y == Approx(0));
    const auto& l1 = d.modelSpace()[1];
    const auto& l2 = d.modelSpace()[2];
    REQUIRE(l1.text == "Plate: 3 mm");
    REQUIRE(l1.center.x == Approx(0));
    REQUIRE(l1.center.y == Approx(-25));
    REQUIRE(l1.height == Approx(20));
    REQUIRE(l2.text == "Qty: 2");
    REQUIRE(l2.center.x == Approx(30));
    REQUIRE(l2.center.y == Approx(-50));

    // second column starts at 132 + 50
    const DrawingEntity* b = findInsert(d, "P_b_Q7");
    REQUIRE(b);
    REQUIRE(b->center.x == Approx(223));
    REQUIRE(b->center.y == Approx(-10));
    auto bb = d.bounds(*b);
    REQUIRE(bb);
    REQUIRE(bb->minY == Approx(0));
    REQUIRE((bb->minX + bb->maxX) / 2 == Approx(182 + 66));

    for (const auto& e : d.findBlock("P_a_Q2")->entities)
        REQUIRE(e.color == 4);
}

TEST_CASE("wide plate sets the column width") {
    MemoryDrawingStore store;
    store.files["/w.dxf"] = rectDrawing(-100, 5, 400, 105);
    store.files["/n.dxf"] = rectDrawing(0, 0, 10, 10);
    FixedColorPicker colors(1);
    AssemblyOptions opt;
    opt.columnMargin = 10;
    ThicknessGroupAssembler a(store, colors, opt);
    auto res = a.assemble(2, { part("w.dxf", 2, 1, "/w.dxf"), part("n.dxf", 2, 1, "/n.dxf") });
    auto wb = res.drawing.bounds(*findInsert(res.drawing, "P_w_Q1"));
    REQUIRE(wb->minX == Approx(0));
    REQUIRE(wb->maxX == Approx(500));
    REQUIRE(wb->minY == Approx(0));
    auto nb = res.drawing.bounds(*findInsert(res.drawing, "P_n_Q1"));
    REQUIRE((nb->minX + nb->maxX) / 2 == Approx(510 + 66));
}

TEST_CASE("unreadable or empty sources are skipped") {
    MemoryDrawingStore store;
    Drawing textOnly;
    textOnly.modelSpace().push_back(DrawingEntity::label("note", 0, 0, 5));
    store.files["/t.dxf"] = textOnly;
    store.files["/ok.dxf"] = rectDrawing(0, 0, 10, 10);
    FixedColorPicker colors(1);
    ThicknessGroupAssembler a(store, colors);
    auto res = a.assemble(1, { part("missing.dxf", 1, 1, "/missing.dxf"),
                               part("t.dxf", 1, 1, "/t.dxf"),
                               part("ok.dxf", 1, 1, "/ok.dxf") });
    REQUIRE(res.skippedParts == 2);
    REQUIRE(res.blockNames.size() == 1);
    REQUIRE(res.drawing.blocks().size() == 1);
    REQUIRE(res.drawing.modelSpace().size() == 3);
}

TEST_CASE("same stem gets a distinct block name") {
    MemoryDrawingStore store;
    store.files["/A/part.dxf"] = rectDrawing(0, 0, 10, 10);
    store.files["/B/PART.dwg"] = rectDrawing(0, 0, 20, 20);
    FixedColorPicker colors(1);
    ThicknessGroupAssembler a(store, colors);
    auto res = a.assemble(1, { part("part.dxf", 1, 3, "/A/part.dxf"),
                               part("PART.dwg", 1, 3, "/B/PART.dwg") });
    REQUIRE(res.blockNames.size() == 2);
    REQUIRE(res.blockNames[0] == "P_part_Q3");
    REQUIRE(res.blockNames[1] == "P_PART_2_Q3");
    REQUIRE(decodeQuantity(res.blockNames[1]) == 3);
}

TEST_CASE("referenced blocks are copied with the plate") {
    Drawing src = rectDrawing(0, 0, 50, 50);
    src.addBlock("HOLE").entities.push_back(DrawingEntity::circle(0, 0, 3));
    src.addBlock("BOSS").entities.push_back(DrawingEntity::insert("HOLE", 0, 0));
    src.modelSpace().push_back(DrawingEntity::insert("BOSS", 60, 25));

    MemoryDrawingStore store;
    store.files["/s.dxf"] = src;
    FixedColorPicker colors(1);
    ThicknessGroupAssembler a(store, colors);
    auto res = a.assemble(1, { part("s.dxf", 1, 1, "/s.dxf") });
    const Drawing& d = res.drawing;
    REQUIRE(d.blocks().size() == 3);
    REQUIRE(d.hasBlock("S_P_s_Q1_BOSS"));
    REQUIRE(d.hasBlock("S_P_s_Q1_HOLE"));
    REQUIRE(d.findBlock("S_P_s_Q1_BOSS")->entities[0].blockName == "S_P_s_Q1_HOLE");

    auto box = d.bounds(*findInsert(d, "P_s_Q1"));
    REQUIRE(box);
    REQUIRE(box->width() == Approx(63));

    MemoryDrawingStore measure;
    auto plates = extractPlates(d, measure);
    REQUIRE(plates.plates.size() == 1);
    REQUIRE(plates.ignoredNames == 2);
}

TEST_CASE("assembled quantity survives extraction") {
    MemoryDrawingStore store;
    store.files["/q.dxf"] = rectDrawing(0, 0, 30, 40);
    VisibleColorPicker colors(1);
    ThicknessGroupAssembler a(store, colors);
    auto res = a.assemble(4, { part("q.dxf", 4, 12, "/q.dxf") });
    auto plates = extractPlates(res.drawing, store);
    REQUIRE(plates.plates.size() == 1);
    REQUIRE(plates.plates[0].quantity == 12);
    REQUIRE(plates.plates[0].width == Approx(30));
    REQUIRE(plates.plates[0].height == Approx(40));
}
