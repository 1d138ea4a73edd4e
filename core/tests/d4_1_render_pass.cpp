// D4.1 - AnnotationRenderer into a recorded DisplayList

#include "cm/host/BarSeriesSurface.hpp"
#include "cm/render/AnnotationRenderer.hpp"
#include "cm/render/DisplayList.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) < eps;
}

static const std::int64_t kT0 = 1700000000;

static cm::TimeValue barTime(int i) {
  return cm::TimeValue::fromEpoch(kT0 + 60 * i);
}

static cm::DomainPoint at(int bar, double price) {
  return cm::makePoint(barTime(bar), price);
}

// Bar i centred at x = 10*i + 5; price p at y = (60000 - p) / 20.
static void setupHost(cm::BarSeriesSurface& host) {
  std::vector<cm::Bar> bars;
  for (int i = 0; i < 100; ++i) {
    cm::Bar b;
    b.time = barTime(i);
    b.low = 50000; b.high = 60000;
    bars.push_back(b);
  }
  host.setBars(bars);
  host.setPlotSize(1000, 500);
  host.setVisibleLogicalRange(-0.5, 99.5);
  host.setPriceRange(50000, 60000);
}

static cm::Annotation withId(cm::Annotation a, const char* id) {
  a.id = id;
  return a;
}

static std::vector<const cm::PaintOp*> opsOf(const cm::DisplayList& dl, cm::PaintOpKind kind) {
  std::vector<const cm::PaintOp*> out;
  for (const auto& op : dl.ops()) {
    if (op.kind == kind) out.push_back(&op);
  }
  return out;
}

int main() {
  cm::BarSeriesSurface host;
  setupHost(host);
  cm::CoordinateMapper mapper(host);
  cm::AnnotationRenderer renderer;

  // ---- Test 1: Horizontal line span and price tag ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list{withId(cm::makeHorizontalLine(55800), "h")};
    cm::RenderStats stats = renderer.render(dl, mapper, list, "", nullptr);
    requireTrue(stats.drawn == 1, "drawn");
    requireTrue(dl.ops()[0].kind == cm::PaintOpKind::Clear, "frame starts with clear");

    auto lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 1, "one line");
    requireTrue(near(lines[0]->p0.x, 0) && near(lines[0]->p1.x, 940), "extended: 0 to width-60");
    requireTrue(near(lines[0]->p0.y, 210) && near(lines[0]->p1.y, 210), "at y 210");
    requireTrue(lines[0]->width == 2.0f && lines[0]->dash == cm::LineStyle::Solid, "default stroke");
    requireTrue(cm::toHexColor(lines[0]->color) == "#6b7280", "gray");

    const cm::PaintOp* tag = dl.findText("55,800");
    requireTrue(tag != nullptr, "price tag");
    requireTrue(tag->fontSize == 10.0f, "tag font");
    requireTrue(near(tag->p0.x, 900) && near(tag->p0.y, 206), "tag right-aligned above the line");

    list[0].extendLeft = false;
    list[0].extendRight = false;
    list[0].label = "Support";
    renderer.render(dl, mapper, list, "", nullptr);
    lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(near(lines[0]->p0.x, 50) && near(lines[0]->p1.x, 880), "short line: 50 to width-120");
    const cm::PaintOp* label = dl.findText("Support");
    requireTrue(label != nullptr && near(label->p0.x, 54) && near(label->p0.y, 204), "label position");
    requireTrue(opsOf(dl, cm::PaintOpKind::FillRect).size() == 1, "label backing box");
    std::printf("  Test 1 (horizontal line): PASS\n");
  }

  // ---- Test 2: Hidden and off-scale annotations ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list;
    list.push_back(withId(cm::makeHorizontalLine(55000), "visible"));
    cm::Annotation hidden = withId(cm::makeHorizontalLine(54000), "hidden");
    hidden.visible = false;
    list.push_back(hidden);
    list.push_back(withId(cm::makeHorizontalLine(75000), "above"));
    list.push_back(withId(cm::makeVerticalLine(cm::TimeValue::fromEpoch(kT0 - 86400)), "before"));

    cm::RenderStats stats = renderer.render(dl, mapper, list, "", nullptr);
    requireTrue(stats.drawn == 1, "one drawn");
    requireTrue(stats.hidden == 1, "one hidden");
    requireTrue(stats.skipped == 2, "two off scale");
    requireTrue(opsOf(dl, cm::PaintOpKind::StrokeLine).size() == 1, "only the visible line");
    std::printf("  Test 2 (hidden/skipped): PASS\n");
  }

  // ---- Test 3: Vertical line and trendline extension ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list;
    list.push_back(withId(cm::makeVerticalLine(barTime(20)), "v"));
    cm::Annotation t = withId(cm::makeTrendline(at(40, 54000), at(60, 52000)), "t"); // (405,300)-(605,400)
    t.extendRight = true;
    list.push_back(t);

    renderer.render(dl, mapper, list, "", nullptr);
    auto lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 2, "two lines");
    requireTrue(near(lines[0]->p0.x, 205) && near(lines[0]->p0.y, 0), "vertical from top");
    requireTrue(near(lines[0]->p1.y, 478), "vertical stops above the time scale");
    requireTrue(lines[0]->dash == cm::LineStyle::Dashed, "vertical default dashed");

    requireTrue(near(lines[1]->p0.x, 405) && near(lines[1]->p0.y, 300), "start kept");
    requireTrue(near(lines[1]->p1.x, 940) && near(lines[1]->p1.y, 567.5), "extended along slope");
    std::printf("  Test 3 (vertical/trendline): PASS\n");
  }

  // ---- Test 4: Rectangle fill and border ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list{withId(cm::makeRectangle(at(30, 56000), at(10, 58000)), "r")};
    list[0].label = "Range";
    renderer.render(dl, mapper, list, "", nullptr);

    auto fills = opsOf(dl, cm::PaintOpKind::FillRect);
    requireTrue(fills.size() == 2, "fill plus label box");
    requireTrue(near(fills[0]->p0.x, 105) && near(fills[0]->p0.y, 100), "normalized min corner");
    requireTrue(near(fills[0]->p1.x, 305) && near(fills[0]->p1.y, 200), "normalized max corner");
    requireTrue(near(fills[0]->color.a, 0.2), "fill opacity");

    auto borders = opsOf(dl, cm::PaintOpKind::StrokeRect);
    requireTrue(borders.size() == 1 && near(borders[0]->color.a, 1.0), "opaque border");
    requireTrue(cm::toHexColor(borders[0]->color) == "#fbbf24", "amber");

    const cm::PaintOp* label = dl.findText("Range");
    requireTrue(label && near(label->p0.x, 109) && near(label->p0.y, 114), "label inside top-left");
    std::printf("  Test 4 (rectangle): PASS\n");
  }

  // ---- Test 5: Fibonacci levels ----
  {
    cm::DisplayList dl(1000, 500);
    cm::Annotation f = withId(cm::makeFibonacci(at(10, 58000), at(30, 54000)), "f");
    std::vector<cm::Annotation> list{f};
    renderer.render(dl, mapper, list, "", nullptr);

    auto lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 8, "7 levels + guide");
    requireTrue(opsOf(dl, cm::PaintOpKind::FillText).size() == 7, "7 labels");

    const cm::PaintOp* golden = dl.findText("61.8%");
    requireTrue(golden != nullptr, "golden ratio label");
    requireTrue(golden->text == "61.8% (56,472)", "label with price");
    requireTrue(near(golden->p0.x, 109), "label at left + 4");
    requireTrue(cm::toHexColor(golden->color) == "#06b6d4", "level colour");

    const cm::PaintOp* zero = dl.findText("0.0%");
    requireTrue(zero && zero->text == "0.0% (54,000)", "level 0 at the end price");

    // 0.5 (y 200) is drawn wider than 1.0 (y 100)
    for (const auto* op : lines) {
      if (op->dash != cm::LineStyle::Solid) continue;
      if (near(op->p0.y, 200)) requireTrue(op->width == 2.0f, "0.5 level is emphasized");
      if (near(op->p0.y, 100)) requireTrue(op->width == 1.0f, "level 1 is thin");
    }
    requireTrue(lines.back()->dash == cm::LineStyle::Dotted, "dotted guide");
    requireTrue(near(lines[0]->p0.x, 105) && near(lines[0]->p1.x, 940), "levels span to the price scale");

    // Extensions: only 1.272 fits inside the visible price range
    list[0].showExtensions = true;
    list[0].showPrices = false;
    renderer.render(dl, mapper, list, "", nullptr);
    lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 9, "8 levels + guide");
    const cm::PaintOp* ext = dl.findText("127.2%");
    requireTrue(ext && ext->text == "127.2%", "extension label without price");
    bool dashedExt = false;
    for (const auto* op : lines) {
      if (op->dash == cm::LineStyle::Dashed) dashedExt = true;
    }
    requireTrue(dashedExt, "extension dashed");
    std::printf("  Test 5 (fibonacci): PASS\n");
  }

  // ---- Test 6: Arrow, text and selection decorations ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list;
    list.push_back(withId(cm::makeArrow(at(70, 55000), cm::ArrowDirection::Down), "a")); // (705,250)
    list.push_back(withId(cm::makeText(at(80, 51000), "Hi"), "x"));                     // (805,450)

    renderer.render(dl, mapper, list, "", nullptr);
    auto tris = opsOf(dl, cm::PaintOpKind::FillTriangle);
    requireTrue(tris.size() == 1, "arrow triangle");
    requireTrue(near(tris[0]->p0.x, 705) && near(tris[0]->p0.y, 259), "down arrow tip below the point");
    requireTrue(opsOf(dl, cm::PaintOpKind::StrokeRect).empty(), "no outline unselected");

    auto fills = opsOf(dl, cm::PaintOpKind::FillRect);
    requireTrue(fills.size() == 1, "text background");
    requireTrue(near(fills[0]->p0.x, 799) && near(fills[0]->p1.x, 799 + 16.8 + 12), "padded box");
    requireTrue(near(fills[0]->color.a, 0.9, 1e-5), "background opacity");
    requireTrue(dl.findText("Hi") != nullptr, "text drawn");

    renderer.render(dl, mapper, list, "a", nullptr);
    auto outline = opsOf(dl, cm::PaintOpKind::StrokeRect);
    requireTrue(outline.size() == 1, "selected arrow outline");
    requireTrue(near(outline[0]->p0.x, 705 - 11) && near(outline[0]->p1.x, 705 + 11), "outline size");
    std::printf("  Test 6 (arrow/text): PASS\n");
  }

  // ---- Test 7: Handles on the selected line ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list;
    list.push_back(withId(cm::makeTrendline(at(40, 54000), at(60, 52000)), "t"));
    list.push_back(withId(cm::makeRectangle(at(10, 58000), at(30, 56000)), "r"));

    renderer.render(dl, mapper, list, "t", nullptr);
    // rectangle fill + 2 handles
    requireTrue(opsOf(dl, cm::PaintOpKind::FillRect).size() == 3, "two handle fills");
    auto strokes = opsOf(dl, cm::PaintOpKind::StrokeRect);
    requireTrue(strokes.size() == 3, "rectangle border + two handle borders");
    requireTrue(near(strokes[0]->p0.x, 401) && near(strokes[0]->p1.x, 409), "8 px handle at start");
    requireTrue(cm::toHexColor(strokes[0]->color) == "#3b82f6", "handle stroke");

    renderer.render(dl, mapper, list, "r", nullptr);
    requireTrue(opsOf(dl, cm::PaintOpKind::FillRect).size() == 5, "fill + four corner handles");
    std::printf("  Test 7 (handles): PASS\n");
  }

  // ---- Test 8: Degenerate geometry still draws ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list;
    list.push_back(withId(cm::makeTrendline(at(40, 54000), at(40, 54000)), "dot"));
    list.push_back(withId(cm::makeRectangle(at(10, 58000), at(10, 58000)), "flat"));
    cm::Annotation vt = withId(cm::makeTrendline(at(40, 54000), at(40, 52000)), "vert");
    vt.extendLeft = vt.extendRight = true;
    list.push_back(vt);

    cm::RenderStats stats = renderer.render(dl, mapper, list, "", nullptr);
    requireTrue(stats.drawn == 3 && stats.skipped == 0, "all drawn");
    auto lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(near(lines[1]->p0.y, 300) && near(lines[1]->p1.y, 400), "vertical trendline not extended");
    std::printf("  Test 8 (degenerate): PASS\n");
  }

  // ---- Test 9: In-progress previews ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> none;

    cm::InteractionPreview pv;
    pv.phase = cm::InteractionPhase::AwaitingSecondPoint;
    pv.tool = cm::ActiveTool::Trendline;
    pv.anchor = at(10, 58000);
    pv.hasPointer = true;
    pv.pointer = cm::PixelPoint{300, 300};

    renderer.render(dl, mapper, none, "", &pv);
    auto lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 1, "preview line");
    requireTrue(near(lines[0]->p0.x, 105) && near(lines[0]->p0.y, 100), "from anchor");
    requireTrue(near(lines[0]->p1.x, 300) && near(lines[0]->p1.y, 300), "to pointer");
    requireTrue(lines[0]->dash == cm::LineStyle::Dashed, "dashed");
    requireTrue(near(lines[0]->color.a, 0.7, 1e-5), "70% opacity");
    requireTrue(dl.alpha() == 1.0f, "alpha restored");

    pv.tool = cm::ActiveTool::Rectangle;
    renderer.render(dl, mapper, none, "", &pv);
    requireTrue(opsOf(dl, cm::PaintOpKind::StrokeRect).size() == 1, "rectangle preview");

    // Anchor scrolled off-scale: the click pixel is used
    pv.tool = cm::ActiveTool::Fibonacci;
    pv.anchor = at(10, 90000);
    pv.anchor.hasPixel = true;
    pv.anchor.x = 40;
    pv.anchor.y = 60;
    renderer.render(dl, mapper, none, "", &pv);
    lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 1 && near(lines[0]->p0.x, 40) && near(lines[0]->p0.y, 60), "cached anchor");

    pv.phase = cm::InteractionPhase::TextEntryPending;
    pv.tool = cm::ActiveTool::Text;
    pv.anchor = at(30, 55000); // (305,250)
    renderer.render(dl, mapper, none, "", &pv);
    lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 1 && near(lines[0]->p0.x, 305) && near(lines[0]->p1.y, 250), "caret");

    pv.phase = cm::InteractionPhase::Idle;
    renderer.render(dl, mapper, none, "", &pv);
    requireTrue(dl.ops().size() == 1, "idle: nothing but the clear");
    std::printf("  Test 9 (preview): PASS\n");
  }

  // ---- Test 10: Dragged geometry replaces the stored one ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list{withId(cm::makeHorizontalLine(55800), "h")};
    cm::Annotation moved = list[0];
    moved.price = 55000;

    cm::InteractionPreview pv;
    pv.phase = cm::InteractionPhase::Dragging;
    pv.dragged = &moved;
    renderer.render(dl, mapper, list, "h", &pv);
    auto lines = opsOf(dl, cm::PaintOpKind::StrokeLine);
    requireTrue(lines.size() == 1 && near(lines[0]->p0.y, 250), "drawn at the dragged price");
    std::printf("  Test 10 (drag preview): PASS\n");
  }

  // ---- Test 11: Price formatting ----
  {
    requireTrue(cm::formatPrice(55800, 2) == "55,800", "thousands, no trailing zeros");
    requireTrue(cm::formatPrice(101.25, 2) == "101.25", "decimals kept");
    requireTrue(cm::formatPrice(1234567.5, 2) == "1,234,567.5", "millions");
    requireTrue(cm::formatPrice(-1500, 0) == "-1,500", "negative");
    requireTrue(cm::formatPrice(-0.001, 2) == "0", "negative zero");
    requireTrue(cm::formatFibLabel(0.382, 100.6, true) == "38.2% (101)", "fib label rounding");
    requireTrue(cm::formatFibLabel(1.0, 100, false) == "100.0%", "fib label without price");
    std::printf("  Test 11 (formatting): PASS\n");
  }

  // ---- Test 12: JSON export ----
  {
    cm::DisplayList dl(1000, 500);
    std::vector<cm::Annotation> list{withId(cm::makeHorizontalLine(55800), "h")};
    renderer.render(dl, mapper, list, "", nullptr);

    rapidjson::Document doc;
    doc.Parse(dl.toJSON().c_str());
    requireTrue(!doc.HasParseError() && doc.IsObject(), "valid JSON");
    requireTrue(doc["width"].GetDouble() == 1000, "width");
    const auto& ops = doc["ops"];
    requireTrue(ops.IsArray() && ops.Size() == dl.ops().size(), "all ops exported");
    requireTrue(std::string(ops[0]["op"].GetString()) == "clear", "clear first");
    requireTrue(std::string(ops[1]["op"].GetString()) == "strokeLine", "line second");
    requireTrue(std::string(ops[1]["color"].GetString()) == "#6b7280", "hex colour");
    requireTrue(std::string(ops[1]["dash"].GetString()) == "solid", "dash name");
    requireTrue(std::string(ops[2]["text"].GetString()) == "55,800", "text op");
    std::printf("  Test 12 (JSON): PASS\n");
  }

  std::printf("D4.1 render_pass: ALL PASS\n");
  return 0;
}
