// Annotation demo
// Scripted session over a synthetic bar series: a command import, tool
// clicks on the price surface and an auxiliary oscillator surface, a drag
// edit and a context switch. Prints each frame's display list as JSON.
//
// Usage: annotate_demo [storage-dir]
//   With a directory, annotations persist there between runs.

#include "cm/commands/AnnotationCommands.hpp"
#include "cm/host/BarSeriesSurface.hpp"
#include "cm/render/DisplayList.hpp"
#include "cm/session/OverlaySettings.hpp"
#include "cm/surface/SurfaceCoordinator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

static void requireOk(const cm::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

// ---- Synthetic data ----

static std::vector<cm::Bar> generateBars(int count, std::int64_t t0) {
  std::vector<cm::Bar> bars;
  double price = 42000.0;
  std::uint32_t seed = 42;
  auto rng = [&]() -> double {
    seed = seed * 1103515245u + 12345u;
    return static_cast<double>((seed >> 16) & 0x7FFF) / 32767.0 - 0.5;
  };

  for (int i = 0; i < count; ++i) {
    cm::Bar b;
    b.time = cm::TimeValue::fromEpoch(t0 + 60 * i);
    b.open = price;
    price += rng() * 120.0;
    b.close = price;
    b.high = std::max(b.open, b.close) + std::fabs(rng()) * 60.0;
    b.low = std::min(b.open, b.close) - std::fabs(rng()) * 60.0;
    b.volume = 10.0 + std::fabs(rng()) * 50.0;
    bars.push_back(b);
  }
  return bars;
}

// ---- Input helpers ----

static cm::PixelPoint toPixel(const cm::DrawingSurface& s, const cm::Bar& bar, double price) {
  cm::PixelPoint p;
  if (!s.controller().mapper().domainToPixel(cm::makePoint(bar.time, price), p)) {
    std::fprintf(stderr, "FAIL: point off-surface\n");
    std::exit(1);
  }
  return p;
}

static void click(cm::SurfaceCoordinator& c, const std::string& id, const cm::PixelPoint& p,
                  std::int64_t& t) {
  c.pointerDown(id, cm::pointerAt(p.x, p.y, t));
  c.pointerUp(id, cm::pointerAt(p.x, p.y, t + 60));
  t += 200;
}

static void dumpFrame(std::FILE* out, const char* label, cm::DrawingSurface& s,
                      cm::DisplayList& dl) {
  cm::RenderStats stats = s.paint(dl);
  std::fprintf(stderr, "[demo] %-14s %-5s drawn=%zu hidden=%zu skipped=%zu ops=%zu\n",
               label, s.id().c_str(), stats.drawn, stats.hidden, stats.skipped,
               dl.ops().size());
  std::fprintf(out, "{\"frame\":\"%s\",\"surface\":\"%s\",\"list\":%s}\n",
               label, s.id().c_str(), dl.toJSON().c_str());
}

int main(int argc, char** argv) {
  std::unique_ptr<cm::KeyValueStore> kv;
  if (argc > 1) {
    kv = std::make_unique<cm::FileKeyValueStore>(argv[1]);
  } else {
    kv = std::make_unique<cm::MemoryKeyValueStore>();
  }
  cm::SystemClock clock;

  cm::OverlaySettings settings;
  settings.symbol = "BTCUSD";
  settings.timeframe = "1m";
  cm::OverlayTheme theme;
  if (!cm::overlayThemeByName(settings.themeName, theme)) theme = cm::darkOverlayTheme();

  const std::int64_t t0 = 1700000000;
  std::vector<cm::Bar> bars = generateBars(200, t0);

  cm::BarSeriesSurface priceHost;
  priceHost.setPlotSize(1200, 600);
  priceHost.setBars(bars);
  priceHost.fitContent();

  // Oscillator pane: same time axis, fixed 0..100 scale
  cm::BarSeriesSurface rsiHost;
  rsiHost.setPlotSize(1200, 200);
  rsiHost.setBars(bars);
  rsiHost.setVisibleLogicalRange(priceHost.visibleFrom(), priceHost.visibleTo());
  rsiHost.setPriceRange(0, 100);

  cm::AnnotationRegistry registry(*kv, clock, settings.registry, settings.store);
  cm::SurfaceCoordinator coord(registry, settings.symbol, settings.timeframe,
                               settings.coordinator, settings.interaction);
  cm::DrawingSurface* pricePane = coord.addPrimary("main", priceHost);
  cm::DrawingSurface* rsiPane = coord.addAuxiliary("rsi", rsiHost);
  if (!pricePane || !rsiPane) {
    std::fprintf(stderr, "FAIL: surface registration\n");
    return 1;
  }
  pricePane->setTheme(theme);
  rsiPane->setTheme(theme);

  pricePane->controller().onTextEntryRequested([pricePane](const cm::DomainPoint&) {
    pricePane->controller().submitText("Breakout");
  });
  coord.onToolChanged([](cm::ActiveTool t) {
    std::fprintf(stderr, "[demo] tool -> %s\n", cm::toolName(t));
  });

  // 1. Levels arrive from outside through the command surface
  cm::AnnotationCommands cmds(registry);
  requireOk(cmds.applyJsonText(R"({"cmd":"importAnnotations",
      "context":{"symbol":"BTCUSD","timeframe":"1m"},
      "annotations":[
        {"type":"horizontal_line","price":42000,"label":"Open"},
        {"type":"vertical_line","time":1700006000,"label":"Session"}
      ]})"), "import");

  // 2. Interactive drawing on the price surface
  std::int64_t t = 0;
  const cm::Bar& a = bars[40];
  const cm::Bar& b = bars[120];

  coord.setActiveTool(cm::ActiveTool::Trendline);
  click(coord, "main", toPixel(*pricePane, a, a.low), t);
  click(coord, "main", toPixel(*pricePane, b, b.high), t);

  coord.setActiveTool(cm::ActiveTool::Fibonacci);
  click(coord, "main", toPixel(*pricePane, b, b.high), t);
  click(coord, "main", toPixel(*pricePane, a, a.low), t);

  coord.setActiveTool(cm::ActiveTool::Text);
  click(coord, "main", toPixel(*pricePane, bars[150], bars[150].high + 40.0), t);

  coord.setActiveTool(cm::ActiveTool::Arrow);
  click(coord, "main", toPixel(*pricePane, bars[160], bars[160].low - 40.0), t);

  // 3. Overbought/oversold bands on the oscillator; first press activates it
  coord.setActiveTool(cm::ActiveTool::HorizontalLine);
  click(coord, "rsi", toPixel(*rsiPane, bars[100], 70.0), t);
  click(coord, "rsi", toPixel(*rsiPane, bars[100], 30.0), t);

  cm::DisplayList dl(1200, 600);
  cm::DisplayList rsiDl(1200, 200);
  dumpFrame(stdout, "drawn", *pricePane, dl);
  dumpFrame(stdout, "drawn", *rsiPane, rsiDl);

  // 4. Drag the "Open" level up by 30 px
  coord.setActiveTool(cm::ActiveTool::Select);
  coord.activate("main");
  const cm::Annotation& open = pricePane->store().getAll()[0];
  cm::PixelPoint grab = toPixel(*pricePane, bars[10], open.price);
  click(coord, "main", grab, t);
  coord.pointerDown("main", cm::pointerAt(grab.x, grab.y, t));
  coord.pointerMove("main", cm::pointerAt(grab.x, grab.y - 30.0, t + 20));
  coord.pointerUp("main", cm::pointerAt(grab.x, grab.y - 30.0, t + 40));
  t += 200;
  std::fprintf(stderr, "[demo] open level now %.2f\n", pricePane->store().getAll()[0].price);

  priceHost.zoom(1.5, 600);
  dumpFrame(stdout, "zoomed", *pricePane, dl);

  // 5. Another instrument starts empty; coming back restores everything
  coord.switchContext("ETHUSD", "1m");
  dumpFrame(stdout, "eth", *pricePane, dl);
  coord.switchContext("BTCUSD", "1m");

  auto list = cmds.applyJsonText(R"({"cmd":"listAnnotations",
      "context":{"symbol":"BTCUSD","timeframe":"1m","surface":"main"}})");
  requireOk(list, "list");
  std::fprintf(stderr, "[demo] BTCUSD/1m/main holds %zu annotations\n", list.count);

  settings.symbol = coord.symbol();
  settings.timeframe = coord.timeframe();
  std::fprintf(stdout, "{\"settings\":%s}\n", cm::serializeOverlaySettings(settings).c_str());
  return 0;
}
