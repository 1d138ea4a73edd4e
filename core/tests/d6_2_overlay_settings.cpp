// D6.2 - OverlaySettings: JSON save/restore of overlay configuration

#include "cm/session/OverlaySettings.hpp"
#include "cm/render/OverlayTheme.hpp"

#include <rapidjson/document.h>

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: Default layout ----
  {
    cm::OverlaySettings s;
    std::string json = cm::serializeOverlaySettings(s);

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    requireTrue(!doc.HasParseError() && doc.IsObject(), "valid JSON");
    requireTrue(std::string(doc["version"].GetString()) == "1.0", "version");
    requireTrue(std::string(doc["theme"].GetString()) == "Dark", "theme");
    requireTrue(doc["interaction"]["hitTolerancePx"].GetDouble() == 8.0, "hit tolerance");
    requireTrue(doc["interaction"]["dragThresholdPx"].GetDouble() == 5.0, "drag threshold");
    requireTrue(doc["interaction"]["clickTimeoutMs"].GetInt64() == 500, "click timeout");
    requireTrue(doc["registry"]["maxCachedContexts"].GetUint64() == 16, "cache size");
    requireTrue(std::string(doc["registry"]["keyPrefix"].GetString()) == "annotations", "prefix");
    requireTrue(doc["coordinator"]["autoDeselectSingleClickTools"].IsFalse(), "auto-deselect off");
    requireTrue(std::string(doc["symbol"].GetString()).empty(), "no symbol yet");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: Save and restore ----
  {
    cm::OverlaySettings s;
    s.themeName = "Light";
    s.interaction.hitTolerancePx = 6.5;
    s.interaction.dragThresholdPx = 3.0;
    s.interaction.clickTimeoutMs = 750;
    s.interaction.handleSizePx = 10.0;
    s.registry.maxCachedContexts = 4;
    s.store.keyPrefix = "charts";
    s.coordinator.autoDeselectSingleClickTools = true;
    s.symbol = "ETHUSD";
    s.timeframe = "15m";

    cm::OverlaySettings back;
    requireTrue(cm::deserializeOverlaySettings(cm::serializeOverlaySettings(s), back), "restored");
    requireTrue(back.themeName == "Light", "theme");
    requireTrue(back.interaction.hitTolerancePx == 6.5, "hit tolerance");
    requireTrue(back.interaction.dragThresholdPx == 3.0, "drag threshold");
    requireTrue(back.interaction.clickTimeoutMs == 750, "click timeout");
    requireTrue(back.interaction.handleSizePx == 10.0, "handle size");
    requireTrue(back.registry.maxCachedContexts == 4, "cache size");
    requireTrue(back.store.keyPrefix == "charts", "prefix");
    requireTrue(back.coordinator.autoDeselectSingleClickTools, "auto-deselect");
    requireTrue(back.symbol == "ETHUSD" && back.timeframe == "15m", "context");
    std::printf("  Test 2 (round trip): PASS\n");
  }

  // ---- Test 3: Malformed input ----
  {
    cm::OverlaySettings s;
    s.symbol = "KEEP";
    requireTrue(!cm::deserializeOverlaySettings("{oops", s), "parse error");
    requireTrue(!cm::deserializeOverlaySettings("[1,2,3]", s), "not an object");
    requireTrue(!cm::deserializeOverlaySettings("", s), "empty");
    requireTrue(s.symbol == "KEEP", "untouched on failure");
    std::printf("  Test 3 (malformed): PASS\n");
  }

  // ---- Test 4: Partial and mistyped keys ----
  {
    cm::OverlaySettings s;
    requireTrue(cm::deserializeOverlaySettings(
      R"({"theme":"Light","interaction":{"dragThresholdPx":3}})", s), "partial");
    requireTrue(s.themeName == "Light", "theme set");
    requireTrue(s.interaction.dragThresholdPx == 3.0, "integer read as double");
    requireTrue(s.interaction.hitTolerancePx == 8.0, "absent key keeps default");
    requireTrue(s.store.keyPrefix == "annotations", "absent section keeps default");

    requireTrue(cm::deserializeOverlaySettings(
      R"({"interaction":{"hitTolerancePx":"wide","clickTimeoutMs":1.5},
          "registry":{"keyPrefix":"","maxCachedContexts":-1},
          "coordinator":{"autoDeselectSingleClickTools":1},
          "symbol":42})", s), "mistyped keys are not an error");
    requireTrue(s.interaction.hitTolerancePx == 8.0, "string ignored");
    requireTrue(s.interaction.clickTimeoutMs == 500, "fraction ignored");
    requireTrue(s.store.keyPrefix == "annotations", "empty prefix ignored");
    requireTrue(s.registry.maxCachedContexts == 16, "negative ignored");
    requireTrue(!s.coordinator.autoDeselectSingleClickTools, "number is not a bool");
    requireTrue(s.symbol.empty(), "number is not a symbol");
    std::printf("  Test 4 (partial): PASS\n");
  }

  // ---- Test 5: Restored settings drive the runtime ----
  {
    cm::OverlaySettings s;
    requireTrue(cm::deserializeOverlaySettings(
      R"({"theme":"Light","registry":{"maxCachedContexts":1,"keyPrefix":"charts"},
          "symbol":"BTCUSD","timeframe":"1m"})", s), "loaded");

    cm::OverlayTheme theme;
    requireTrue(cm::overlayThemeByName(s.themeName, theme), "theme resolves");
    requireTrue(theme.name == "Light", "light preset");
    cm::OverlayTheme unknown = theme;
    requireTrue(!cm::overlayThemeByName("Solarized", unknown), "unknown theme");
    requireTrue(unknown.name == "Light", "unknown name leaves the theme alone");

    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1);
    cm::AnnotationRegistry registry(kv, clock, s.registry, s.store);
    auto store = registry.acquire(cm::AnnotationContext{s.symbol, s.timeframe, "main"});
    requireTrue(store->storageKey() == "charts_BTCUSD_1m_main", "prefix applied");
    store->createHorizontalLine(100);
    requireTrue(kv.contains("charts_BTCUSD_1m_main"), "persisted under the prefix");
    requireTrue(registry.config().maxCachedContexts == 1, "cache size applied");
    std::printf("  Test 5 (apply): PASS\n");
  }

  std::printf("D6.2 overlay_settings: ALL PASS\n");
  return 0;
}
