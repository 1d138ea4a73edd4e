// D2.1 - AnnotationStore: create / update / remove / subscribe

#include "cm/storage/AnnotationStore.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static cm::AnnotationContext mainContext() {
  return cm::AnnotationContext{"AAPL", "1D", "main"};
}

static cm::DomainPoint dayPoint(const char* day, double price) {
  return cm::makePoint(cm::TimeValue::fromDate(day), price);
}

int main() {
  // ---- Test 1: Create stamps id and times ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    const cm::Annotation* a = store.createHorizontalLine(185.5);
    requireTrue(a != nullptr, "created");
    requireTrue(!a->id.empty(), "id assigned");
    requireTrue(a->type == cm::AnnotationType::HorizontalLine, "type");
    requireTrue(a->price == 185.5, "price");
    requireTrue(a->createdAt == 1000 && a->updatedAt == 1000, "stamped from clock");
    requireTrue(a->extendLeft && a->extendRight, "horizontal line default extends");
    requireTrue(a->thickness == 2.0f, "default thickness");
    requireTrue(store.count() == 1, "1 annotation");
    requireTrue(store.get(a->id) == a, "get by id");
    std::printf("  Test 1 (create): PASS\n");
  }

  // ---- Test 2: Payload id and stamps are ignored ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(5000);
    cm::AnnotationStore store(kv, clock, mainContext());

    cm::Annotation payload = cm::makeHorizontalLine(10);
    payload.id = "chosen-by-caller";
    payload.createdAt = 1;
    payload.updatedAt = 2;
    const cm::Annotation* a = store.create(payload);
    requireTrue(a != nullptr, "created");
    requireTrue(a->id != "chosen-by-caller", "id regenerated");
    requireTrue(a->createdAt == 5000, "createdAt from clock");
    std::printf("  Test 2 (payload overrides): PASS\n");
  }

  // ---- Test 3: Creation order and unique ids under a frozen clock ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(2000);
    cm::AnnotationStore store(kv, clock, mainContext());

    std::vector<std::string> ids;
    for (int i = 0; i < 20; ++i) {
      const cm::Annotation* a = store.createHorizontalLine(100.0 + i);
      requireTrue(a != nullptr, "created");
      ids.push_back(a->id);
    }
    const auto& all = store.getAll();
    requireTrue(all.size() == 20, "20 annotations");
    for (std::size_t i = 0; i < all.size(); ++i) {
      requireTrue(all[i].id == ids[i], "creation order");
      if (i > 0) requireTrue(all[i].createdAt > all[i - 1].createdAt, "strictly increasing stamps");
      for (std::size_t j = 0; j < i; ++j) {
        requireTrue(all[i].id != all[j].id, "unique ids");
      }
    }
    std::printf("  Test 3 (ordering): PASS\n");
  }

  // ---- Test 4: Update merges and keeps identity ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    const cm::Annotation* a = store.createTrendline(dayPoint("2024-01-02", 100),
                                                    dayPoint("2024-01-10", 120));
    const std::string id = a->id;

    clock.set(4000);
    cm::AnnotationPatch patch;
    patch.label = "breakout";
    patch.extendRight = true;
    const cm::Annotation* u = store.update(id, patch);
    requireTrue(u != nullptr, "updated");
    requireTrue(u->id == id, "id kept");
    requireTrue(u->type == cm::AnnotationType::Trendline, "type kept");
    requireTrue(u->createdAt == 1000, "createdAt kept");
    requireTrue(u->updatedAt == 4000, "updatedAt stamped");
    requireTrue(u->label == "breakout" && u->extendRight, "fields merged");
    requireTrue(u->startPoint.price == 100 && u->endPoint.price == 120, "untouched fields kept");

    // An empty patch still counts as an edit
    const cm::Annotation* again = store.update(id, cm::AnnotationPatch{});
    requireTrue(again != nullptr, "empty patch applies");
    requireTrue(again->updatedAt > 4000, "updatedAt advances");
    requireTrue(again->label == "breakout", "nothing else changed");

    requireTrue(store.update("no-such-id", patch) == nullptr, "unknown id");
    std::printf("  Test 4 (update): PASS\n");
  }

  // ---- Test 5: Invalid payloads are rejected ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    cm::DomainPoint epochPt = cm::makePoint(cm::TimeValue::fromEpoch(1700000000), 100);
    requireTrue(store.createTrendline(epochPt, dayPoint("2024-01-10", 120)) == nullptr,
                "mixed time kinds rejected");
    requireTrue(store.createVerticalLine(cm::TimeValue{}) == nullptr, "missing time rejected");
    requireTrue(store.createText(dayPoint("2024-01-02", 100), "") == nullptr, "empty text rejected");
    requireTrue(store.count() == 0, "nothing stored");
    requireTrue(kv.writeCount() == 0, "nothing persisted");

    // Update that would break the annotation is refused too
    const cm::Annotation* t = store.createText(dayPoint("2024-01-02", 100), "note");
    cm::AnnotationPatch patch;
    patch.text = "";
    requireTrue(store.update(t->id, patch) == nullptr, "empty text update rejected");
    requireTrue(store.getAll()[0].text == "note", "text unchanged");
    std::printf("  Test 5 (validation): PASS\n");
  }

  // ---- Test 6: Ranged fields are clamped ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    cm::Annotation rect = cm::makeRectangle(dayPoint("2024-01-02", 100), dayPoint("2024-01-05", 90));
    rect.fillOpacity = 5.0f;
    rect.thickness = 0.0f;
    const cm::Annotation* a = store.create(rect);
    requireTrue(a->fillOpacity == 1.0f, "fill opacity clamped");
    requireTrue(a->thickness == 0.5f, "thickness floor");
    std::printf("  Test 6 (clamping): PASS\n");
  }

  // ---- Test 7: Remove and clear ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    std::string a = store.createHorizontalLine(1)->id;
    std::string b = store.createHorizontalLine(2)->id;
    std::string c = store.createHorizontalLine(3)->id;

    requireTrue(store.remove(b), "removed");
    requireTrue(!store.remove(b), "second remove is a no-op");
    requireTrue(store.count() == 2, "2 left");
    requireTrue(store.getAll()[0].id == a && store.getAll()[1].id == c, "order kept");

    store.clearAll();
    requireTrue(store.count() == 0, "cleared");
    requireTrue(!kv.contains(store.storageKey()), "record removed");
    std::printf("  Test 7 (remove/clear): PASS\n");
  }

  // ---- Test 8: Subscribers see every mutation ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    int calls = 0;
    std::size_t lastSize = 0;
    auto unsub = store.subscribe([&](const std::vector<cm::Annotation>& all) {
      calls++;
      lastSize = all.size();
    });

    std::string id = store.createHorizontalLine(10)->id;
    requireTrue(calls == 1 && lastSize == 1, "create notifies");

    cm::AnnotationPatch hide;
    hide.visible = false;
    store.update(id, hide);
    requireTrue(calls == 2, "update notifies");
    requireTrue(!store.get(id)->visible, "hidden");

    store.remove(id);
    requireTrue(calls == 3 && lastSize == 0, "remove notifies");

    // Rejected writes do not notify
    store.createVerticalLine(cm::TimeValue{});
    requireTrue(calls == 3, "rejected create is silent");

    unsub();
    store.createHorizontalLine(20);
    requireTrue(calls == 3, "unsubscribed");
    std::printf("  Test 8 (subscribe): PASS\n");
  }

  // ---- Test 9: Unsubscribe after the store is gone ----
  {
    std::function<void()> unsub;
    {
      cm::MemoryKeyValueStore kv;
      cm::ManualClock clock(1000);
      cm::AnnotationStore store(kv, clock, mainContext());
      unsub = store.subscribe([](const std::vector<cm::Annotation>&) {});
    }
    unsub();
    std::printf("  Test 9 (late unsubscribe): PASS\n");
  }

  // ---- Test 10: Listener unsubscribing itself during notify ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    int first = 0, second = 0;
    std::function<void()> unsubFirst;
    unsubFirst = store.subscribe([&](const std::vector<cm::Annotation>&) {
      first++;
      unsubFirst();
    });
    auto unsubSecond = store.subscribe([&](const std::vector<cm::Annotation>&) { second++; });

    store.createHorizontalLine(1);
    store.createHorizontalLine(2);
    requireTrue(first == 1, "first listener ran once");
    requireTrue(second == 2, "second listener unaffected");
    unsubSecond();
    std::printf("  Test 10 (reentrant unsubscribe): PASS\n");
  }

  // ---- Test 11: Variant defaults ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    const cm::Annotation* fib = store.createFibonacci(dayPoint("2024-01-02", 200),
                                                      dayPoint("2024-01-09", 100));
    requireTrue(fib->levels.size() == 7, "7 retracement levels");
    requireTrue(fib->extensionLevels.size() == 4, "4 extension levels");
    requireTrue(!fib->showExtensions && fib->showPrices, "fib flags");
    requireTrue(cm::toHexColor(cm::resolveLevelColor(*fib, 0.618)) == "#06b6d4", "level colour");
    requireTrue(cm::resolveLevelColor(*fib, 0.9) == fib->color, "fallback to base colour");

    const cm::Annotation* down = store.createArrow(dayPoint("2024-01-03", 150),
                                                   cm::ArrowDirection::Down);
    requireTrue(down->color == cm::bearColor(), "down arrow is red");
    requireTrue(down->size == cm::ArrowSize::Medium, "medium arrow");
    requireTrue(cm::arrowSizePx(cm::ArrowSize::Large) == 26.0f, "large arrow px");

    const cm::Annotation* v = store.createVerticalLine(cm::TimeValue::fromDate("2024-01-04"));
    requireTrue(v->lineStyle == cm::LineStyle::Dashed && v->thickness == 1.0f, "vertical defaults");
    std::printf("  Test 11 (defaults): PASS\n");
  }

  // ---- Test 12: create returns its own annotation when a listener also creates ----
  {
    cm::MemoryKeyValueStore kv;
    cm::ManualClock clock(1000);
    cm::AnnotationStore store(kv, clock, mainContext());

    bool mirrored = false;
    auto unsub = store.subscribe([&](const std::vector<cm::Annotation>&) {
      if (mirrored) return;
      mirrored = true;
      store.createHorizontalLine(999);
    });

    const cm::Annotation* a = store.createHorizontalLine(10);
    requireTrue(store.count() == 2, "listener added a second line");
    requireTrue(a != nullptr && a->price == 10, "caller gets its own line");
    requireTrue(store.getAll()[0].id == a->id, "created first");
    unsub();
    std::printf("  Test 12 (create during notify): PASS\n");
  }

  std::printf("D2.1 annotation_store: ALL PASS\n");
  return 0;
}
