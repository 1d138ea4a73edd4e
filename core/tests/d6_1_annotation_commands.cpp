// D6.1 - AnnotationCommands: JSON command surface over the registry

#include "cm/commands/AnnotationCommands.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static const cm::AnnotationContext kMain{"AAPL", "1D", "main"};

int main() {
  cm::MemoryKeyValueStore kv;
  cm::ManualClock clock(1000);
  cm::AnnotationRegistry registry(kv, clock);
  cm::AnnotationCommands cmds(registry);

  // ---- Test 1: createAnnotation ----
  {
    auto r = cmds.applyJsonText(R"({"cmd":"createAnnotation",
      "context":{"symbol":"AAPL","timeframe":"1D"},
      "annotation":{"id":"mine","type":"horizontal_line","price":185.5,"label":"Resistance"}})");
    requireTrue(r.ok, "created");
    requireTrue(!r.createdId.empty() && r.createdId != "mine", "fresh id assigned");

    auto store = registry.find(kMain);
    requireTrue(store != nullptr, "surface defaults to main");
    const cm::Annotation* a = store->get(r.createdId);
    requireTrue(a && a->price == 185.5 && a->label == "Resistance", "fields");
    requireTrue(a->createdAt > 0 && a->updatedAt == a->createdAt, "stamped by the store");
    requireTrue(kv.contains("annotations_AAPL_1D_main"), "persisted");
    std::printf("  Test 1 (create): PASS\n");
  }

  // ---- Test 2: createAnnotation errors ----
  {
    auto r = cmds.applyJsonText(R"({"cmd":"createAnnotation",
      "annotation":{"type":"horizontal_line","price":1}})");
    requireTrue(!r.ok && r.err.code == "BAD_CONTEXT", "missing context");

    r = cmds.applyJsonText(R"({"cmd":"createAnnotation",
      "context":{"symbol":"","timeframe":"1D"},"annotation":{"type":"horizontal_line","price":1}})");
    requireTrue(!r.ok && r.err.code == "BAD_CONTEXT", "empty symbol");

    r = cmds.applyJsonText(R"({"cmd":"createAnnotation","context":{"symbol":"AAPL","timeframe":"1D"}})");
    requireTrue(!r.ok && r.err.code == "BAD_PAYLOAD", "missing annotation");

    r = cmds.applyJsonText(R"({"cmd":"createAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},
      "annotation":{"type":"ellipse"}})");
    requireTrue(!r.ok && r.err.code == "BAD_PAYLOAD", "unknown type");

    r = cmds.applyJsonText(R"({"cmd":"createAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},
      "annotation":{"type":"trendline","startPoint":{"time":1700000000,"price":10}}})");
    requireTrue(!r.ok && r.err.code == "BAD_PAYLOAD", "missing end point");
    requireTrue(r.err.message.find("endpoints") != std::string::npos, "reason in message");

    r = cmds.applyJsonText(R"({"cmd":"createAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},
      "annotation":{"type":"text","point":{"time":"2024-01-02","price":10},"text":""}})");
    requireTrue(!r.ok && r.err.code == "REJECTED", "empty text rejected by the store");

    requireTrue(registry.find(kMain)->count() == 1, "no partial creates");
    std::printf("  Test 2 (create errors): PASS\n");
  }

  // ---- Test 3: updateAnnotation ----
  {
    auto store = registry.acquire(kMain);
    cm::AnnotationId id = store->getAll()[0].id;
    int notified = 0;
    auto unsub = store->subscribe([&](const std::vector<cm::Annotation>&) { notified++; });

    std::string cmd = R"({"cmd":"updateAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},"id":")" +
                      id + R"(","patch":{"price":190.25,"locked":true}})";
    auto r = cmds.applyJsonText(cmd);
    requireTrue(r.ok, "updated");
    requireTrue(store->get(id)->price == 190.25 && store->get(id)->locked, "patch applied");
    requireTrue(store->get(id)->label == "Resistance", "untouched fields kept");
    requireTrue(notified == 1, "subscribers see command edits");

    r = cmds.applyJsonText(R"({"cmd":"updateAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},
      "id":"nope","patch":{"price":1}})");
    requireTrue(!r.ok && r.err.code == "NOT_FOUND", "unknown id");
    requireTrue(r.err.details == R"({"id":"nope"})", "id in details");

    r = cmds.applyJsonText(R"({"cmd":"updateAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},
      "patch":{"price":1}})");
    requireTrue(!r.ok && r.err.code == "BAD_COMMAND", "missing id");

    cmd = R"({"cmd":"updateAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},"id":")" +
          id + R"(","patch":{"price":"high"}})";
    r = cmds.applyJsonText(cmd);
    requireTrue(!r.ok && r.err.code == "BAD_PAYLOAD", "wrong field type");
    requireTrue(store->get(id)->price == 190.25, "bad patch changes nothing");

    unsub();
    std::printf("  Test 3 (update): PASS\n");
  }

  // ---- Test 4: deleteAnnotation ----
  {
    auto store = registry.acquire(kMain);
    cm::AnnotationId id = store->getAll()[0].id;
    std::string cmd = R"({"cmd":"deleteAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},"id":")" +
                      id + R"("})";
    auto r = cmds.applyJsonText(cmd);
    requireTrue(r.ok && store->count() == 0, "deleted");

    r = cmds.applyJsonText(cmd);
    requireTrue(!r.ok && r.err.code == "NOT_FOUND", "second delete");
    std::printf("  Test 4 (delete): PASS\n");
  }

  // ---- Test 5: importAnnotations ----
  {
    auto r = cmds.applyJsonText(R"({"cmd":"importAnnotations",
      "context":{"symbol":"AAPL","timeframe":"1D","surface":"rsi"},
      "annotations":[
        {"id":"keep","type":"horizontal_line","price":70},
        {"type":"rectangle","startPoint":{"time":1700000000,"price":40},
                            "endPoint":{"time":1700003600,"price":60},"fillOpacity":0.5},
        {"type":"arrow"},
        {"type":"vertical_line","time":1700001800,"lineStyle":"dotted"}
      ]})");
    requireTrue(r.ok, "import ok");
    requireTrue(r.count == 3, "three accepted, one skipped");

    auto rsi = registry.find(cm::AnnotationContext{"AAPL", "1D", "rsi"});
    requireTrue(rsi && rsi->count() == 3, "imported into rsi");
    requireTrue(rsi->get("keep") == nullptr, "ids are reassigned");
    auto all = rsi->getAll();
    requireTrue(all[0].type == cm::AnnotationType::HorizontalLine, "array order kept");
    requireTrue(all[1].fillOpacity == 0.5f, "rectangle fields");
    requireTrue(all[2].lineStyle == cm::LineStyle::Dotted, "vertical line style");
    requireTrue(registry.find(kMain)->count() == 0, "main untouched");

    r = cmds.applyJsonText(R"({"cmd":"importAnnotations","context":{"symbol":"AAPL","timeframe":"1D"},
      "annotations":{"type":"horizontal_line","price":1}})");
    requireTrue(!r.ok && r.err.code == "BAD_PAYLOAD", "annotations must be an array");
    std::printf("  Test 5 (import): PASS\n");
  }

  // ---- Test 6: listAnnotations ----
  {
    auto r = cmds.applyJsonText(R"({"cmd":"listAnnotations",
      "context":{"symbol":"AAPL","timeframe":"1D","surface":"rsi"}})");
    requireTrue(r.ok && r.count == 3, "three listed");

    rapidjson::Document doc;
    doc.Parse(r.json.c_str());
    requireTrue(!doc.HasParseError() && doc.IsArray() && doc.Size() == 3, "JSON array");
    requireTrue(std::string(doc[0]["type"].GetString()) == "horizontal_line", "type name");
    requireTrue(doc[0]["price"].GetDouble() == 70.0, "price");
    requireTrue(doc[1]["startPoint"]["price"].GetDouble() == 40.0, "nested point");

    r = cmds.applyJsonText(R"({"cmd":"listAnnotations","context":{"symbol":"MSFT","timeframe":"1D"}})");
    requireTrue(r.ok && r.count == 0 && r.json == "[]", "empty context");
    std::printf("  Test 6 (list): PASS\n");
  }

  // ---- Test 7: clearAnnotations ----
  {
    auto r = cmds.applyJsonText(R"({"cmd":"clearAnnotations",
      "context":{"symbol":"AAPL","timeframe":"1D","surface":"rsi"}})");
    requireTrue(r.ok, "cleared");
    requireTrue(registry.find(cm::AnnotationContext{"AAPL", "1D", "rsi"})->count() == 0, "empty");
    requireTrue(!kv.contains("annotations_AAPL_1D_rsi"), "storage key removed");
    std::printf("  Test 7 (clear): PASS\n");
  }

  // ---- Test 8: Malformed commands ----
  {
    auto r = cmds.applyJsonText("{not json");
    requireTrue(!r.ok && r.err.code == "BAD_COMMAND", "parse error");

    r = cmds.applyJsonText("[1,2]");
    requireTrue(!r.ok && r.err.code == "BAD_COMMAND", "not an object");

    r = cmds.applyJsonText(R"({"context":{}})");
    requireTrue(!r.ok && r.err.code == "BAD_COMMAND", "missing cmd");

    r = cmds.applyJsonText(R"({"cmd":"explode"})");
    requireTrue(!r.ok && r.err.code == "UNKNOWN_COMMAND", "unknown cmd");
    requireTrue(r.err.details == R"({"cmd":"explode"})", "cmd in details");

    // applyJson on an already-parsed value
    rapidjson::Document d;
    d.Parse(R"({"cmd":"createAnnotation","context":{"symbol":"AAPL","timeframe":"1D"},
      "annotation":{"type":"arrow","point":{"time":1700000000,"price":5},"direction":"down"}})");
    r = cmds.applyJson(d);
    requireTrue(r.ok, "applyJson");
    const cm::Annotation* arrow = registry.find(kMain)->get(r.createdId);
    requireTrue(arrow && arrow->direction == cm::ArrowDirection::Down, "direction read");
    std::printf("  Test 8 (malformed): PASS\n");
  }

  std::printf("D6.1 annotation_commands: ALL PASS\n");
  return 0;
}
