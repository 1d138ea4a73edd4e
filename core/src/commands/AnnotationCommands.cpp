#include "cm/commands/AnnotationCommands.hpp"

#include "cm/annotation/AnnotationCodec.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>

namespace cm {

AnnotationCommands::AnnotationCommands(AnnotationRegistry& registry)
  : registry_(registry) {}

CmdResult AnnotationCommands::fail(const std::string& code,
                                   const std::string& message,
                                   const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

const rapidjson::Value* AnnotationCommands::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string AnnotationCommands::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

bool AnnotationCommands::readContext(const rapidjson::Value& obj, AnnotationContext& out) {
  const auto* c = getMember(obj, "context");
  if (!c || !c->IsObject()) return false;

  AnnotationContext ctx;
  ctx.symbol = getStringOrEmpty(*c, "symbol");
  ctx.timeframe = getStringOrEmpty(*c, "timeframe");
  ctx.surfaceId = getStringOrEmpty(*c, "surface");
  if (ctx.surfaceId.empty()) ctx.surfaceId = "main";
  if (ctx.symbol.empty() || ctx.timeframe.empty()) return false;

  out = ctx;
  return true;
}

std::string AnnotationCommands::idDetails(const AnnotationId& id) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("id");
  w.String(id.c_str());
  w.EndObject();
  return sb.GetString();
}

CmdResult AnnotationCommands::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "AnnotationCommands: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult AnnotationCommands::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "createAnnotation") return cmdCreate(obj);
  if (cmd == "updateAnnotation") return cmdUpdate(obj);
  if (cmd == "deleteAnnotation") return cmdDelete(obj);
  if (cmd == "clearAnnotations") return cmdClear(obj);
  if (cmd == "importAnnotations") return cmdImport(obj);
  if (cmd == "listAnnotations") return cmdList(obj);

  std::fprintf(stderr, "[AnnotationCommands] unknown cmd '%s'\n", cmd.c_str());

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("cmd");
  w.String(cmd.c_str());
  w.EndObject();
  return fail("UNKNOWN_COMMAND", "Unknown cmd", sb.GetString());
}

// -------------------- Handlers --------------------

CmdResult AnnotationCommands::cmdCreate(const rapidjson::Value& obj) {
  AnnotationContext ctx;
  if (!readContext(obj, ctx)) {
    return fail("BAD_CONTEXT", "createAnnotation: missing context");
  }
  const auto* payloadV = getMember(obj, "annotation");
  if (!payloadV) {
    return fail("BAD_PAYLOAD", "createAnnotation: missing annotation");
  }

  Annotation payload;
  std::string err;
  if (!readAnnotationPayload(*payloadV, payload, err)) {
    return fail("BAD_PAYLOAD", "createAnnotation: " + err);
  }

  auto store = registry_.acquire(ctx);
  const Annotation* created = store->create(payload);
  if (!created) {
    return fail("REJECTED", "createAnnotation: store rejected payload");
  }

  CmdResult r;
  r.ok = true;
  r.createdId = created->id;
  return r;
}

CmdResult AnnotationCommands::cmdUpdate(const rapidjson::Value& obj) {
  AnnotationContext ctx;
  if (!readContext(obj, ctx)) {
    return fail("BAD_CONTEXT", "updateAnnotation: missing context");
  }
  const std::string id = getStringOrEmpty(obj, "id");
  if (id.empty()) {
    return fail("BAD_COMMAND", "updateAnnotation: missing id");
  }
  const auto* patchV = getMember(obj, "patch");
  if (!patchV) {
    return fail("BAD_PAYLOAD", "updateAnnotation: missing patch");
  }

  AnnotationPatch patch;
  std::string err;
  if (!readPatch(*patchV, patch, err)) {
    return fail("BAD_PAYLOAD", "updateAnnotation: " + err);
  }

  auto store = registry_.acquire(ctx);
  if (!store->get(id)) {
    return fail("NOT_FOUND", "updateAnnotation: unknown id", idDetails(id));
  }
  if (!store->update(id, patch)) {
    return fail("REJECTED", "updateAnnotation: patch produces an invalid annotation",
                idDetails(id));
  }

  CmdResult r;
  r.ok = true;
  return r;
}

CmdResult AnnotationCommands::cmdDelete(const rapidjson::Value& obj) {
  AnnotationContext ctx;
  if (!readContext(obj, ctx)) {
    return fail("BAD_CONTEXT", "deleteAnnotation: missing context");
  }
  const std::string id = getStringOrEmpty(obj, "id");
  if (id.empty()) {
    return fail("BAD_COMMAND", "deleteAnnotation: missing id");
  }

  auto store = registry_.acquire(ctx);
  if (!store->remove(id)) {
    return fail("NOT_FOUND", "deleteAnnotation: unknown id", idDetails(id));
  }

  CmdResult r;
  r.ok = true;
  return r;
}

CmdResult AnnotationCommands::cmdClear(const rapidjson::Value& obj) {
  AnnotationContext ctx;
  if (!readContext(obj, ctx)) {
    return fail("BAD_CONTEXT", "clearAnnotations: missing context");
  }

  registry_.acquire(ctx)->clearAll();

  CmdResult r;
  r.ok = true;
  return r;
}

CmdResult AnnotationCommands::cmdImport(const rapidjson::Value& obj) {
  AnnotationContext ctx;
  if (!readContext(obj, ctx)) {
    return fail("BAD_CONTEXT", "importAnnotations: missing context");
  }
  const auto* listV = getMember(obj, "annotations");
  if (!listV || !listV->IsArray()) {
    return fail("BAD_PAYLOAD", "importAnnotations: annotations must be an array");
  }

  auto store = registry_.acquire(ctx);
  std::size_t accepted = 0;
  std::size_t skipped = 0;

  // Imported entries get fresh ids and stamps, in array order.
  for (const auto& v : listV->GetArray()) {
    Annotation payload;
    std::string err;
    if (!readAnnotationPayload(v, payload, err) || !store->create(payload)) {
      skipped++;
      continue;
    }
    accepted++;
  }

  if (skipped > 0) {
    std::fprintf(stderr, "[AnnotationCommands] import into %s skipped %zu entries\n",
                 ctx.key().c_str(), skipped);
  }

  CmdResult r;
  r.ok = true;
  r.count = accepted;
  return r;
}

CmdResult AnnotationCommands::cmdList(const rapidjson::Value& obj) {
  AnnotationContext ctx;
  if (!readContext(obj, ctx)) {
    return fail("BAD_CONTEXT", "listAnnotations: missing context");
  }

  auto store = registry_.acquire(ctx);

  CmdResult r;
  r.ok = true;
  r.count = store->count();
  r.json = encodeAnnotationArray(store->getAll());
  return r;
}

} // namespace cm
