#include "cm/annotation/AnnotationCodec.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <unordered_set>

namespace cm {

namespace {

const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

// ---- writers ----

void writeTime(JsonWriter& w, const TimeValue& t) {
  switch (t.kind) {
    case TimeValue::Kind::Epoch: w.Int64(t.epoch); return;
    case TimeValue::Kind::Date:  w.String(t.date.c_str()); return;
    case TimeValue::Kind::None:  w.Null(); return;
  }
  w.Null();
}

void writePoint(JsonWriter& w, const DomainPoint& p) {
  w.StartObject();
  w.Key("time");  writeTime(w, p.time);
  w.Key("price"); w.Double(p.price);
  w.EndObject();
}

void writeColor(JsonWriter& w, const Color& c) {
  std::string hex = toHexColor(c);
  w.String(hex.c_str());
}

void writeNumbers(JsonWriter& w, const std::vector<double>& v) {
  w.StartArray();
  for (double d : v) w.Double(d);
  w.EndArray();
}

std::string levelKey(double level) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.10g", level);
  return buf;
}

// ---- readers ----

// Integral or floating JSON number that fits in int64 (fraction truncated).
bool readInt64(const rapidjson::Value& v, std::int64_t& out) {
  if (v.IsInt64()) {
    out = v.GetInt64();
    return true;
  }
  if (!v.IsNumber()) return false;
  double d = v.GetDouble();
  const double limit = std::ldexp(1.0, 63);
  if (!std::isfinite(d) || d >= limit || d < -limit) return false;
  out = static_cast<std::int64_t>(d);
  return true;
}

bool readTime(const rapidjson::Value& v, TimeValue& out) {
  std::int64_t epoch = 0;
  if (readInt64(v, epoch)) {
    out = TimeValue::fromEpoch(epoch);
    return true;
  }
  if (v.IsString() && v.GetStringLength() > 0) {
    out = TimeValue::fromDate(v.GetString());
    return true;
  }
  return false;
}

bool readPoint(const rapidjson::Value& v, DomainPoint& out) {
  if (!v.IsObject()) return false;
  const auto* t = getMember(v, "time");
  const auto* p = getMember(v, "price");
  if (!t || !p || !p->IsNumber()) return false;
  DomainPoint pt;
  if (!readTime(*t, pt.time)) return false;
  pt.price = p->GetDouble();
  out = pt;
  return true;
}

bool readColor(const rapidjson::Value& v, Color& out) {
  if (!v.IsString()) return false;
  return parseHexColor(v.GetString(), out);
}

bool readNumbers(const rapidjson::Value& v, std::vector<double>& out) {
  if (!v.IsArray()) return false;
  std::vector<double> nums;
  nums.reserve(v.Size());
  for (const auto& e : v.GetArray()) {
    if (!e.IsNumber()) return false;
    nums.push_back(e.GetDouble());
  }
  out = std::move(nums);
  return true;
}

bool readLevelColors(const rapidjson::Value& v, std::vector<LevelColor>& out) {
  if (!v.IsObject()) return false;
  std::vector<LevelColor> result;
  for (auto it = v.MemberBegin(); it != v.MemberEnd(); ++it) {
    const char* key = it->name.GetString();
    char* end = nullptr;
    double level = std::strtod(key, &end);
    if (end == key) return false;
    LevelColor lc;
    lc.level = level;
    if (!readColor(it->value, lc.color)) return false;
    result.push_back(lc);
  }
  std::sort(result.begin(), result.end(),
            [](const LevelColor& a, const LevelColor& b) { return a.level < b.level; });
  out = std::move(result);
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  const auto* v = getMember(obj, key);
  if (!v) return true;
  if (!v->IsBool()) return false;
  out = v->GetBool();
  return true;
}

bool readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  const auto* v = getMember(obj, key);
  if (!v) return true;
  if (!v->IsNumber()) return false;
  out = static_cast<float>(v->GetDouble());
  return true;
}

bool readStyle(const rapidjson::Value& obj, const char* key, LineStyle& out) {
  const auto* v = getMember(obj, key);
  if (!v) return true;
  return v->IsString() && parseLineStyle(v->GetString(), out);
}

// Patch field readers: absent = untouched, present with wrong type = error.

template <typename T, typename Fn>
bool patchField(const rapidjson::Value& obj, const char* key,
                std::optional<T>& slot, std::string& err, Fn read) {
  const auto* v = getMember(obj, key);
  if (!v) return true;
  T value{};
  if (!read(*v, value)) {
    err = std::string("invalid field: ") + key;
    return false;
  }
  slot = value;
  return true;
}

bool asBool(const rapidjson::Value& v, bool& out) {
  if (!v.IsBool()) return false;
  out = v.GetBool();
  return true;
}

bool asFloat(const rapidjson::Value& v, float& out) {
  if (!v.IsNumber()) return false;
  out = static_cast<float>(v.GetDouble());
  return true;
}

bool asDouble(const rapidjson::Value& v, double& out) {
  if (!v.IsNumber()) return false;
  out = v.GetDouble();
  return true;
}

bool asString(const rapidjson::Value& v, std::string& out) {
  if (!v.IsString()) return false;
  out = v.GetString();
  return true;
}

bool asStyle(const rapidjson::Value& v, LineStyle& out) {
  return v.IsString() && parseLineStyle(v.GetString(), out);
}

} // namespace

// -------------------- Annotation --------------------

void writeAnnotation(JsonWriter& w, const Annotation& a) {
  w.StartObject();
  w.Key("id");        w.String(a.id.c_str());
  w.Key("type");      w.String(annotationTypeName(a.type));
  w.Key("color");     writeColor(w, a.color);
  w.Key("thickness"); w.Double(static_cast<double>(a.thickness));
  if (!a.label.empty()) {
    w.Key("label");   w.String(a.label.c_str());
  }
  w.Key("visible");   w.Bool(a.visible);
  w.Key("locked");    w.Bool(a.locked);
  w.Key("createdAt"); w.Int64(a.createdAt);
  w.Key("updatedAt"); w.Int64(a.updatedAt);

  switch (a.type) {
    case AnnotationType::HorizontalLine:
      w.Key("price");       w.Double(a.price);
      w.Key("extendLeft");  w.Bool(a.extendLeft);
      w.Key("extendRight"); w.Bool(a.extendRight);
      w.Key("lineStyle");   w.String(lineStyleName(a.lineStyle));
      break;

    case AnnotationType::VerticalLine:
      w.Key("time");        writeTime(w, a.time);
      w.Key("lineStyle");   w.String(lineStyleName(a.lineStyle));
      break;

    case AnnotationType::Trendline:
      w.Key("startPoint");  writePoint(w, a.startPoint);
      w.Key("endPoint");    writePoint(w, a.endPoint);
      w.Key("extendLeft");  w.Bool(a.extendLeft);
      w.Key("extendRight"); w.Bool(a.extendRight);
      w.Key("lineStyle");   w.String(lineStyleName(a.lineStyle));
      break;

    case AnnotationType::Rectangle:
      w.Key("startPoint");  writePoint(w, a.startPoint);
      w.Key("endPoint");    writePoint(w, a.endPoint);
      w.Key("fillOpacity"); w.Double(static_cast<double>(a.fillOpacity));
      w.Key("borderStyle"); w.String(lineStyleName(a.borderStyle));
      break;

    case AnnotationType::Fibonacci:
      w.Key("startPoint");      writePoint(w, a.startPoint);
      w.Key("endPoint");        writePoint(w, a.endPoint);
      w.Key("levels");          writeNumbers(w, a.levels);
      w.Key("showExtensions");  w.Bool(a.showExtensions);
      w.Key("extensionLevels"); writeNumbers(w, a.extensionLevels);
      w.Key("showPrices");      w.Bool(a.showPrices);
      w.Key("levelColors");
      w.StartObject();
      for (const auto& lc : a.levelColors) {
        std::string key = levelKey(lc.level);
        w.Key(key.c_str());
        writeColor(w, lc.color);
      }
      w.EndObject();
      break;

    case AnnotationType::Arrow:
      w.Key("point");     writePoint(w, a.point);
      w.Key("direction"); w.String(arrowDirectionName(a.direction));
      w.Key("size");      w.String(arrowSizeName(a.size));
      break;

    case AnnotationType::Text:
      w.Key("point");             writePoint(w, a.point);
      w.Key("text");              w.String(a.text.c_str());
      w.Key("fontSize");          w.Double(static_cast<double>(a.fontSize));
      w.Key("backgroundColor");   writeColor(w, a.backgroundColor);
      w.Key("backgroundOpacity"); w.Double(static_cast<double>(a.backgroundOpacity));
      break;
  }
  w.EndObject();
}

bool readAnnotation(const rapidjson::Value& v, Annotation& out, std::string& err) {
  if (!v.IsObject()) { err = "annotation is not an object"; return false; }

  const auto* idV = getMember(v, "id");
  if (!idV || !idV->IsString() || idV->GetStringLength() == 0) {
    err = "missing id";
    return false;
  }
  Annotation a;
  if (!readAnnotationPayload(v, a, err)) return false;
  a.id = idV->GetString();
  out = std::move(a);
  return true;
}

bool readAnnotationPayload(const rapidjson::Value& v, Annotation& out, std::string& err) {
  if (!v.IsObject()) { err = "annotation is not an object"; return false; }

  const auto* typeV = getMember(v, "type");
  AnnotationType type;
  if (!typeV || !typeV->IsString() || !parseAnnotationType(typeV->GetString(), type)) {
    err = "missing or unknown type";
    return false;
  }

  Annotation a = annotationDefaults(type);

  if (const auto* c = getMember(v, "color")) {
    if (!readColor(*c, a.color)) { err = "bad color"; return false; }
  }
  if (!readFloat(v, "thickness", a.thickness)) { err = "bad thickness"; return false; }
  if (const auto* l = getMember(v, "label")) {
    if (l->IsString()) a.label = l->GetString();
    else if (!l->IsNull()) { err = "bad label"; return false; }
  }
  if (!readBool(v, "visible", a.visible)) { err = "bad visible"; return false; }
  if (!readBool(v, "locked", a.locked)) { err = "bad locked"; return false; }

  if (const auto* c = getMember(v, "createdAt")) {
    if (!readInt64(*c, a.createdAt)) { err = "bad createdAt"; return false; }
  }
  if (const auto* u = getMember(v, "updatedAt")) {
    if (!readInt64(*u, a.updatedAt)) { err = "bad updatedAt"; return false; }
  }
  a.updatedAt = std::max(a.updatedAt, a.createdAt);

  switch (type) {
    case AnnotationType::HorizontalLine: {
      const auto* p = getMember(v, "price");
      if (!p || !p->IsNumber()) { err = "missing price"; return false; }
      a.price = p->GetDouble();
      if (!readBool(v, "extendLeft", a.extendLeft) ||
          !readBool(v, "extendRight", a.extendRight) ||
          !readStyle(v, "lineStyle", a.lineStyle)) {
        err = "bad horizontal line fields";
        return false;
      }
      break;
    }

    case AnnotationType::VerticalLine: {
      const auto* t = getMember(v, "time");
      if (!t || !readTime(*t, a.time)) { err = "missing time"; return false; }
      if (!readStyle(v, "lineStyle", a.lineStyle)) { err = "bad lineStyle"; return false; }
      break;
    }

    case AnnotationType::Trendline:
    case AnnotationType::Rectangle:
    case AnnotationType::Fibonacci: {
      const auto* s = getMember(v, "startPoint");
      const auto* e = getMember(v, "endPoint");
      if (!s || !e || !readPoint(*s, a.startPoint) || !readPoint(*e, a.endPoint)) {
        err = "missing endpoints";
        return false;
      }
      if (type == AnnotationType::Trendline) {
        if (!readBool(v, "extendLeft", a.extendLeft) ||
            !readBool(v, "extendRight", a.extendRight) ||
            !readStyle(v, "lineStyle", a.lineStyle)) {
          err = "bad trendline fields";
          return false;
        }
      } else if (type == AnnotationType::Rectangle) {
        if (!readFloat(v, "fillOpacity", a.fillOpacity) ||
            !readStyle(v, "borderStyle", a.borderStyle)) {
          err = "bad rectangle fields";
          return false;
        }
      } else {
        if (const auto* l = getMember(v, "levels")) {
          if (!readNumbers(*l, a.levels)) { err = "bad levels"; return false; }
        }
        if (const auto* l = getMember(v, "extensionLevels")) {
          if (!readNumbers(*l, a.extensionLevels)) { err = "bad extensionLevels"; return false; }
        }
        if (const auto* l = getMember(v, "levelColors")) {
          if (!readLevelColors(*l, a.levelColors)) { err = "bad levelColors"; return false; }
        }
        if (!readBool(v, "showExtensions", a.showExtensions) ||
            !readBool(v, "showPrices", a.showPrices)) {
          err = "bad fibonacci flags";
          return false;
        }
      }
      break;
    }

    case AnnotationType::Arrow: {
      const auto* p = getMember(v, "point");
      if (!p || !readPoint(*p, a.point)) { err = "missing point"; return false; }
      if (const auto* d = getMember(v, "direction")) {
        if (!d->IsString() || !parseArrowDirection(d->GetString(), a.direction)) {
          err = "bad direction";
          return false;
        }
      }
      if (const auto* s = getMember(v, "size")) {
        if (!s->IsString() || !parseArrowSize(s->GetString(), a.size)) {
          err = "bad size";
          return false;
        }
      }
      break;
    }

    case AnnotationType::Text: {
      const auto* p = getMember(v, "point");
      if (!p || !readPoint(*p, a.point)) { err = "missing point"; return false; }
      const auto* t = getMember(v, "text");
      if (!t || !t->IsString()) { err = "missing text"; return false; }
      a.text = t->GetString();
      if (!readFloat(v, "fontSize", a.fontSize) ||
          !readFloat(v, "backgroundOpacity", a.backgroundOpacity)) {
        err = "bad text fields";
        return false;
      }
      if (const auto* bg = getMember(v, "backgroundColor")) {
        if (!readColor(*bg, a.backgroundColor)) { err = "bad backgroundColor"; return false; }
      }
      break;
    }
  }

  if (!validateAnnotation(a, err)) return false;
  normalizeAnnotation(a);
  out = std::move(a);
  return true;
}

// -------------------- Patch --------------------

bool readPatch(const rapidjson::Value& v, AnnotationPatch& out, std::string& err) {
  if (!v.IsObject()) { err = "patch is not an object"; return false; }

  AnnotationPatch p;
  bool ok =
    patchField(v, "color", p.color, err, readColor) &&
    patchField(v, "thickness", p.thickness, err, asFloat) &&
    patchField(v, "visible", p.visible, err, asBool) &&
    patchField(v, "locked", p.locked, err, asBool) &&
    patchField(v, "price", p.price, err, asDouble) &&
    patchField(v, "time", p.time, err, readTime) &&
    patchField(v, "startPoint", p.startPoint, err, readPoint) &&
    patchField(v, "endPoint", p.endPoint, err, readPoint) &&
    patchField(v, "point", p.point, err, readPoint) &&
    patchField(v, "extendLeft", p.extendLeft, err, asBool) &&
    patchField(v, "extendRight", p.extendRight, err, asBool) &&
    patchField(v, "lineStyle", p.lineStyle, err, asStyle) &&
    patchField(v, "fillOpacity", p.fillOpacity, err, asFloat) &&
    patchField(v, "borderStyle", p.borderStyle, err, asStyle) &&
    patchField(v, "levels", p.levels, err, readNumbers) &&
    patchField(v, "showExtensions", p.showExtensions, err, asBool) &&
    patchField(v, "extensionLevels", p.extensionLevels, err, readNumbers) &&
    patchField(v, "showPrices", p.showPrices, err, asBool) &&
    patchField(v, "levelColors", p.levelColors, err, readLevelColors) &&
    patchField(v, "text", p.text, err, asString) &&
    patchField(v, "fontSize", p.fontSize, err, asFloat) &&
    patchField(v, "backgroundColor", p.backgroundColor, err, readColor) &&
    patchField(v, "backgroundOpacity", p.backgroundOpacity, err, asFloat);
  if (!ok) return false;

  if (const auto* l = getMember(v, "label")) {
    if (l->IsString()) p.label = std::string(l->GetString());
    else if (l->IsNull()) p.label = std::string();
    else { err = "invalid field: label"; return false; }
  }
  if (const auto* d = getMember(v, "direction")) {
    ArrowDirection dir;
    if (!d->IsString() || !parseArrowDirection(d->GetString(), dir)) {
      err = "invalid field: direction";
      return false;
    }
    p.direction = dir;
  }
  if (const auto* s = getMember(v, "size")) {
    ArrowSize sz;
    if (!s->IsString() || !parseArrowSize(s->GetString(), sz)) {
      err = "invalid field: size";
      return false;
    }
    p.size = sz;
  }

  out = std::move(p);
  return true;
}

// -------------------- Records --------------------

std::string encodeAnnotationArray(const std::vector<Annotation>& annotations) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartArray();
  for (const auto& a : annotations) writeAnnotation(w, a);
  w.EndArray();
  return sb.GetString();
}

std::string encodeAnnotationRecord(const AnnotationContext& ctx,
                                   const std::vector<Annotation>& annotations) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("version"); w.Int(kAnnotationFormatVersion);
  w.Key("context");
  w.StartObject();
  w.Key("symbol");    w.String(ctx.symbol.c_str());
  w.Key("timeframe"); w.String(ctx.timeframe.c_str());
  w.Key("surface");   w.String(ctx.surfaceId.c_str());
  w.EndObject();
  w.Key("annotations");
  w.StartArray();
  for (const auto& a : annotations) writeAnnotation(w, a);
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

bool decodeAnnotationList(const rapidjson::Value& arr,
                          std::vector<Annotation>& out,
                          DecodeReport& report) {
  if (!arr.IsArray()) {
    report.error = "annotations is not an array";
    return false;
  }

  std::vector<Annotation> loaded;
  loaded.reserve(arr.Size());
  std::unordered_set<std::string> seen;

  for (const auto& v : arr.GetArray()) {
    Annotation a;
    std::string err;
    if (!readAnnotation(v, a, err)) {
      report.skipped++;
      continue;
    }
    if (!seen.insert(a.id).second) {
      report.skipped++;
      continue;
    }
    loaded.push_back(std::move(a));
  }

  // Keep creation order; entries with equal stamps keep their stored order.
  std::stable_sort(loaded.begin(), loaded.end(),
                   [](const Annotation& a, const Annotation& b) {
                     return a.createdAt < b.createdAt;
                   });
  out = std::move(loaded);
  return true;
}

bool decodeAnnotationRecord(const std::string& json,
                            std::vector<Annotation>& out,
                            DecodeReport& report) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    report.error = "parse error";
    return false;
  }

  if (doc.IsArray()) {
    report.version = 0;
    return decodeAnnotationList(doc, out, report);
  }

  if (!doc.IsObject()) {
    report.error = "record is neither object nor array";
    return false;
  }

  const auto* ver = getMember(doc, "version");
  if (!ver || !ver->IsInt()) {
    report.error = "missing version";
    return false;
  }
  report.version = ver->GetInt();
  if (report.version > kAnnotationFormatVersion || report.version < 1) {
    report.error = "unsupported version " + std::to_string(report.version);
    return false;
  }

  const auto* arr = getMember(doc, "annotations");
  if (!arr) {
    report.error = "missing annotations";
    return false;
  }
  return decodeAnnotationList(*arr, out, report);
}

} // namespace cm
