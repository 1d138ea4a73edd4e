#include "cm/session/OverlaySettings.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace cm {

std::string serializeOverlaySettings(const OverlaySettings& settings) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(settings.version.c_str(), alloc), alloc);
  doc.AddMember("theme",
                rapidjson::Value(settings.themeName.c_str(), alloc), alloc);

  // Interaction
  rapidjson::Value ia(rapidjson::kObjectType);
  ia.AddMember("hitTolerancePx", settings.interaction.hitTolerancePx, alloc);
  ia.AddMember("dragThresholdPx", settings.interaction.dragThresholdPx, alloc);
  ia.AddMember("clickTimeoutMs",
               static_cast<std::int64_t>(settings.interaction.clickTimeoutMs), alloc);
  ia.AddMember("handleSizePx", settings.interaction.handleSizePx, alloc);
  doc.AddMember("interaction", ia, alloc);

  // Registry + store
  rapidjson::Value reg(rapidjson::kObjectType);
  reg.AddMember("maxCachedContexts",
                static_cast<std::uint64_t>(settings.registry.maxCachedContexts), alloc);
  reg.AddMember("keyPrefix",
                rapidjson::Value(settings.store.keyPrefix.c_str(), alloc), alloc);
  doc.AddMember("registry", reg, alloc);

  rapidjson::Value co(rapidjson::kObjectType);
  co.AddMember("autoDeselectSingleClickTools",
               settings.coordinator.autoDeselectSingleClickTools, alloc);
  doc.AddMember("coordinator", co, alloc);

  doc.AddMember("symbol",
                rapidjson::Value(settings.symbol.c_str(), alloc), alloc);
  doc.AddMember("timeframe",
                rapidjson::Value(settings.timeframe.c_str(), alloc), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeOverlaySettings(const std::string& json, OverlaySettings& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  if (doc.HasMember("version") && doc["version"].IsString())
    out.version = doc["version"].GetString();
  if (doc.HasMember("theme") && doc["theme"].IsString())
    out.themeName = doc["theme"].GetString();

  // Interaction
  if (doc.HasMember("interaction") && doc["interaction"].IsObject()) {
    const auto& ia = doc["interaction"];
    if (ia.HasMember("hitTolerancePx") && ia["hitTolerancePx"].IsNumber())
      out.interaction.hitTolerancePx = ia["hitTolerancePx"].GetDouble();
    if (ia.HasMember("dragThresholdPx") && ia["dragThresholdPx"].IsNumber())
      out.interaction.dragThresholdPx = ia["dragThresholdPx"].GetDouble();
    if (ia.HasMember("clickTimeoutMs") && ia["clickTimeoutMs"].IsInt64())
      out.interaction.clickTimeoutMs = ia["clickTimeoutMs"].GetInt64();
    if (ia.HasMember("handleSizePx") && ia["handleSizePx"].IsNumber())
      out.interaction.handleSizePx = ia["handleSizePx"].GetDouble();
  }

  // Registry
  if (doc.HasMember("registry") && doc["registry"].IsObject()) {
    const auto& reg = doc["registry"];
    if (reg.HasMember("maxCachedContexts") && reg["maxCachedContexts"].IsUint64())
      out.registry.maxCachedContexts =
        static_cast<std::size_t>(reg["maxCachedContexts"].GetUint64());
    if (reg.HasMember("keyPrefix") && reg["keyPrefix"].IsString() &&
        reg["keyPrefix"].GetStringLength() > 0)
      out.store.keyPrefix = reg["keyPrefix"].GetString();
  }

  // Coordinator
  if (doc.HasMember("coordinator") && doc["coordinator"].IsObject()) {
    const auto& co = doc["coordinator"];
    if (co.HasMember("autoDeselectSingleClickTools") &&
        co["autoDeselectSingleClickTools"].IsBool())
      out.coordinator.autoDeselectSingleClickTools =
        co["autoDeselectSingleClickTools"].GetBool();
  }

  if (doc.HasMember("symbol") && doc["symbol"].IsString())
    out.symbol = doc["symbol"].GetString();
  if (doc.HasMember("timeframe") && doc["timeframe"].IsString())
    out.timeframe = doc["timeframe"].GetString();

  return true;
}

} // namespace cm
