#pragma once
#include "cm/annotation/AnnotationContext.hpp"
#include "cm/ids/AnnotationId.hpp"
#include "cm/storage/AnnotationRegistry.hpp"

#include <string>

#include <rapidjson/document.h>

namespace cm {

struct CmdError {
  std::string code;     // e.g. "NOT_FOUND"
  std::string message;  // human text
  std::string details;  // small JSON object
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  AnnotationId createdId;  // createAnnotation
  std::size_t count{0};    // importAnnotations: accepted entries
  std::string json;        // listAnnotations: JSON array
};

// JSON command surface over the registry's stores. Every command names its
// context:
//   {"cmd":"createAnnotation","context":{"symbol":"AAPL","timeframe":"1D","surface":"main"},
//    "annotation":{"type":"horizontal_line","price":185.5}}
// Mutations go through AnnotationStore so subscribers see them like any
// interactive edit.
class AnnotationCommands {
public:
  explicit AnnotationCommands(AnnotationRegistry& registry);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

private:
  AnnotationRegistry& registry_;

  // ---- handlers ----
  CmdResult cmdCreate(const rapidjson::Value& obj);
  CmdResult cmdUpdate(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);
  CmdResult cmdClear(const rapidjson::Value& obj);
  CmdResult cmdImport(const rapidjson::Value& obj);
  CmdResult cmdList(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static bool readContext(const rapidjson::Value& obj, AnnotationContext& out);
  static std::string idDetails(const AnnotationId& id);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
};

} // namespace cm
