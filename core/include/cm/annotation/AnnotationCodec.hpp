#pragma once
#include "cm/annotation/Annotation.hpp"
#include "cm/annotation/AnnotationContext.hpp"
#include "cm/annotation/AnnotationPatch.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace cm {

// Persisted record layout:
//   {"version":1,
//    "context":{"symbol":..,"timeframe":..,"surface":..},
//    "annotations":[ {...}, ... ]}          // creation order
// A bare JSON array is the unversioned legacy layout and is still read.
inline constexpr int kAnnotationFormatVersion = 1;

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeAnnotation(JsonWriter& w, const Annotation& a);
bool readAnnotation(const rapidjson::Value& v, Annotation& out, std::string& err);
// Same fields without the id requirement: a payload for AnnotationStore::create.
bool readAnnotationPayload(const rapidjson::Value& v, Annotation& out, std::string& err);

// Fields present in `v` become set fields of `out`. Unknown keys are ignored;
// a present key of the wrong JSON type is an error.
bool readPatch(const rapidjson::Value& v, AnnotationPatch& out, std::string& err);

std::string encodeAnnotationArray(const std::vector<Annotation>& annotations);
std::string encodeAnnotationRecord(const AnnotationContext& ctx,
                                   const std::vector<Annotation>& annotations);

struct DecodeReport {
  int version{0};            // 0 = legacy bare array
  std::size_t skipped{0};    // malformed or duplicate entries dropped
  std::string error;         // set when decoding failed outright
};

// Returns false when the record is unreadable (bad JSON, wrong shape, newer
// version). Individual malformed entries are skipped and counted.
bool decodeAnnotationRecord(const std::string& json,
                            std::vector<Annotation>& out,
                            DecodeReport& report);

// Decodes entries of an already-parsed array (import path).
bool decodeAnnotationList(const rapidjson::Value& arr,
                          std::vector<Annotation>& out,
                          DecodeReport& report);

} // namespace cm
