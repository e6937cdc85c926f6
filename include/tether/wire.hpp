#pragma once

#include <string>
#include <string_view>

#include <json/json.h>

#include <tether/record.hpp>
#include <tether/status.hpp>

namespace tether {

// Wire shape of a stored record (jsoncpp):
//
//   {"recordType": "Person", "identity": "...", "createdBy": "...",
//    "createdAt": {"timestamp": 1700000000000000}, ...,
//    "name": "Ada", "bestFriend": {"identity": "..."},
//    "photo": {"asset": "<base64>"}}
//
// System attributes are omitted while unset.

Json::Value PrimitiveToJson(const Primitive& value);
Json::Value AttributeToJson(const AttributeValue& value);

/** False if `json` is not a valid wire attribute value. */
bool AttributeFromJson(const Json::Value& json, AttributeValue* out);

Json::Value RecordToJson(const Record& record);
Status RecordFromJson(const Json::Value& json, Record* out);

/** Compact single-line JSON text. */
std::string WriteJson(const Json::Value& json);
bool ParseJson(std::string_view text, Json::Value* out, std::string* error);

std::string SerializeRecord(const Record& record);
Status ParseRecord(std::string_view text, Record* out);

}  // namespace tether
