#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>

#include <tether/model.hpp>
#include <tether/object_graph.hpp>
#include <tether/record.hpp>
#include <tether/status.hpp>

namespace tether {

/** A reference-typed field found while encoding; resolved by the save pipeline. */
struct ReferenceField {
  const FieldDescriptor* field = nullptr;
  bool is_list = false;
  NodeId node = kNullNode;       // single reference, kNullNode when null
  std::vector<NodeId> nodes;     // list of references
};

/**
 * Per-decode state. Objects are staged and addressed by their index in
 * `staged` until the whole tree has decoded; only then are they moved into
 * `graph` and their references rewritten to graph ids.
 */
struct DecodeSession {
  ObjectGraph* graph = nullptr;
  std::vector<ObjectGraph::NewNode> staged;
  std::unordered_map<std::string, NodeId> nodes_by_identity;  // staged index
};

/**
 * Converts leaf field values between objects and records.
 *
 * Encoding copies primitives verbatim, wraps blobs as assets and reports
 * reference fields back to the caller untouched. Decoding works on the
 * sanitized JSON form of a record (timestamps as epoch seconds, blobs as
 * base64 text) in which the load pipeline has already inlined referenced
 * records as nested objects.
 */
class RecordCodec {
 public:
  /**
   * Write every non-system leaf field of `model` into `record` and append
   * its reference fields to `references`. Absent optional values are not
   * written. Uses the type's custom encoder when it has one.
   */
  static Status EncodeLeaves(const Model& model, Record* record,
                             std::vector<ReferenceField>* references);

  /** JSON-safe form of a record. References stay `{"identity": id}`. */
  static Json::Value Sanitize(const Record& record);
  static Json::Value SanitizeValue(const AttributeValue& value);

  /**
   * Build an object of `type` from sanitized (and possibly inlined) JSON
   * and add it, with every object inlined in it, to the session graph. On
   * failure the graph is left untouched.
   *
   * A reference value may be null, a nested inlined record, or a cycle
   * marker `{"identity": id, "isCycle": true}` naming a record already
   * decoded in this session. Anything else fails with MappingError.
   */
  static Status DecodeObject(const Json::Value& json, const TypeDescriptor& type,
                             DecodeSession* session, NodeId* out);

  static Json::Value CycleMarker(const std::string& identity);
  static bool IsCycleMarker(const Json::Value& json);
};

}  // namespace tether
