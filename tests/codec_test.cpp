// Unit tests for RecordCodec
// Tests: leaf encoding, unsupported kinds, sanitizing, decoding, cycle markers,
// custom codecs

#include <gtest/gtest.h>

#include <tether/codec.hpp>
#include <tether/test_utils.hpp>

#include <optional>
#include <string>
#include <vector>

namespace tether {
namespace {

using testing::Document;
using testing::Gadget;
using testing::Person;
using testing::Pet;

// Stores fahrenheit, exposes celsius.
struct Reading : ModelOf<Reading> {
  double celsius = 0.0;
  std::string station;
  Ref<Person> observer;

  static const TypeDescriptor& Type() {
    static const TypeDescriptor type = TypeBuilder<Reading>("Reading")
        .Field("celsius", &Reading::celsius)
        .Field("station", &Reading::station)
        .Field("observer", &Reading::observer)
        .CustomCodec(
            [](const Model& m, Json::Value* out) {
              const auto& r = static_cast<const Reading&>(m);
              (*out)["fahrenheit"] = r.celsius * 9.0 / 5.0 + 32.0;
              (*out)["station"] = r.station;
              return Status::OK();
            },
            [](const Json::Value& json, Model* m) {
              auto* r = static_cast<Reading*>(m);
              if (!json["fahrenheit"].isNumeric()) {
                return Status::MappingError("Reading", "fahrenheit", "missing");
              }
              r->celsius = (json["fahrenheit"].asDouble() - 32.0) * 5.0 / 9.0;
              r->station = json["station"].asString();
              return Status::OK();
            })
        .Build();
    return type;
  }
};

// =============================================================================
// Test Fixture
// =============================================================================

class CodecTest : public ::testing::Test {
 protected:
  Json::Value PersonJson(const std::string& identity, const std::string& name) {
    Json::Value json(Json::objectValue);
    json["recordType"] = "Person";
    json["identity"] = identity;
    json["name"] = name;
    json["age"] = 30;
    json["tags"] = Json::Value(Json::arrayValue);
    return json;
  }

  Status Decode(const Json::Value& json, const TypeDescriptor& type, NodeId* out) {
    DecodeSession session;
    session.graph = &graph_;
    return RecordCodec::DecodeObject(json, type, &session, out);
  }

  ObjectGraph graph_;
};

// =============================================================================
// Encoding
// =============================================================================

TEST_F(CodecTest, EncodeCopiesLeavesAndReportsReferences) {
  Person p;
  p.name = "Ada";
  p.age = 36;
  p.tags = {"math", "engines"};
  auto pet = graph_.Add(Pet{});
  p.pet = pet;
  auto ref = graph_.Add(std::move(p));

  Record record;
  std::vector<ReferenceField> refs;
  ASSERT_TRUE(RecordCodec::EncodeLeaves(*graph_.Get(ref), &record, &refs).ok());

  EXPECT_EQ(record.record_type, "Person");
  EXPECT_EQ(std::get<std::string>(std::get<Primitive>(*record.Get("name"))), "Ada");
  EXPECT_EQ(std::get<int64_t>(std::get<Primitive>(*record.Get("age"))), 36);
  const auto& tags = std::get<std::vector<Primitive>>(*record.Get("tags"));
  ASSERT_EQ(tags.size(), 2u);
  EXPECT_EQ(std::get<std::string>(tags[1]), "engines");

  // Absent optional is not written; references are left to the caller.
  EXPECT_FALSE(record.Has("nickname"));
  EXPECT_FALSE(record.Has("pet"));
  EXPECT_FALSE(record.Has("bestFriend"));

  ASSERT_EQ(refs.size(), 3u);
  EXPECT_EQ(refs[0].field->name, "bestFriend");
  EXPECT_EQ(refs[0].node, kNullNode);
  EXPECT_EQ(refs[1].field->name, "pet");
  EXPECT_EQ(refs[1].node, pet.node);
  EXPECT_TRUE(refs[2].is_list);
  EXPECT_TRUE(refs[2].nodes.empty());
}

TEST_F(CodecTest, EncodeWrapsBlobsAsAssets) {
  Document d;
  d.title = "notes";
  d.body = Blob{"hello"};
  d.attachments = {Blob{"a"}, Blob{"b"}};
  d.revised = Timestamp{1700000000123456LL};
  auto ref = graph_.Add(std::move(d));

  Record record;
  std::vector<ReferenceField> refs;
  ASSERT_TRUE(RecordCodec::EncodeLeaves(*graph_.Get(ref), &record, &refs).ok());
  EXPECT_EQ(std::get<Asset>(*record.Get("body")).bytes, "hello");
  EXPECT_EQ(std::get<std::vector<Asset>>(*record.Get("attachments")).size(), 2u);
  EXPECT_EQ(std::get<Timestamp>(std::get<Primitive>(*record.Get("revised"))).micros,
            1700000000123456LL);
  EXPECT_FALSE(record.Has("archived"));
  EXPECT_TRUE(refs.empty());
}

TEST_F(CodecTest, DictionaryFieldIsUnsupported) {
  Gadget g;
  g.name = "widget";
  g.specs = {{"color", "red"}};
  auto ref = graph_.Add(std::move(g));

  Record record;
  std::vector<ReferenceField> refs;
  Status s = RecordCodec::EncodeLeaves(*graph_.Get(ref), &record, &refs);
  EXPECT_TRUE(s.IsUnsupportedFieldType());
  EXPECT_EQ(s.field(), "specs");
  EXPECT_EQ(s.type_name(), "Gadget");
}

// =============================================================================
// Sanitizing
// =============================================================================

TEST_F(CodecTest, SanitizeUsesSecondsAndBase64) {
  Record r;
  r.record_type = "Document";
  r.identity = "d1";
  r.system.created_at = Timestamp{1500000};
  r.Set("revised", Primitive(Timestamp{2500000}));
  r.Set("body", Asset{"foo"});
  r.Set("owner", Reference{"p1"});

  Json::Value json = RecordCodec::Sanitize(r);
  EXPECT_DOUBLE_EQ(json["createdAt"].asDouble(), 1.5);
  EXPECT_DOUBLE_EQ(json["revised"].asDouble(), 2.5);
  EXPECT_EQ(json["body"].asString(), "Zm9v");
  EXPECT_EQ(json["owner"]["identity"].asString(), "p1");
  EXPECT_EQ(json["identity"].asString(), "d1");
}

// =============================================================================
// Decoding
// =============================================================================

TEST_F(CodecTest, DecodeRestoresLeavesAndSystemFields) {
  Json::Value json = PersonJson("p1", "Ada");
  json["nickname"] = "Countess";
  json["tags"].append("math");
  json["modifiedBy"] = "tether";
  json["modifiedAt"] = 1700000000.5;

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Person::Type(), &node).ok());
  const Person* p = graph_.Get(graph_.As<Person>(node));
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->name, "Ada");
  EXPECT_EQ(p->age, 30);
  ASSERT_TRUE(p->nickname.has_value());
  EXPECT_EQ(*p->nickname, "Countess");
  ASSERT_EQ(p->tags.size(), 1u);
  EXPECT_EQ(graph_.Identity(node), std::optional<std::string>("p1"));
  EXPECT_EQ(graph_.System(node).modified_by, std::optional<std::string>("tether"));
  EXPECT_EQ(graph_.System(node).modified_at->micros, 1700000000500000LL);
}

TEST_F(CodecTest, DecodeBlobsAndTimestamps) {
  Json::Value json(Json::objectValue);
  json["recordType"] = "Document";
  json["identity"] = "d1";
  json["title"] = "t";
  json["body"] = "aGVsbG8=";
  json["attachments"] = Json::Value(Json::arrayValue);
  json["attachments"].append("YQ==");
  json["revised"] = 1700000000.123456;

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Document::Type(), &node).ok());
  const Document* d = graph_.Get(graph_.As<Document>(node));
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->body.bytes, "hello");
  ASSERT_EQ(d->attachments.size(), 1u);
  EXPECT_EQ(d->attachments[0].bytes, "a");
  EXPECT_EQ(d->revised.micros, 1700000000123456LL);
  EXPECT_FALSE(d->archived.has_value());
}

TEST_F(CodecTest, SanitizedTimestampsKeepEveryMicrosecond) {
  // 2023, 2200 (past 2^52 microseconds) and 1900.
  for (int64_t start : {1700000000000000LL, 7258118400000000LL, -2208988800000000LL}) {
    for (int64_t micros = start; micros < start + 2000; ++micros) {
      Timestamp t{micros};
      ASSERT_EQ(Timestamp::FromSeconds(t.ToSeconds()).micros, micros);
    }
  }
}

TEST_F(CodecTest, TypeMismatchIsMappingError) {
  Json::Value json = PersonJson("p1", "Ada");
  json["age"] = "old";

  NodeId node = kNullNode;
  Status s = Decode(json, Person::Type(), &node);
  EXPECT_TRUE(s.IsMappingError());
  EXPECT_EQ(s.field(), "age");
  EXPECT_EQ(s.type_name(), "Person");
  EXPECT_NE(s.message().find("found string"), std::string::npos);
}

TEST_F(CodecTest, MissingRequiredValueIsMappingError) {
  Json::Value json = PersonJson("p1", "Ada");
  json.removeMember("name");

  NodeId node = kNullNode;
  Status s = Decode(json, Person::Type(), &node);
  EXPECT_TRUE(s.IsMappingError());
  EXPECT_EQ(s.field(), "name");
}

TEST_F(CodecTest, RecordTypeMismatchIsMappingError) {
  Json::Value json = PersonJson("p1", "Ada");
  NodeId node = kNullNode;
  EXPECT_TRUE(Decode(json, Pet::Type(), &node).IsMappingError());
}

TEST_F(CodecTest, InlinedReferenceBecomesChildNode) {
  Json::Value pet(Json::objectValue);
  pet["recordType"] = "Pet";
  pet["identity"] = "x1";
  pet["name"] = "Rex";
  pet["weight"] = 3.5;
  pet["owner"] = RecordCodec::CycleMarker("p1");

  Json::Value json = PersonJson("p1", "Ada");
  json["pet"] = pet;

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Person::Type(), &node).ok());
  const Person* p = graph_.Get(graph_.As<Person>(node));
  ASSERT_NE(p, nullptr);
  const Pet* rex = graph_.Get(p->pet);
  ASSERT_NE(rex, nullptr);
  EXPECT_EQ(rex->name, "Rex");
  EXPECT_DOUBLE_EQ(rex->weight, 3.5);
  // The marker resolves to the node already decoded, closing the cycle.
  EXPECT_EQ(rex->owner.node, node);
}

TEST_F(CodecTest, FailedDecodeLeavesGraphUntouched) {
  graph_.Add(Person{});

  Json::Value pet(Json::objectValue);
  pet["recordType"] = "Pet";
  pet["identity"] = "x1";
  pet["name"] = "Rex";
  pet["weight"] = 3.5;

  // The pet decodes before the malformed friends list is reached.
  Json::Value json = PersonJson("p1", "Ada");
  json["pet"] = pet;
  json["friends"] = "everyone";

  NodeId node = kNullNode;
  Status s = Decode(json, Person::Type(), &node);
  ASSERT_TRUE(s.IsMappingError()) << s.ToString();
  EXPECT_EQ(s.field(), "friends");
  EXPECT_EQ(node, kNullNode);
  EXPECT_EQ(graph_.size(), 1u);
}

TEST_F(CodecTest, DecodedReferencesPointAtGraphNodes) {
  graph_.Add(Person{});
  graph_.Add(Person{});

  Json::Value pet(Json::objectValue);
  pet["recordType"] = "Pet";
  pet["identity"] = "x1";
  pet["name"] = "Rex";
  pet["weight"] = 3.5;
  pet["owner"] = RecordCodec::CycleMarker("p1");

  Json::Value json = PersonJson("p1", "Ada");
  json["pet"] = pet;
  json["friends"] = Json::Value(Json::arrayValue);
  json["friends"].append(RecordCodec::CycleMarker("p1"));

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Person::Type(), &node).ok());
  EXPECT_EQ(graph_.size(), 4u);
  const Person* p = graph_.Get(graph_.As<Person>(node));
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(graph_.Identity(node), std::optional<std::string>("p1"));
  const Pet* rex = graph_.Get(p->pet);
  ASSERT_NE(rex, nullptr);
  EXPECT_EQ(graph_.Identity(p->pet.node), std::optional<std::string>("x1"));
  EXPECT_EQ(rex->owner.node, node);
  ASSERT_EQ(p->friends.size(), 1u);
  EXPECT_EQ(p->friends[0].node, node);
}

TEST_F(CodecTest, SelfReferenceThroughCycleMarker) {
  Json::Value json = PersonJson("p1", "Ada");
  json["bestFriend"] = RecordCodec::CycleMarker("p1");

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Person::Type(), &node).ok());
  EXPECT_EQ(graph_.Get(graph_.As<Person>(node))->best_friend.node, node);
}

TEST_F(CodecTest, UnknownCycleMarkerIsMappingError) {
  Json::Value json = PersonJson("p1", "Ada");
  json["bestFriend"] = RecordCodec::CycleMarker("nobody");

  NodeId node = kNullNode;
  Status s = Decode(json, Person::Type(), &node);
  EXPECT_TRUE(s.IsMappingError());
  EXPECT_EQ(s.field(), "bestFriend");
}

TEST_F(CodecTest, UnresolvedReferenceIsMappingError) {
  Json::Value json = PersonJson("p1", "Ada");
  Json::Value ref(Json::objectValue);
  ref["identity"] = "p2";
  json["bestFriend"] = ref;

  NodeId node = kNullNode;
  EXPECT_TRUE(Decode(json, Person::Type(), &node).IsMappingError());
}

TEST_F(CodecTest, NullListElementsAreSkipped) {
  Json::Value json = PersonJson("p1", "Ada");
  json["friends"] = Json::Value(Json::arrayValue);
  json["friends"].append(Json::Value(Json::nullValue));
  json["friends"].append(RecordCodec::CycleMarker("p1"));

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Person::Type(), &node).ok());
  const Person* p = graph_.Get(graph_.As<Person>(node));
  ASSERT_EQ(p->friends.size(), 1u);
  EXPECT_EQ(p->friends[0].node, node);
}

TEST_F(CodecTest, CycleMarkerShape) {
  Json::Value marker = RecordCodec::CycleMarker("abc");
  EXPECT_TRUE(RecordCodec::IsCycleMarker(marker));
  EXPECT_EQ(marker["identity"].asString(), "abc");
  EXPECT_TRUE(marker["isCycle"].asBool());

  Json::Value plain(Json::objectValue);
  plain["identity"] = "abc";
  EXPECT_FALSE(RecordCodec::IsCycleMarker(plain));
}

// =============================================================================
// Custom codec
// =============================================================================

TEST_F(CodecTest, CustomEncoderReplacesLeaves) {
  Reading r;
  r.celsius = 100.0;
  r.station = "north";
  auto ref = graph_.Add(std::move(r));

  Record record;
  std::vector<ReferenceField> refs;
  ASSERT_TRUE(RecordCodec::EncodeLeaves(*graph_.Get(ref), &record, &refs).ok());
  EXPECT_FALSE(record.Has("celsius"));
  EXPECT_DOUBLE_EQ(std::get<double>(std::get<Primitive>(*record.Get("fahrenheit"))), 212.0);
  EXPECT_EQ(std::get<std::string>(std::get<Primitive>(*record.Get("station"))), "north");
  // Reference fields stay graph-managed.
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].field->name, "observer");
}

TEST_F(CodecTest, CustomDecoderReadsSanitizedRecord) {
  Json::Value json(Json::objectValue);
  json["recordType"] = "Reading";
  json["identity"] = "r1";
  json["fahrenheit"] = 32.0;
  json["station"] = "south";

  NodeId node = kNullNode;
  ASSERT_TRUE(Decode(json, Reading::Type(), &node).ok());
  const Reading* r = graph_.Get(graph_.As<Reading>(node));
  ASSERT_NE(r, nullptr);
  EXPECT_DOUBLE_EQ(r->celsius, 0.0);
  EXPECT_EQ(r->station, "south");
}

TEST_F(CodecTest, CustomDecoderFailureIsMappingError) {
  Json::Value json(Json::objectValue);
  json["recordType"] = "Reading";
  json["station"] = "south";

  NodeId node = kNullNode;
  Status s = Decode(json, Reading::Type(), &node);
  EXPECT_TRUE(s.IsMappingError());
  EXPECT_EQ(s.field(), "fahrenheit");
}

}  // namespace
}  // namespace tether
