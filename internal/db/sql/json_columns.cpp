#include "json_columns.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace narrative::db::sql {

namespace {

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message message;
  if (json.empty()) {
    return message;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("json decode failed: " + std::string(status.message()));
  }
  return message;
}

const google::protobuf::Value* Field(const google::protobuf::Struct& object, const char* name) {
  const auto it = object.fields().find(name);
  return it == object.fields().end() ? nullptr : &it->second;
}

std::string StringField(const google::protobuf::Struct& object, const char* name) {
  const auto* value = Field(object, name);
  return value && value->has_string_value() ? value->string_value() : std::string{};
}

uint64_t MillisField(const google::protobuf::Struct& object, const char* name) {
  const auto* value = Field(object, name);
  return value && value->has_number_value() ? static_cast<uint64_t>(value->number_value()) : 0;
}

} // namespace

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }
  return ToJson(list);
}

std::vector<std::string> DecodeStringList(const std::string& json) {
  const auto               list = FromJson<google::protobuf::ListValue>(json);
  std::vector<std::string> out;
  out.reserve(list.values_size());
  for (const auto& value : list.values()) {
    out.push_back(value.string_value());
  }
  return out;
}

std::string EncodeNotes(const std::vector<model::CurationNote>& notes) {
  google::protobuf::ListValue list;
  for (const auto& note : notes) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["action"].set_string_value(note.action);
    fields["detail"].set_string_value(note.detail);
    fields["actor"].set_string_value(note.actor);
    fields["timestamp_ms"].set_number_value(static_cast<double>(note.timestamp_ms));
  }
  return ToJson(list);
}

std::vector<model::CurationNote> DecodeNotes(const std::string& json) {
  const auto                        list = FromJson<google::protobuf::ListValue>(json);
  std::vector<model::CurationNote> out;
  out.reserve(list.values_size());
  for (const auto& value : list.values()) {
    const auto&         object = value.struct_value();
    model::CurationNote note;
    note.action       = StringField(object, "action");
    note.detail       = StringField(object, "detail");
    note.actor        = StringField(object, "actor");
    note.timestamp_ms = MillisField(object, "timestamp_ms");
    out.push_back(std::move(note));
  }
  return out;
}

std::string EncodeMembers(const std::vector<model::HierarchyMember>& members) {
  google::protobuf::ListValue list;
  for (const auto& member : members) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["id"].set_string_value(member.id);
    fields["title"].set_string_value(member.title);
    fields["created_at_ms"].set_number_value(static_cast<double>(member.created_at_ms));
    fields["updated_at_ms"].set_number_value(static_cast<double>(member.updated_at_ms));
    fields["confidence_rating"].set_string_value(member.confidence_rating);
  }
  return ToJson(list);
}

std::vector<model::HierarchyMember> DecodeMembers(const std::string& json) {
  const auto                           list = FromJson<google::protobuf::ListValue>(json);
  std::vector<model::HierarchyMember> out;
  out.reserve(list.values_size());
  for (const auto& value : list.values()) {
    const auto&            object = value.struct_value();
    model::HierarchyMember member;
    member.id                = StringField(object, "id");
    member.title             = StringField(object, "title");
    member.created_at_ms     = MillisField(object, "created_at_ms");
    member.updated_at_ms     = MillisField(object, "updated_at_ms");
    member.confidence_rating = StringField(object, "confidence_rating");
    out.push_back(std::move(member));
  }
  return out;
}

std::string EncodeStruct(const google::protobuf::Struct& value) {
  return ToJson(value);
}

google::protobuf::Struct DecodeStruct(const std::string& json) {
  return FromJson<google::protobuf::Struct>(json);
}

} // namespace narrative::db::sql
