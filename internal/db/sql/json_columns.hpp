#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <vector>

#include "internal/db/model/hierarchy_cache_record.hpp"
#include "internal/db/model/narrative_record.hpp"

namespace narrative::db::sql {

/*
  JSON column codecs shared by the SQL backends.

  SQLite stores these as TEXT, Postgres as JSONB. An empty or NULL
  column decodes to an empty value. Malformed JSON throws
  std::runtime_error.
*/

std::string              EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(const std::string& json);

std::string                       EncodeNotes(const std::vector<model::CurationNote>& notes);
std::vector<model::CurationNote> DecodeNotes(const std::string& json);

std::string                          EncodeMembers(const std::vector<model::HierarchyMember>& members);
std::vector<model::HierarchyMember> DecodeMembers(const std::string& json);

std::string              EncodeStruct(const google::protobuf::Struct& value);
google::protobuf::Struct DecodeStruct(const std::string& json);

} // namespace narrative::db::sql
