#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>

#include "internal/model/curation.hpp"

namespace narrative::db::model {

/*
  One immutable audit entry. old_values/new_values are JSON objects.
  sequence is assigned by the repository and is strictly increasing in
  commit order.
*/
struct CurationLogRecord {
  uint64_t    sequence = 0;
  std::string id;
  std::string narrative_id;
  std::string action_type;

  google::protobuf::Struct old_values;
  google::protobuf::Struct new_values;

  std::string                 reason;
  std::string                 actor_id;
  narrative::model::ActorType actor_type = narrative::model::ActorType::kUser;
  std::string                 session_id;
  uint64_t                    created_at_ms = 0;
};

} // namespace narrative::db::model
