#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/curation.hpp"

namespace narrative::db::model {

struct CurationNote {
  std::string action;
  std::string detail;
  std::string actor;
  uint64_t    timestamp_ms = 0;

  bool operator==(const CurationNote&) const = default;
};

struct NarrativeRecord {
  std::string                id;
  std::string                display_id;
  std::optional<std::string> parent_id;

  std::string title;
  std::string summary;

  narrative::model::CurationSource source = narrative::model::CurationSource::kPipeline;
  narrative::model::CurationStatus status = narrative::model::CurationStatus::kAutoGenerated;

  std::optional<std::string> curator_id;
  std::optional<std::string> reviewer_id;
  std::optional<std::string> published_by;

  int32_t                 editorial_priority = 5;
  std::optional<uint64_t> review_deadline_ms;
  std::optional<uint64_t> published_at_ms;

  std::vector<std::string>  manual_cluster_ids;
  std::vector<CurationNote> curation_notes;
  std::string               confidence_rating;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t version       = 1;

  bool IsRoot() const {
    return !parent_id.has_value();
  }

  bool IsManualRoot() const {
    return IsRoot() && source == narrative::model::CurationSource::kManual;
  }

  bool operator==(const NarrativeRecord&) const = default;
};

} // namespace narrative::db::model
