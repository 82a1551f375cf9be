#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace narrative::model {

enum class CurationStatus : std::uint8_t {
  kAutoGenerated = 0,
  kManualDraft   = 1,
  kPendingReview = 2,
  kReviewed      = 3,
  kApproved      = 4,
  kPublished     = 5,
  kArchived      = 6,
};

enum class CurationSource : std::uint8_t {
  kPipeline       = 0,
  kManual         = 1,
  kHybridAssisted = 2,
};

enum class ActorType : std::uint8_t {
  kUser     = 0,
  kSystem   = 1,
  kPipeline = 2,
};

enum class ClusterGroupStatus : std::uint8_t {
  kDraft         = 0,
  kPendingReview = 1,
  kApproved      = 2,
};

inline constexpr std::array<CurationStatus, 7> kAllCurationStatuses = {
    CurationStatus::kAutoGenerated, CurationStatus::kManualDraft, CurationStatus::kPendingReview, CurationStatus::kReviewed,
    CurationStatus::kApproved,      CurationStatus::kPublished,   CurationStatus::kArchived,
};

/*
  Editorial transition table. Every (from, to) pair is decided here;
  staying in the same status is always allowed. archived has no exits.
*/
constexpr bool CanTransition(CurationStatus from, CurationStatus to) {
  if (from == to) {
    return true;
  }

  switch (from) {
    case CurationStatus::kAutoGenerated:
      return to == CurationStatus::kPendingReview || to == CurationStatus::kApproved;
    case CurationStatus::kManualDraft:
      return to == CurationStatus::kPendingReview || to == CurationStatus::kArchived;
    case CurationStatus::kPendingReview:
      return to == CurationStatus::kReviewed || to == CurationStatus::kApproved || to == CurationStatus::kManualDraft;
    case CurationStatus::kReviewed:
      return to == CurationStatus::kApproved || to == CurationStatus::kManualDraft || to == CurationStatus::kPendingReview;
    case CurationStatus::kApproved:
      return to == CurationStatus::kPublished || to == CurationStatus::kReviewed;
    case CurationStatus::kPublished:
      return to == CurationStatus::kArchived || to == CurationStatus::kReviewed;
    case CurationStatus::kArchived:
      return false;
  }
  return false;
}

// Status a narrative may be created in for a given provenance.
constexpr bool IsEntryStatus(CurationSource source, CurationStatus status) {
  switch (source) {
    case CurationSource::kPipeline:
      return status == CurationStatus::kAutoGenerated;
    case CurationSource::kManual:
      return status == CurationStatus::kManualDraft;
    case CurationSource::kHybridAssisted:
      return status == CurationStatus::kManualDraft || status == CurationStatus::kAutoGenerated;
  }
  return false;
}

// Cluster groups only move forward, one stage at a time.
constexpr std::optional<ClusterGroupStatus> NextStage(ClusterGroupStatus status) {
  switch (status) {
    case ClusterGroupStatus::kDraft:
      return ClusterGroupStatus::kPendingReview;
    case ClusterGroupStatus::kPendingReview:
      return ClusterGroupStatus::kApproved;
    case ClusterGroupStatus::kApproved:
      return std::nullopt;
  }
  return std::nullopt;
}

constexpr std::string_view ToString(CurationStatus status) {
  switch (status) {
    case CurationStatus::kAutoGenerated:
      return "auto_generated";
    case CurationStatus::kManualDraft:
      return "manual_draft";
    case CurationStatus::kPendingReview:
      return "pending_review";
    case CurationStatus::kReviewed:
      return "reviewed";
    case CurationStatus::kApproved:
      return "approved";
    case CurationStatus::kPublished:
      return "published";
    case CurationStatus::kArchived:
      return "archived";
  }
  return "unknown";
}

constexpr std::string_view ToString(CurationSource source) {
  switch (source) {
    case CurationSource::kPipeline:
      return "pipeline";
    case CurationSource::kManual:
      return "manual";
    case CurationSource::kHybridAssisted:
      return "hybrid_assisted";
  }
  return "unknown";
}

constexpr std::string_view ToString(ActorType actor_type) {
  switch (actor_type) {
    case ActorType::kUser:
      return "user";
    case ActorType::kSystem:
      return "system";
    case ActorType::kPipeline:
      return "pipeline";
  }
  return "unknown";
}

constexpr std::string_view ToString(ClusterGroupStatus status) {
  switch (status) {
    case ClusterGroupStatus::kDraft:
      return "draft";
    case ClusterGroupStatus::kPendingReview:
      return "pending_review";
    case ClusterGroupStatus::kApproved:
      return "approved";
  }
  return "unknown";
}

constexpr std::optional<CurationStatus> ParseCurationStatus(std::string_view value) {
  for (auto status : kAllCurationStatuses) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

constexpr std::optional<CurationSource> ParseCurationSource(std::string_view value) {
  if (value == "pipeline") return CurationSource::kPipeline;
  if (value == "manual") return CurationSource::kManual;
  if (value == "hybrid_assisted") return CurationSource::kHybridAssisted;
  return std::nullopt;
}

constexpr std::optional<ActorType> ParseActorType(std::string_view value) {
  if (value == "user") return ActorType::kUser;
  if (value == "system") return ActorType::kSystem;
  if (value == "pipeline") return ActorType::kPipeline;
  return std::nullopt;
}

constexpr std::optional<ClusterGroupStatus> ParseClusterGroupStatus(std::string_view value) {
  if (value == "draft") return ClusterGroupStatus::kDraft;
  if (value == "pending_review") return ClusterGroupStatus::kPendingReview;
  if (value == "approved") return ClusterGroupStatus::kApproved;
  return std::nullopt;
}

} // namespace narrative::model
