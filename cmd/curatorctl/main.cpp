#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "narrative/curation/v1.hpp"
#include "narrative/curation/v1/curation_service.grpc.pb.h"

using namespace narrative::curation::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  curatorctl <addr> ingest <title> <summary> [confidence]\n"
            << "  curatorctl <addr> create-parent <curator> <title> <summary> [priority] [cluster_id,...]\n"
            << "  curatorctl <addr> assign <parent_id> <curator> <child_id,...> [rationale]\n"
            << "  curatorctl <addr> detach <child_id> <curator> [reason]\n"
            << "  curatorctl <addr> status <id> <status> <actor> [notes]\n"
            << "  curatorctl <addr> note <id> <actor> <detail> [action]\n"
            << "  curatorctl <addr> priority <id> <1-5> <actor>\n"
            << "  curatorctl <addr> reviewer <id> <reviewer> <actor>\n"
            << "  curatorctl <addr> deadline <id> <unix_ms|none> <actor>\n"
            << "  curatorctl <addr> delete <id> <actor> [reason]\n"
            << "  curatorctl <addr> get <id>\n"
            << "  curatorctl <addr> children <id>\n"
            << "  curatorctl <addr> details <id>\n"
            << "  curatorctl <addr> audit <id>\n"
            << "  curatorctl <addr> group-create <curator> <name> <cluster_id,...> [rationale]\n"
            << "  curatorctl <addr> group-link <group_id> <parent_id> <actor>\n"
            << "  curatorctl <addr> group-approve <group_id> <reviewer> [notes]\n"
            << "  curatorctl <addr> groups [parent_id]\n"
            << "  curatorctl <addr> dashboard [limit]\n"
            << "  curatorctl <addr> pending [reviewer]\n"
            << "  curatorctl <addr> validate\n"
            << "  curatorctl <addr> integrity\n"
            << "  curatorctl <addr> cache [parent_id]\n"
            << "  curatorctl <addr> refresh\n"
            << "  curatorctl <addr> stats\n"
            << "  curatorctl <addr> health\n";
}

static std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream        in(value);
  std::string              item;
  while (std::getline(in, item, ',')) {
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

static std::optional<CurationStatus> ParseStatus(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  CurationStatus status;
  if (!CurationStatus_Parse("CURATION_STATUS_" + value, &status) || status == CURATION_STATUS_UNSPECIFIED) {
    return std::nullopt;
  }
  return status;
}

static std::string Arg(int argc, char** argv, int index) {
  return index < argc ? std::string(argv[index]) : std::string();
}

static int Print(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }

  std::string                               json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto print_status      = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!print_status.ok()) {
    std::cerr << "failed to render response: " << print_status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = CurationService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "ingest") {
    if (argc < 5) return 1;

    IngestPipelineNarrativeRequest req;
    req.set_title(argv[3]);
    req.set_summary(argv[4]);
    req.set_confidence_rating(Arg(argc, argv, 5));

    NarrativeResponse resp;
    return Print(stub->IngestPipelineNarrative(&ctx, req, &resp), resp);
  }

  if (cmd == "create-parent") {
    if (argc < 6) return 1;

    CreateManualParentRequest req;
    req.set_curator_id(argv[3]);
    req.set_title(argv[4]);
    req.set_summary(argv[5]);
    if (argc >= 7) req.set_editorial_priority(std::stoi(argv[6]));
    for (const auto& cluster_id : SplitList(Arg(argc, argv, 7))) {
      req.add_cluster_ids(cluster_id);
    }

    NarrativeResponse resp;
    return Print(stub->CreateManualParent(&ctx, req, &resp), resp);
  }

  if (cmd == "assign") {
    if (argc < 6) return 1;

    AssignChildrenRequest req;
    req.set_parent_id(argv[3]);
    req.set_curator_id(argv[4]);
    for (const auto& child_id : SplitList(argv[5])) {
      req.add_child_ids(child_id);
    }
    req.set_rationale(Arg(argc, argv, 6));

    AssignChildrenResponse resp;
    return Print(stub->AssignChildren(&ctx, req, &resp), resp);
  }

  if (cmd == "detach") {
    if (argc < 5) return 1;

    DetachChildRequest req;
    req.set_child_id(argv[3]);
    req.set_curator_id(argv[4]);
    req.set_reason(Arg(argc, argv, 5));

    NarrativeResponse resp;
    return Print(stub->DetachChild(&ctx, req, &resp), resp);
  }

  if (cmd == "status") {
    if (argc < 6) return 1;

    auto status = ParseStatus(argv[4]);
    if (!status) {
      std::cerr << "unknown status: " << argv[4] << "\n";
      return 1;
    }

    UpdateStatusRequest req;
    req.set_narrative_id(argv[3]);
    req.set_status(*status);
    req.set_actor_id(argv[5]);
    req.set_notes(Arg(argc, argv, 6));

    UpdateStatusResponse resp;
    return Print(stub->UpdateStatus(&ctx, req, &resp), resp);
  }

  if (cmd == "note") {
    if (argc < 6) return 1;

    AddCurationNoteRequest req;
    req.set_narrative_id(argv[3]);
    req.set_actor_id(argv[4]);
    req.set_detail(argv[5]);
    req.set_action(Arg(argc, argv, 6));

    NarrativeResponse resp;
    return Print(stub->AddCurationNote(&ctx, req, &resp), resp);
  }

  if (cmd == "priority") {
    if (argc < 6) return 1;

    SetEditorialPriorityRequest req;
    req.set_narrative_id(argv[3]);
    req.set_editorial_priority(std::stoi(argv[4]));
    req.set_actor_id(argv[5]);

    NarrativeResponse resp;
    return Print(stub->SetEditorialPriority(&ctx, req, &resp), resp);
  }

  if (cmd == "reviewer") {
    if (argc < 6) return 1;

    AssignReviewerRequest req;
    req.set_narrative_id(argv[3]);
    req.set_reviewer_id(argv[4]);
    req.set_actor_id(argv[5]);

    NarrativeResponse resp;
    return Print(stub->AssignReviewer(&ctx, req, &resp), resp);
  }

  if (cmd == "deadline") {
    if (argc < 6) return 1;

    SetReviewDeadlineRequest req;
    req.set_narrative_id(argv[3]);
    if (std::string(argv[4]) != "none") req.set_review_deadline_ms(std::stoull(argv[4]));
    req.set_actor_id(argv[5]);

    NarrativeResponse resp;
    return Print(stub->SetReviewDeadline(&ctx, req, &resp), resp);
  }

  if (cmd == "delete") {
    if (argc < 5) return 1;

    DeleteNarrativeRequest req;
    req.set_narrative_id(argv[3]);
    req.set_actor_id(argv[4]);
    req.set_reason(Arg(argc, argv, 5));

    DeleteNarrativeResponse resp;
    return Print(stub->DeleteNarrative(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "get" || cmd == "children" || cmd == "details" || cmd == "audit") {
    if (argc < 4) return 1;

    GetNarrativeRequest req;
    req.set_narrative_id(argv[3]);

    if (cmd == "get") {
      NarrativeResponse resp;
      return Print(stub->GetNarrative(&ctx, req, &resp), resp);
    }
    if (cmd == "children") {
      GetChildrenResponse resp;
      return Print(stub->GetChildren(&ctx, req, &resp), resp);
    }
    if (cmd == "details") {
      NarrativeDetailsResponse resp;
      return Print(stub->GetNarrativeDetails(&ctx, req, &resp), resp);
    }
    AuditTrailResponse resp;
    return Print(stub->GetAuditTrail(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "group-create") {
    if (argc < 6) return 1;

    CreateClusterGroupRequest req;
    req.set_curator_id(argv[3]);
    req.set_name(argv[4]);
    for (const auto& cluster_id : SplitList(argv[5])) {
      req.add_cluster_ids(cluster_id);
    }
    req.set_rationale(Arg(argc, argv, 6));

    ClusterGroupResponse resp;
    return Print(stub->CreateClusterGroup(&ctx, req, &resp), resp);
  }

  if (cmd == "group-link") {
    if (argc < 6) return 1;

    LinkClusterGroupRequest req;
    req.set_group_id(argv[3]);
    req.set_parent_narrative_id(argv[4]);
    req.set_actor_id(argv[5]);

    ClusterGroupResponse resp;
    return Print(stub->LinkClusterGroup(&ctx, req, &resp), resp);
  }

  if (cmd == "group-approve") {
    if (argc < 5) return 1;

    ApproveClusterGroupRequest req;
    req.set_group_id(argv[3]);
    req.set_reviewer_id(argv[4]);
    req.set_review_notes(Arg(argc, argv, 5));

    ClusterGroupResponse resp;
    return Print(stub->ApproveClusterGroup(&ctx, req, &resp), resp);
  }

  if (cmd == "groups") {
    ListClusterGroupsRequest req;
    if (argc >= 4) req.set_parent_narrative_id(argv[3]);

    ListClusterGroupsResponse resp;
    return Print(stub->ListClusterGroups(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------

  if (cmd == "dashboard") {
    DashboardRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));

    DashboardResponse resp;
    return Print(stub->GetDashboard(&ctx, req, &resp), resp);
  }

  if (cmd == "pending") {
    PendingReviewsRequest req;
    if (argc >= 4) req.set_reviewer_id(argv[3]);

    PendingReviewsResponse resp;
    return Print(stub->GetPendingReviews(&ctx, req, &resp), resp);
  }

  if (cmd == "validate") {
    WorkflowReport resp;
    return Print(stub->ValidateWorkflow(&ctx, ValidateWorkflowRequest{}, &resp), resp);
  }

  if (cmd == "integrity") {
    IntegrityReport resp;
    return Print(stub->ValidateIntegrity(&ctx, ValidateIntegrityRequest{}, &resp), resp);
  }

  if (cmd == "cache") {
    HierarchyCacheRequest req;
    req.set_parent_id(Arg(argc, argv, 3));

    HierarchyCacheResponse resp;
    return Print(stub->GetHierarchyCache(&ctx, req, &resp), resp);
  }

  if (cmd == "refresh") {
    RefreshHierarchyCacheResponse resp;
    return Print(stub->RefreshHierarchyCache(&ctx, RefreshHierarchyCacheRequest{}, &resp), resp);
  }

  if (cmd == "stats") {
    HierarchyStats resp;
    return Print(stub->GetHierarchyStats(&ctx, HierarchyStatsRequest{}, &resp), resp);
  }

  if (cmd == "health") {
    HealthCheckResponse resp;
    return Print(stub->HealthCheck(&ctx, HealthCheckRequest{}, &resp), resp);
  }

  Usage();
  return 1;
}
