// Repository: Reelmix
// Component: ClipSelection gRPC Service Implementation
// Copyright (c) 2026 Reelmix contributors

#include "clip_selection_service.h"

#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "reelmix/output/ClipListExport.hpp"
#include "reelmix/selection/ClipPlanner.hpp"
#include "reelmix/selection/FeatureScorer.hpp"
#include "reelmix/selection/RandomSource.hpp"
#include "reelmix/util/Logger.hpp"

namespace reelmix {
namespace service {

using util::Logger;

ClipSelectionServiceImpl::ClipSelectionServiceImpl(
    std::shared_ptr<media::IDurationProbe> probe)
    : probe_(std::move(probe)) {
  if (!probe_) {
    throw std::invalid_argument("ClipSelectionServiceImpl requires a duration probe");
  }
}

allocation::SourceFile ClipSelectionServiceImpl::ResolveSpec(const v1::SourceSpec& spec) {
  std::lock_guard<std::mutex> lock(probe_mutex_);
  return ResolveSourceSpec(spec, *probe_);
}

grpc::Status ClipSelectionServiceImpl::SelectClips(grpc::ServerContext* /*context*/,
                                                   const v1::SelectClipsRequest* request,
                                                   v1::SelectClipsResponse* response) {
  selection::SelectionConfig config = ConfigFromParams(request->params());
  auto check = selection::ValidateSelectionConfig(config);
  if (!check.valid) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, check.detail);
  }
  if (config.seed == 0) {
    config.seed = std::random_device{}();
  }

  std::vector<allocation::SourceFile> sources;
  sources.reserve(static_cast<size_t>(request->sources_size()));
  for (const auto& spec : request->sources()) {
    sources.push_back(ResolveSpec(spec));
  }

  selection::SeededRandomSource random(config.seed);
  selection::RandomFeatureScorer scorer(random);
  auto outcome = selection::PlanClips(sources, config, random, scorer);

  *response->mutable_result() = output::ToProto(outcome, FpsFromParams(request->params()));

  std::ostringstream oss;
  oss << "[ClipSelectionService] SELECT_CLIPS sources=" << sources.size()
      << " seed=" << config.seed
      << " status=" << selection::SelectionStatusToString(outcome.status)
      << " clips=" << outcome.clips.size();
  Logger::Info(oss.str());

  if (outcome.status == selection::SelectionStatus::kNoClips) {
    std::ostringstream msg;
    msg << "no clips selected; shortfall_sec=" << outcome.shortfall_sec;
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, msg.str());
  }
  return grpc::Status::OK;
}

}  // namespace service
}  // namespace reelmix
