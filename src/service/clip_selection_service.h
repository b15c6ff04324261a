// Repository: Reelmix
// Component: ClipSelection gRPC Service Implementation
// Purpose: Runs a selection per request and returns the ordered clip list.
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_CLIP_SELECTION_SERVICE_H_
#define REELMIX_CLIP_SELECTION_SERVICE_H_

#include <memory>
#include <mutex>

#include <grpcpp/grpcpp.h>

#include "reelmix/clip_selection.grpc.pb.h"
#include "reelmix/clip_selection.pb.h"
#include "reelmix/allocation/AllocationTypes.hpp"
#include "reelmix/media/DurationProbe.hpp"
#include "reelmix/service/SelectionParams.hpp"

namespace reelmix {
namespace service {

// ClipSelectionServiceImpl implements the service defined in
// clip_selection.proto. It is a thin adapter over PlanClips(); each request
// gets its own random source and trackers, so requests share nothing but the
// duration probe.
class ClipSelectionServiceImpl final : public v1::ClipSelectionService::Service {
 public:
  explicit ClipSelectionServiceImpl(std::shared_ptr<media::IDurationProbe> probe);

  ClipSelectionServiceImpl(const ClipSelectionServiceImpl&) = delete;
  ClipSelectionServiceImpl& operator=(const ClipSelectionServiceImpl&) = delete;

  grpc::Status SelectClips(grpc::ServerContext* context,
                           const v1::SelectClipsRequest* request,
                           v1::SelectClipsResponse* response) override;

 private:
  allocation::SourceFile ResolveSpec(const v1::SourceSpec& spec);

  std::shared_ptr<media::IDurationProbe> probe_;
  std::mutex probe_mutex_;  // probe caches are not thread-safe
};

}  // namespace service
}  // namespace reelmix

#endif  // REELMIX_CLIP_SELECTION_SERVICE_H_
