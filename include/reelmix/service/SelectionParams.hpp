// Repository: Reelmix
// Component: Selection Params Mapping
// Purpose: Wire request fields to SelectionConfig, frame rate and SourceFile
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SERVICE_SELECTION_PARAMS_HPP_
#define REELMIX_SERVICE_SELECTION_PARAMS_HPP_

#include "reelmix/clip_selection.pb.h"
#include "reelmix/allocation/AllocationTypes.hpp"
#include "reelmix/output/RationalFps.hpp"
#include "reelmix/selection/SelectionConfig.hpp"

namespace reelmix::media {
class IDurationProbe;
}  // namespace reelmix::media

namespace reelmix::service {

// Maps wire params onto a config; unset fields keep their defaults.
selection::SelectionConfig ConfigFromParams(const v1::SelectionParams& params);

// Unset or invalid → 30000/1001.
output::RationalFps FpsFromParams(const v1::SelectionParams& params);

// A finite positive duration_sec is trusted as is; anything else goes through
// the probe. A non-zero timestamp_ms overrides the derived key.
allocation::SourceFile ResolveSourceSpec(const v1::SourceSpec& spec,
                                         media::IDurationProbe& probe);

}  // namespace reelmix::service

#endif  // REELMIX_SERVICE_SELECTION_PARAMS_HPP_
