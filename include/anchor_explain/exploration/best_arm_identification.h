#pragma once

// =============================================================================
// Anchor Explain - Best-Arm Identification
// =============================================================================
//
// A pure-exploration bandit strategy: given competing candidates, drive
// further sampling until the top-N candidates by precision are identified
// with probability at least 1 - delta.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/error.h"
#include "anchor_explain/sampling/sampling_service.h"

#include <cstddef>
#include <string_view>

namespace anchor {
namespace exploration {

class BestAnchorIdentification {
  public:
    virtual ~BestAnchorIdentification() = default;

    /// Return (at most) top_n candidates that contain the true top_n with
    /// probability >= 1 - delta. All sampling goes through `service`.
    [[nodiscard]] virtual Result<CandidateList> identify(const CandidateList& candidates,
                                                         sampling::SamplingService& service,
                                                         double delta, size_t top_n) = 0;

    /// Name used in log messages
    [[nodiscard]] virtual std::string_view name() const { return "BestAnchorIdentification"; }
};

}  // namespace exploration
}  // namespace anchor
