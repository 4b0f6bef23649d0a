#pragma once

#include "Types.hpp"

#include <string>
#include <vector>

namespace va {

/// Produces prediction maps for one stored recording.
///
/// Implementations throw (normally MediaError) when the audio cannot be
/// analysed.  Results are never written directly; callers hand them to
/// PersistenceCoordinator::apply_predictions().
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    virtual std::vector<PredictionResult> analyze(const std::string& audio_path,
                                                  ProgressCallback progress) = 0;

    /// Short name for log lines.
    virtual std::string name() const = 0;
};

} // namespace va
