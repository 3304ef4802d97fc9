#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "LabelVolume.h"

/// Default fraction of changed voxels above which a full snapshot is sent
/// instead of a sparse delta.
constexpr double kDefaultFullResyncRatio = 0.30;

/// Sparse set of label changes against the last agreed baseline.
struct Delta
{
    std::vector<glm::ivec3> changedIndices;   // (z, y, x), parallel with changedValues
    std::vector<uint32_t> changedValues;
    glm::ivec3 sourceDimensions{0, 0, 0};     // grid the indices refer to
    glm::dvec3 spacing{1.0, 1.0, 1.0};
    glm::dvec3 origin{0.0, 0.0, 0.0};
    LabelType dataType = LabelType::UInt16;
    std::map<uint32_t, std::string> segmentNames;
    int64_t timestamp = 0;                    // epoch ms

    size_t size() const { return changedIndices.size(); }
};

/// Complete serialized volume, used to bootstrap and for large changes.
struct FullSnapshot
{
    std::vector<uint32_t> labels;
    glm::ivec3 dimensions{0, 0, 0};
    glm::dvec3 spacing{1.0, 1.0, 1.0};
    glm::dvec3 origin{0.0, 0.0, 0.0};
    LabelType dataType = LabelType::UInt16;
    std::map<uint32_t, std::string> segmentNames;
    int64_t timestamp = 0;

    static FullSnapshot fromVolume(const LabelVolume& vol, int64_t timestamp);
};

enum class DiffKind
{
    NoChange,      // nothing to send
    Delta,         // sparse delta in DiffResult::delta
    FullRequired   // no baseline, or too many voxels changed
};

struct DiffResult
{
    DiffKind kind = DiffKind::NoChange;
    Delta delta;                // populated only for DiffKind::Delta
    size_t changedCount = 0;
    double changeRatio = 0.0;   // changedCount / voxel count
};

/// Detects what changed in a label volume since the last synchronization.
class DiffEngine
{
public:
    /// @throws std::invalid_argument unless 0 < fullResyncRatio <= 1.
    explicit DiffEngine(double fullResyncRatio = kDefaultFullResyncRatio);

    double fullResyncRatio() const { return fullResyncRatio_; }

    /// Compare @p current against @p previous.
    ///
    /// - previous absent                  -> FullRequired
    /// - previous geometry differs        -> previous is nearest-neighbour
    ///                                       resampled onto current first
    /// - no voxel differs                 -> NoChange
    /// - changed / total > threshold      -> FullRequired
    /// - otherwise                        -> Delta (in flat index order)
    DiffResult computeDelta(const std::optional<LabelVolume>& previous,
                            const LabelVolume& current,
                            int64_t timestamp = 0) const;

private:
    double fullResyncRatio_;
};
