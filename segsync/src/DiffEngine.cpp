#include "DiffEngine.h"

#include <stdexcept>

#include "Resample.h"

FullSnapshot FullSnapshot::fromVolume(const LabelVolume& vol, int64_t timestamp)
{
    FullSnapshot snap;
    snap.labels = vol.labels;
    snap.dimensions = vol.dimensions;
    snap.spacing = vol.spacing;
    snap.origin = vol.origin;
    snap.dataType = vol.dataType;
    snap.segmentNames = vol.segmentNames;
    snap.timestamp = timestamp;
    return snap;
}

DiffEngine::DiffEngine(double fullResyncRatio)
    : fullResyncRatio_(fullResyncRatio)
{
    if (!(fullResyncRatio > 0.0 && fullResyncRatio <= 1.0))
        throw std::invalid_argument("fullResyncRatio must be in (0, 1]");
}

DiffResult DiffEngine::computeDelta(const std::optional<LabelVolume>& previous,
                                    const LabelVolume& current,
                                    int64_t timestamp) const
{
    DiffResult result;

    if (!previous.has_value() || !previous->isConsistent())
    {
        result.kind = DiffKind::FullRequired;
        return result;
    }

    if (!current.isConsistent())
        throw std::invalid_argument("Current volume label array does not match its dimensions");

    // Bring the baseline onto the current grid so both peers keep diffing in
    // the same index space after a resize.
    std::optional<LabelVolume> resampled;
    const LabelVolume* base = &*previous;
    if (previous->dimensions != current.dimensions)
    {
        resampled = resampleNearest(*previous, current.dimensions);
        base = &*resampled;
    }

    const size_t total = current.voxelCount();
    if (total == 0)
        return result;

    const std::vector<uint32_t>& before = base->labels;
    const std::vector<uint32_t>& after = current.labels;

    size_t changed = 0;
    for (size_t i = 0; i < total; ++i)
        if (before[i] != after[i])
            ++changed;

    result.changedCount = changed;
    result.changeRatio = static_cast<double>(changed) / static_cast<double>(total);

    if (changed == 0)
        return result;

    if (result.changeRatio > fullResyncRatio_)
    {
        result.kind = DiffKind::FullRequired;
        return result;
    }

    Delta& delta = result.delta;
    delta.sourceDimensions = current.dimensions;
    delta.spacing = current.spacing;
    delta.origin = current.origin;
    delta.dataType = current.dataType;
    delta.segmentNames = current.segmentNames;
    delta.timestamp = timestamp;
    delta.changedIndices.reserve(changed);
    delta.changedValues.reserve(changed);

    const int dimY = current.dimensions[1];
    const int dimX = current.dimensions[2];
    size_t i = 0;
    for (int z = 0; z < current.dimensions[0]; ++z)
    {
        for (int y = 0; y < dimY; ++y)
        {
            for (int x = 0; x < dimX; ++x, ++i)
            {
                if (before[i] != after[i])
                {
                    delta.changedIndices.emplace_back(z, y, x);
                    delta.changedValues.push_back(after[i]);
                }
            }
        }
    }

    result.kind = DiffKind::Delta;
    return result;
}
