#include "Reconciler.h"

#include <string>

#include "Resample.h"

void mergeSegmentNames(std::map<uint32_t, std::string>& names,
                       const std::map<uint32_t, std::string>& incoming)
{
    for (const auto& [label, name] : incoming)
        names[label] = name;
}

Reconciler::Reconciler(std::optional<LabelVolume>& baseline,
                       std::atomic<bool>& applyingRemote)
    : baseline_(baseline), applyingRemote_(applyingRemote)
{}

ApplyReport Reconciler::applyDelta(LabelVolume& local, const Delta& delta)
{
    if (delta.changedIndices.size() != delta.changedValues.size())
        throw ApplyError("Delta has " + std::to_string(delta.changedIndices.size()) +
                         " indices but " + std::to_string(delta.changedValues.size()) +
                         " values");
    if (!local.isConsistent())
        throw ApplyError("Local volume label array does not match its dimensions");

    const glm::ivec3 src = delta.sourceDimensions;
    if (!delta.changedIndices.empty() && voxelCountFor(src) == 0)
        throw ApplyError("Delta carries indices but no source dimensions");

    RemoteApplyGuard guard(applyingRemote_);

    ApplyReport report;
    report.rescaled = (src != local.dimensions);

    // Keep the baseline on the local grid so the writes below line up.
    if (baseline_.has_value() && baseline_->isConsistent() &&
        baseline_->dimensions != local.dimensions)
        baseline_ = resampleNearest(*baseline_, local.dimensions);
    bool trackBaseline = baseline_.has_value() && baseline_->isConsistent();

    for (size_t i = 0; i < delta.changedIndices.size(); ++i)
    {
        glm::ivec3 idx = delta.changedIndices[i];
        if (idx[0] < 0 || idx[0] >= src[0] ||
            idx[1] < 0 || idx[1] >= src[1] ||
            idx[2] < 0 || idx[2] >= src[2])
        {
            ++report.skipped;
            continue;
        }
        if (report.rescaled)
            idx = rescaleIndex(idx, src, local.dimensions);
        if (!local.contains(idx[0], idx[1], idx[2]))
        {
            ++report.skipped;
            continue;
        }

        size_t flat = local.flatIndex(idx[0], idx[1], idx[2]);
        local.labels[flat] = delta.changedValues[i];
        if (trackBaseline)
            baseline_->labels[flat] = delta.changedValues[i];
        ++report.applied;
    }

    mergeSegmentNames(local.segmentNames, delta.segmentNames);

    // Without an agreed baseline the next send must be a full snapshot, so
    // a delta never seeds one.
    if (trackBaseline)
        mergeSegmentNames(baseline_->segmentNames, delta.segmentNames);

    return report;
}

ApplyReport Reconciler::applyFull(LabelVolume& local, const FullSnapshot& snapshot)
{
    if (snapshot.dimensions[0] < 0 || snapshot.dimensions[1] < 0 || snapshot.dimensions[2] < 0)
        throw ApplyError("Snapshot has negative dimensions");
    if (snapshot.labels.size() != voxelCountFor(snapshot.dimensions))
        throw ApplyError("Snapshot holds " + std::to_string(snapshot.labels.size()) +
                         " labels, dimensions require " +
                         std::to_string(voxelCountFor(snapshot.dimensions)));

    RemoteApplyGuard guard(applyingRemote_);

    ApplyReport report;
    report.rescaled = (snapshot.dimensions != local.dimensions);

    local.dimensions = snapshot.dimensions;
    local.spacing = snapshot.spacing;
    local.origin = snapshot.origin;
    local.dataType = snapshot.dataType;
    local.labels = snapshot.labels;
    mergeSegmentNames(local.segmentNames, snapshot.segmentNames);
    report.applied = local.labels.size();

    baseline_ = local.snapshot();
    return report;
}
