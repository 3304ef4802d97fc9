#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

#include "DiffEngine.h"
#include "LabelVolume.h"
#include "SyncErrors.h"

/// Outcome of applying one remote payload.
struct ApplyReport
{
    size_t applied = 0;     // voxels written
    size_t skipped = 0;     // indices outside the grid after rescaling
    bool rescaled = false;  // source geometry differed from the local volume
};

/// Sets a flag for the lifetime of the guard and restores the previous
/// value on scope exit, including when the apply throws.
class RemoteApplyGuard
{
public:
    explicit RemoteApplyGuard(std::atomic<bool>& flag)
        : flag_(flag), previous_(flag.exchange(true))
    {}
    ~RemoteApplyGuard() { flag_.store(previous_); }

    RemoteApplyGuard(const RemoteApplyGuard&) = delete;
    RemoteApplyGuard& operator=(const RemoteApplyGuard&) = delete;

private:
    std::atomic<bool>& flag_;
    bool previous_;
};

/// Merges remote payloads into the local volume and keeps the diffing
/// baseline in step, so remote voxels are never echoed back as local edits.
///
/// The baseline and the applying-remote flag are owned by the caller
/// (normally SyncSession); the Reconciler only holds references to them.
class Reconciler
{
public:
    Reconciler(std::optional<LabelVolume>& baseline, std::atomic<bool>& applyingRemote);

    /// Write every (index, value) pair of @p delta into @p local.
    ///
    /// Indices computed against a different grid are rescaled per axis by
    /// local / source dimensions with nearest-neighbour rounding.  Indices
    /// outside the source grid are skipped.  Duplicate indices: the last
    /// pair wins.  The same writes are made to the baseline (resampled onto
    /// the local grid first if needed), which leaves it equal to a copy of
    /// @p local when no local edits are pending.  An absent baseline stays
    /// absent.
    ///
    /// @throws ApplyError if index and value counts differ, the source grid
    ///         is empty while indices are present, or @p local is inconsistent.
    ApplyReport applyDelta(LabelVolume& local, const Delta& delta);

    /// Replace @p local wholesale with @p snapshot.  Segment names are
    /// merged: incoming entries win, names only known locally survive.
    /// The baseline becomes a copy of the result.
    /// @throws ApplyError if the label count does not match the dimensions.
    ApplyReport applyFull(LabelVolume& local, const FullSnapshot& snapshot);

    bool applyingRemote() const { return applyingRemote_.load(); }

private:
    std::optional<LabelVolume>& baseline_;
    std::atomic<bool>& applyingRemote_;
};

/// Merge @p incoming into @p names; incoming entries overwrite.
void mergeSegmentNames(std::map<uint32_t, std::string>& names,
                       const std::map<uint32_t, std::string>& incoming);
