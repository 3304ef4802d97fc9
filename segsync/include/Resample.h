#pragma once

#include <vector>

#include <glm/glm.hpp>

#include "LabelVolume.h"

/// Nearest-neighbour index mapping between two grids that cover the same
/// extent with different voxel counts.  No interpolation: every output
/// voxel copies exactly one input voxel, so labels are never blended.

/// Source index sampled by destination index @p dstIndex when a grid of
/// @p srcDim voxels is resampled onto @p dstDim voxels.
/// scale = dstDim / srcDim, src = round(dstIndex / scale), clamped to
/// [0, srcDim - 1].
int mapIndexNearest(int dstIndex, int srcDim, int dstDim);

/// Forward mapping of a single index from a grid of @p srcDim voxels into
/// a grid of @p dstDim voxels: round(srcIndex * dstDim / srcDim), clamped
/// to [0, dstDim - 1].
int rescaleIndex(int srcIndex, int srcDim, int dstDim);

/// Per-axis rescale of a (z, y, x) index.
glm::ivec3 rescaleIndex(const glm::ivec3& index, const glm::ivec3& srcDims,
                        const glm::ivec3& dstDims);

/// Resample @p src onto @p dstDims.  Spacing is scaled so the physical
/// extent is unchanged; origin, names and element type are kept.
/// Returns a copy when the dimensions already match.
LabelVolume resampleNearest(const LabelVolume& src, const glm::ivec3& dstDims);

/// Lookup table of mapIndexNearest() for every destination index.
std::vector<int> nearestIndexTable(int srcDim, int dstDim);
