#include "Resample.h"

#include <algorithm>
#include <cmath>

int mapIndexNearest(int dstIndex, int srcDim, int dstDim)
{
    if (srcDim <= 0 || dstDim <= 0)
        return 0;
    double scale = static_cast<double>(dstDim) / static_cast<double>(srcDim);
    int src = static_cast<int>(std::round(dstIndex / scale));
    return std::clamp(src, 0, srcDim - 1);
}

int rescaleIndex(int srcIndex, int srcDim, int dstDim)
{
    if (srcDim <= 0 || dstDim <= 0)
        return 0;
    if (srcDim == dstDim)
        return std::clamp(srcIndex, 0, dstDim - 1);
    double scale = static_cast<double>(dstDim) / static_cast<double>(srcDim);
    int dst = static_cast<int>(std::round(srcIndex * scale));
    return std::clamp(dst, 0, dstDim - 1);
}

glm::ivec3 rescaleIndex(const glm::ivec3& index, const glm::ivec3& srcDims,
                        const glm::ivec3& dstDims)
{
    return glm::ivec3(rescaleIndex(index[0], srcDims[0], dstDims[0]),
                      rescaleIndex(index[1], srcDims[1], dstDims[1]),
                      rescaleIndex(index[2], srcDims[2], dstDims[2]));
}

std::vector<int> nearestIndexTable(int srcDim, int dstDim)
{
    std::vector<int> table(static_cast<size_t>(std::max(dstDim, 0)));
    for (int i = 0; i < dstDim; ++i)
        table[i] = mapIndexNearest(i, srcDim, dstDim);
    return table;
}

LabelVolume resampleNearest(const LabelVolume& src, const glm::ivec3& dstDims)
{
    if (src.dimensions == dstDims)
        return src.snapshot();

    LabelVolume out(dstDims, src.dataType);
    out.origin = src.origin;
    out.segmentNames = src.segmentNames;
    for (int axis = 0; axis < 3; ++axis)
    {
        if (dstDims[axis] > 0 && src.dimensions[axis] > 0)
            out.spacing[axis] = src.spacing[axis] * src.dimensions[axis] /
                                static_cast<double>(dstDims[axis]);
        else
            out.spacing[axis] = src.spacing[axis];
    }

    // An empty source has nothing to sample; the output stays unlabeled.
    if (src.voxelCount() == 0 || out.voxelCount() == 0)
        return out;

    std::vector<int> zMap = nearestIndexTable(src.dimensions[0], dstDims[0]);
    std::vector<int> yMap = nearestIndexTable(src.dimensions[1], dstDims[1]);
    std::vector<int> xMap = nearestIndexTable(src.dimensions[2], dstDims[2]);

    size_t di = 0;
    for (int z = 0; z < dstDims[0]; ++z)
    {
        for (int y = 0; y < dstDims[1]; ++y)
        {
            size_t rowBase = src.flatIndex(zMap[z], yMap[y], 0);
            for (int x = 0; x < dstDims[2]; ++x)
                out.labels[di++] = src.labels[rowBase + xMap[x]];
        }
    }
    return out;
}
