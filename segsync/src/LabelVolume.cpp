#include "LabelVolume.h"

#include <algorithm>
#include <stdexcept>
#include <string>

size_t voxelCountFor(const glm::ivec3& dims)
{
    if (dims.x <= 0 || dims.y <= 0 || dims.z <= 0)
        return 0;
    return static_cast<size_t>(dims.x) * static_cast<size_t>(dims.y) *
           static_cast<size_t>(dims.z);
}

LabelVolume::LabelVolume(const glm::ivec3& dims, LabelType type)
    : dimensions(dims), dataType(type)
{
    if (dims.x < 0 || dims.y < 0 || dims.z < 0)
        throw std::invalid_argument("Negative volume dimension");
    labels.assign(voxelCountFor(dims), 0u);
}

LabelVolume::LabelVolume(const glm::ivec3& dims, std::vector<uint32_t> data,
                         LabelType type)
    : dimensions(dims), labels(std::move(data)), dataType(type)
{
    if (dims.x < 0 || dims.y < 0 || dims.z < 0)
        throw std::invalid_argument("Negative volume dimension");
    if (labels.size() != voxelCountFor(dims))
        throw std::invalid_argument(
            "Label array size " + std::to_string(labels.size()) +
            " does not match dimensions (" + std::to_string(dims[0]) + "," +
            std::to_string(dims[1]) + "," + std::to_string(dims[2]) + ")");
}

size_t LabelVolume::voxelCount() const
{
    return voxelCountFor(dimensions);
}

bool LabelVolume::contains(int z, int y, int x) const
{
    return z >= 0 && z < dimensions[0] &&
           y >= 0 && y < dimensions[1] &&
           x >= 0 && x < dimensions[2];
}

size_t LabelVolume::flatIndex(int z, int y, int x) const
{
    return (static_cast<size_t>(z) * dimensions[1] + static_cast<size_t>(y)) *
               dimensions[2] +
           static_cast<size_t>(x);
}

uint32_t LabelVolume::labelAt(int z, int y, int x) const
{
    if (!contains(z, y, x))
        return 0;
    return labels[flatIndex(z, y, x)];
}

void LabelVolume::setLabelAt(int z, int y, int x, uint32_t label)
{
    if (!contains(z, y, x))
        throw std::out_of_range("Voxel (" + std::to_string(z) + "," +
                                std::to_string(y) + "," + std::to_string(x) +
                                ") outside volume");
    labels[flatIndex(z, y, x)] = label;
}

void LabelVolume::fill(uint32_t label)
{
    std::fill(labels.begin(), labels.end(), label);
}

size_t LabelVolume::labeledCount() const
{
    return static_cast<size_t>(
        std::count_if(labels.begin(), labels.end(),
                      [](uint32_t v) { return v != 0; }));
}

bool LabelVolume::isConsistent() const
{
    return labels.size() == voxelCount();
}

bool LabelVolume::operator==(const LabelVolume& other) const
{
    return dimensions == other.dimensions && labels == other.labels;
}

std::string_view labelTypeName(LabelType type)
{
    switch (type)
    {
    case LabelType::UInt8:  return "uint8";
    case LabelType::Int16:  return "int16";
    case LabelType::UInt16: return "uint16";
    case LabelType::Int32:  return "int32";
    case LabelType::UInt32: return "uint32";
    case LabelType::Count:  break;
    }
    return "unknown";
}

std::optional<LabelType> labelTypeByName(std::string_view name)
{
    for (int i = 0; i < static_cast<int>(LabelType::Count); ++i)
    {
        auto type = static_cast<LabelType>(i);
        if (labelTypeName(type) == name)
            return type;
    }
    return std::nullopt;
}

size_t labelTypeSize(LabelType type)
{
    switch (type)
    {
    case LabelType::UInt8:  return 1;
    case LabelType::Int16:
    case LabelType::UInt16: return 2;
    case LabelType::Int32:
    case LabelType::UInt32: return 4;
    case LabelType::Count:  break;
    }
    return 0;
}

uint32_t labelTypeMax(LabelType type)
{
    switch (type)
    {
    case LabelType::UInt8:  return 0xFFu;
    case LabelType::Int16:  return 0x7FFFu;
    case LabelType::UInt16: return 0xFFFFu;
    case LabelType::Int32:  return 0x7FFFFFFFu;
    case LabelType::UInt32: return 0xFFFFFFFFu;
    case LabelType::Count:  break;
    }
    return 0;
}
