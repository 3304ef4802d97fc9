#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

/// Element type used when a label array travels on the wire.  Names follow
/// the numpy dtype strings the relay and other peers already understand.
enum class LabelType
{
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,

    Count  // sentinel - must be last
};

/// A 3-D per-voxel label map with its geometry.
///
/// All vectors use array order: component 0 = Z, 1 = Y, 2 = X.  The flat
/// label index of voxel (z, y, x) is (z * dimY + y) * dimX + x.  Label 0
/// means "unlabeled".
class LabelVolume {
public:
    glm::ivec3 dimensions{0, 0, 0};  // Z, Y, X voxel counts

    /// Voxel spacing in mm along each axis (Z, Y, X).
    glm::dvec3 spacing{1.0, 1.0, 1.0};

    /// World coordinate of the first voxel (Z, Y, X).
    glm::dvec3 origin{0.0, 0.0, 0.0};

    /// Flat label array, size == dimensions.x * dimensions.y * dimensions.z.
    std::vector<uint32_t> labels;

    /// Label value -> segment name.  May be partial or stale.
    std::map<uint32_t, std::string> segmentNames;

    /// Element type used when this volume is serialized.
    LabelType dataType = LabelType::UInt16;

    LabelVolume() = default;

    /// Allocate a zero-filled volume.
    /// @throws std::invalid_argument if any dimension is negative.
    explicit LabelVolume(const glm::ivec3& dims,
                         LabelType type = LabelType::UInt16);

    /// Adopt an existing label array.
    /// @throws std::invalid_argument if labels.size() != product(dims).
    LabelVolume(const glm::ivec3& dims, std::vector<uint32_t> labels,
                LabelType type = LabelType::UInt16);

    /// Deep copy of the whole volume (labels, geometry, names).
    LabelVolume snapshot() const { return *this; }

    size_t voxelCount() const;

    bool contains(int z, int y, int x) const;
    size_t flatIndex(int z, int y, int x) const;

    /// Label at (z, y, x); 0 for voxels outside the volume.
    uint32_t labelAt(int z, int y, int x) const;

    /// @throws std::out_of_range if (z, y, x) is outside the volume.
    void setLabelAt(int z, int y, int x, uint32_t label);

    /// Set every voxel to @p label.
    void fill(uint32_t label);

    /// Number of voxels with a non-zero label.
    size_t labeledCount() const;

    /// True when labels.size() matches the dimensions.
    bool isConsistent() const;

    /// Volumes are equal when dimensions and label contents match.
    /// Geometry metadata and segment names are not compared.
    bool operator==(const LabelVolume& other) const;
    bool operator!=(const LabelVolume& other) const { return !(*this == other); }
};

/// Product of the three dimensions (0 if any is non-positive).
size_t voxelCountFor(const glm::ivec3& dims);

/// numpy-style name of a label element type ("uint8", "uint16", ...).
std::string_view labelTypeName(LabelType type);

/// Inverse of labelTypeName().  Returns nullopt for unknown names.
std::optional<LabelType> labelTypeByName(std::string_view name);

/// Size of one element of @p type in bytes.
size_t labelTypeSize(LabelType type);

/// Largest label value representable by @p type.
uint32_t labelTypeMax(LabelType type);
