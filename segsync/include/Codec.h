#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <glm/glm.hpp>

#include "LabelVolume.h"
#include "SyncErrors.h"

using Bytes = std::vector<uint8_t>;

/// Upper bound on a single decompressed payload.  A 1024^3 uint32 label map
/// fits; anything larger is treated as corrupt.
constexpr size_t kMaxDecompressedBytes = size_t(4) << 30;

// --- Compression (zlib / deflate) ---

/// Deflate @p input into a zlib stream.  Empty input yields a valid stream.
/// @throws CodecError if zlib fails.
Bytes compressBytes(const Bytes& input, int level = 6);

/// Inflate a zlib stream produced by compressBytes() or any zlib encoder.
/// @throws CodecError on truncated/corrupt input or if the output would
///         exceed @p maxOutput bytes.
Bytes decompressBytes(const Bytes& input, size_t maxOutput = kMaxDecompressedBytes);

// --- Text-safe transport encoding (RFC 4648 base64) ---

std::string encodeForTransport(const Bytes& input);

/// Strict base64 decode: whitespace and invalid characters, bad padding or
/// a length that is not a multiple of 4 raise CodecError.
Bytes decodeFromTransport(std::string_view text);

// --- Label / index packing ---

/// Serialize labels as little-endian elements of @p type.
/// @throws CodecError if a label does not fit the element type.
Bytes packLabels(const std::vector<uint32_t>& labels, LabelType type);

/// Deserialize little-endian elements of @p type.
/// @throws CodecError if the byte count is not a multiple of the element
///         size, if @p expectedCount is non-zero and differs from the
///         element count, or if a signed element is negative.
std::vector<uint32_t> unpackLabels(const Bytes& bytes, LabelType type,
                                   size_t expectedCount = 0);

/// Serialize (z, y, x) triples as little-endian uint16.
/// @throws CodecError if a component is negative or above 65535.
Bytes packIndices(const std::vector<glm::ivec3>& indices);

/// @throws CodecError if the byte count is not a multiple of 6.
std::vector<glm::ivec3> unpackIndices(const Bytes& bytes);

/// pack + compress + base64 in one step, the form used in message payloads.
std::string encodeLabelPayload(const std::vector<uint32_t>& labels, LabelType type);
std::vector<uint32_t> decodeLabelPayload(std::string_view text, LabelType type,
                                         size_t expectedCount = 0);
std::string encodeIndexPayload(const std::vector<glm::ivec3>& indices);
std::vector<glm::ivec3> decodeIndexPayload(std::string_view text);
