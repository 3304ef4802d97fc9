#include "Codec.h"

#include <array>
#include <limits>

#include <zlib.h>

// ---------------------------------------------------------------------------
// Compression
// ---------------------------------------------------------------------------

Bytes compressBytes(const Bytes& input, int level)
{
    if (input.size() > std::numeric_limits<uLong>::max())
        throw CodecError("Payload too large to compress");

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    Bytes out(bound);
    // zlib wants a non-null source pointer even for zero-length input.
    static const Bytef kEmpty = 0;
    const Bytef* src = input.empty() ? &kEmpty : input.data();

    int rc = compress2(out.data(), &bound, src,
                       static_cast<uLong>(input.size()), level);
    if (rc != Z_OK)
        throw CodecError("zlib compress2 failed (code " + std::to_string(rc) + ")");
    out.resize(bound);
    return out;
}

namespace
{

// RAII wrapper for an inflate stream - inflateEnd() on scope exit.
class InflateStream
{
public:
    InflateStream()
    {
        if (inflateInit(&zs_) != Z_OK)
            throw CodecError("zlib inflateInit failed");
    }
    ~InflateStream() { inflateEnd(&zs_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &zs_; }

private:
    z_stream zs_{};
};

} // anonymous namespace

Bytes decompressBytes(const Bytes& input, size_t maxOutput)
{
    if (input.empty())
        throw CodecError("Empty compressed payload");
    if (input.size() > std::numeric_limits<uInt>::max())
        throw CodecError("Compressed payload too large");

    InflateStream stream;
    z_stream* zs = stream.get();
    zs->next_in = const_cast<Bytef*>(input.data());
    zs->avail_in = static_cast<uInt>(input.size());

    Bytes out;
    std::array<Bytef, 64 * 1024> chunk{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END)
    {
        zs->next_out = chunk.data();
        zs->avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR)
            throw CodecError(std::string("Corrupt deflate stream: ") +
                             (zs->msg ? zs->msg : "unknown error"));

        size_t produced = chunk.size() - zs->avail_out;
        if (out.size() + produced > maxOutput)
            throw CodecError("Decompressed payload exceeds size limit");
        out.insert(out.end(), chunk.data(), chunk.data() + produced);

        // Z_BUF_ERROR with no input left and no progress: stream is truncated.
        if (rc == Z_BUF_ERROR || (rc == Z_OK && zs->avail_in == 0 && produced == 0))
            throw CodecError("Truncated deflate stream");
    }
    if (zs->avail_in != 0)
        throw CodecError("Trailing bytes after deflate stream");
    return out;
}

// ---------------------------------------------------------------------------
// Base64
// ---------------------------------------------------------------------------

namespace
{

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kPad = '=';

int decodeChar(char ch)
{
    if ('A' <= ch && ch <= 'Z') return ch - 'A';
    if ('a' <= ch && ch <= 'z') return ch - 'a' + 26;
    if ('0' <= ch && ch <= '9') return ch - '0' + 52;
    if (ch == '+') return 62;
    if (ch == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string encodeForTransport(const Bytes& input)
{
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= input.size(); i += 3)
    {
        uint32_t n = (uint32_t(input[i]) << 16) | (uint32_t(input[i + 1]) << 8) |
                     uint32_t(input[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    size_t rest = input.size() - i;
    if (rest == 1)
    {
        uint32_t n = uint32_t(input[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kPad;
        out += kPad;
    }
    else if (rest == 2)
    {
        uint32_t n = (uint32_t(input[i]) << 16) | (uint32_t(input[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kPad;
    }
    return out;
}

Bytes decodeFromTransport(std::string_view text)
{
    if (text.size() % 4 != 0)
        throw CodecError("base64 length is not a multiple of 4");

    Bytes out;
    out.reserve((text.size() / 4) * 3);

    for (size_t i = 0; i < text.size(); i += 4)
    {
        bool last = (i + 4 == text.size());
        std::array<int, 4> v{};
        int pad = 0;
        for (int k = 0; k < 4; ++k)
        {
            char ch = text[i + k];
            if (ch == kPad)
            {
                // Padding is only legal in the last two positions of the final quad.
                if (!last || k < 2)
                    throw CodecError("Misplaced base64 padding");
                ++pad;
                v[k] = 0;
                continue;
            }
            if (pad > 0)
                throw CodecError("Data after base64 padding");
            v[k] = decodeChar(ch);
            if (v[k] < 0)
                throw CodecError("Invalid base64 character");
        }

        uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) |
                     (uint32_t(v[2]) << 6) | uint32_t(v[3]);
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (pad < 2)
            out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (pad < 1)
            out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Label / index packing
// ---------------------------------------------------------------------------

Bytes packLabels(const std::vector<uint32_t>& labels, LabelType type)
{
    size_t width = labelTypeSize(type);
    if (width == 0)
        throw CodecError("Unknown label element type");
    uint32_t maxValue = labelTypeMax(type);

    Bytes out(labels.size() * width);
    uint8_t* p = out.data();
    for (uint32_t v : labels)
    {
        if (v > maxValue)
            throw CodecError("Label " + std::to_string(v) + " does not fit " +
                             std::string(labelTypeName(type)));
        for (size_t b = 0; b < width; ++b)
            *p++ = static_cast<uint8_t>((v >> (8 * b)) & 0xFF);
    }
    return out;
}

std::vector<uint32_t> unpackLabels(const Bytes& bytes, LabelType type,
                                   size_t expectedCount)
{
    size_t width = labelTypeSize(type);
    if (width == 0)
        throw CodecError("Unknown label element type");
    if (bytes.size() % width != 0)
        throw CodecError("Label payload size " + std::to_string(bytes.size()) +
                         " is not a multiple of " + std::to_string(width));

    size_t count = bytes.size() / width;
    if (expectedCount != 0 && count != expectedCount)
        throw CodecError("Label payload holds " + std::to_string(count) +
                         " elements, expected " + std::to_string(expectedCount));

    bool isSigned = (type == LabelType::Int16 || type == LabelType::Int32);
    std::vector<uint32_t> out(count);
    const uint8_t* p = bytes.data();
    for (size_t i = 0; i < count; ++i)
    {
        uint32_t v = 0;
        for (size_t b = 0; b < width; ++b)
            v |= uint32_t(p[b]) << (8 * b);
        p += width;
        if (isSigned && (v >> (8 * width - 1)) != 0)
            throw CodecError("Negative label in " + std::string(labelTypeName(type)) +
                             " payload");
        out[i] = v;
    }
    return out;
}

Bytes packIndices(const std::vector<glm::ivec3>& indices)
{
    Bytes out;
    out.reserve(indices.size() * 6);
    for (const auto& idx : indices)
    {
        for (int axis = 0; axis < 3; ++axis)
        {
            int c = idx[axis];
            if (c < 0 || c > 0xFFFF)
                throw CodecError("Index component " + std::to_string(c) +
                                 " does not fit uint16");
            out.push_back(static_cast<uint8_t>(c & 0xFF));
            out.push_back(static_cast<uint8_t>((c >> 8) & 0xFF));
        }
    }
    return out;
}

std::vector<glm::ivec3> unpackIndices(const Bytes& bytes)
{
    if (bytes.size() % 6 != 0)
        throw CodecError("Index payload size " + std::to_string(bytes.size()) +
                         " is not a multiple of 6");

    std::vector<glm::ivec3> out(bytes.size() / 6);
    const uint8_t* p = bytes.data();
    for (auto& idx : out)
    {
        for (int axis = 0; axis < 3; ++axis)
        {
            idx[axis] = int(p[0]) | (int(p[1]) << 8);
            p += 2;
        }
    }
    return out;
}

std::string encodeLabelPayload(const std::vector<uint32_t>& labels, LabelType type)
{
    return encodeForTransport(compressBytes(packLabels(labels, type)));
}

std::vector<uint32_t> decodeLabelPayload(std::string_view text, LabelType type,
                                         size_t expectedCount)
{
    return unpackLabels(decompressBytes(decodeFromTransport(text)), type, expectedCount);
}

std::string encodeIndexPayload(const std::vector<glm::ivec3>& indices)
{
    return encodeForTransport(compressBytes(packIndices(indices)));
}

std::vector<glm::ivec3> decodeIndexPayload(std::string_view text)
{
    return unpackIndices(decompressBytes(decodeFromTransport(text)));
}
