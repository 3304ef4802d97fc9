#pragma once

#include <stdexcept>
#include <string>

/// Malformed or corrupt payload (bad base64, bad deflate stream, wrong
/// element count).  The message carrying it is dropped; the session stays open.
class CodecError : public std::runtime_error
{
public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

/// Unrecognised message tag or a required field is missing.
class ProtocolError : public std::runtime_error
{
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

/// Payload that cannot be applied at all (e.g. index/value counts differ).
/// Individual out-of-range voxels are skipped instead of raising this.
class ApplyError : public std::runtime_error
{
public:
    explicit ApplyError(const std::string& what) : std::runtime_error(what) {}
};

/// Connect failure or loss of the channel.  Ends the session.
class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};
