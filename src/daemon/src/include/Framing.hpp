/*
 * LocalSim runtime - Frame codec (header)
 * Frame = uint32 little-endian body length + UTF-8 JSON body.
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "Config.hpp"

namespace lsim {

constexpr std::size_t kFrameHeaderSize = 4;

/* Raised when a message cannot be framed (body above the cap). */
class FramingError : public std::runtime_error {
public:
    explicit FramingError(const std::string& what) : std::runtime_error(what) {}
};

/* Compact UTF-8 JSON text (invalid UTF-8 in strings is replaced, never thrown). */
std::string dumpJson(const nlohmann::json& j);

void writeLengthLE(std::uint32_t len, char out[kFrameHeaderSize]);
std::uint32_t readLengthLE(const char in[kFrameHeaderSize]);

/* Header + body. Throws FramingError if the body exceeds maxBytes. */
std::string encodeFrame(const nlohmann::json& msg, std::uint32_t maxBytes = kMaxFrameBytes);

/*
 * Incremental decoder for one byte stream.
 * feed() appends received bytes; next() extracts at most one frame.
 *
 * After BadJson the body has been consumed and decoding can continue.
 * After Oversize/Empty the stream is unusable: the length field cannot be trusted.
 */
class FrameDecoder {
public:
    enum class Status {
        NeedMore,   // header or body incomplete
        Frame,      // `out` holds the parsed body
        BadJson,    // body consumed, `err` holds the parser message
        Oversize,   // declared length above the cap
        Empty       // declared length of zero
    };

    explicit FrameDecoder(std::uint32_t maxBytes = kMaxFrameBytes);

    void feed(const char* data, std::size_t n);

    Status next(nlohmann::json& out, std::string& err);

    /* Length declared by the header that caused Oversize/Empty. */
    std::uint32_t declaredLength() const noexcept { return declared_; }

    std::size_t buffered() const noexcept { return buf_.size() - pos_; }

private:
    void compact_();

    std::uint32_t maxBytes_;
    std::uint32_t declared_{0};
    std::string   buf_;
    std::size_t   pos_{0};
    bool          broken_{false};
};

} // namespace lsim
