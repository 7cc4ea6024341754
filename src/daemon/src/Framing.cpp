/*
 * LocalSim runtime - Frame codec (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/Framing.hpp"

namespace lsim {

using nlohmann::json;

std::string dumpJson(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void writeLengthLE(std::uint32_t len, char out[kFrameHeaderSize]) {
    out[0] = static_cast<char>(len & 0xFF);
    out[1] = static_cast<char>((len >> 8) & 0xFF);
    out[2] = static_cast<char>((len >> 16) & 0xFF);
    out[3] = static_cast<char>((len >> 24) & 0xFF);
}

std::uint32_t readLengthLE(const char in[kFrameHeaderSize]) {
    const auto* p = reinterpret_cast<const unsigned char*>(in);
    return static_cast<std::uint32_t>(p[0])
         | (static_cast<std::uint32_t>(p[1]) << 8)
         | (static_cast<std::uint32_t>(p[2]) << 16)
         | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::string encodeFrame(const json& msg, std::uint32_t maxBytes) {
    const std::string body = dumpJson(msg);
    if (body.size() > maxBytes) {
        throw FramingError("frame body too large: " + std::to_string(body.size()) +
                           " > " + std::to_string(maxBytes));
    }
    std::string out;
    out.resize(kFrameHeaderSize);
    writeLengthLE(static_cast<std::uint32_t>(body.size()), &out[0]);
    out += body;
    return out;
}

// -----------------------------------------------------------------------------
// FrameDecoder
// -----------------------------------------------------------------------------

FrameDecoder::FrameDecoder(std::uint32_t maxBytes)
: maxBytes_(maxBytes) {}

void FrameDecoder::feed(const char* data, std::size_t n) {
    if (broken_ || n == 0) return;
    compact_();
    buf_.append(data, n);
}

void FrameDecoder::compact_() {
    // Drop consumed bytes once they dominate the buffer.
    if (pos_ > 0 && pos_ * 2 >= buf_.size()) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
}

FrameDecoder::Status FrameDecoder::next(json& out, std::string& err) {
    if (broken_) {
        return declared_ == 0 ? Status::Empty : Status::Oversize;
    }
    if (buffered() < kFrameHeaderSize) return Status::NeedMore;

    const std::uint32_t len = readLengthLE(buf_.data() + pos_);
    if (len == 0 || len > maxBytes_) {
        broken_   = true;
        declared_ = len;
        buf_.clear();
        pos_ = 0;
        return len == 0 ? Status::Empty : Status::Oversize;
    }
    if (buffered() < kFrameHeaderSize + len) return Status::NeedMore;

    const char* body = buf_.data() + pos_ + kFrameHeaderSize;
    pos_ += kFrameHeaderSize + len;

    try {
        out = json::parse(body, body + len);
    } catch (const json::parse_error& ex) {
        err = ex.what();
        return Status::BadJson;
    }
    return Status::Frame;
}

} // namespace lsim
