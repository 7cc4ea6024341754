#include <gtest/gtest.h>

#include <string>

#include "include/Framing.hpp"

using nlohmann::json;
using lsim::FrameDecoder;

namespace {

std::string rawFrame(std::uint32_t len, const std::string& body) {
    std::string out(lsim::kFrameHeaderSize, '\0');
    lsim::writeLengthLE(len, &out[0]);
    return out + body;
}

} // namespace

TEST(Framing, HeaderIsLittleEndianBodyLength) {
    const json msg{{"cmd", "PING"}, {"req_id", 7}, {"payload", json::object()}};
    const std::string frame = lsim::encodeFrame(msg);
    const std::string body = lsim::dumpJson(msg);

    ASSERT_EQ(frame.size(), body.size() + 4);
    EXPECT_EQ(static_cast<unsigned char>(frame[0]), body.size() & 0xFF);
    EXPECT_EQ(static_cast<unsigned char>(frame[1]), (body.size() >> 8) & 0xFF);
    EXPECT_EQ(frame[2], 0);
    EXPECT_EQ(frame[3], 0);
    EXPECT_EQ(frame.substr(4), body);
}

TEST(Framing, LengthHelpersHandleHighBytes) {
    char hdr[4];
    lsim::writeLengthLE(0x01020304u, hdr);
    EXPECT_EQ(hdr[0], 0x04);
    EXPECT_EQ(hdr[3], 0x01);
    EXPECT_EQ(lsim::readLengthLE(hdr), 0x01020304u);
}

TEST(Framing, DecodesWhatWasEncoded) {
    const json msg{
        {"ok", true}, {"req_id", -1}, {"error", ""},
        {"payload", {{"values", {{"X", 1.5}, {"Y", nullptr}, {"Z", "caf\xC3\xA9"}}}}}
    };
    FrameDecoder dec;
    const std::string frame = lsim::encodeFrame(msg);
    dec.feed(frame.data(), frame.size());

    json out;
    std::string err;
    ASSERT_EQ(dec.next(out, err), FrameDecoder::Status::Frame);
    EXPECT_EQ(out, msg);
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::NeedMore);
}

TEST(Framing, ByteByByteFeedYieldsFramesInOrder) {
    const std::string stream = lsim::encodeFrame(json{{"n", 1}}) + lsim::encodeFrame(json{{"n", 2}});
    FrameDecoder dec;
    std::vector<int> seen;
    for (char c : stream) {
        dec.feed(&c, 1);
        json out;
        std::string err;
        while (dec.next(out, err) == FrameDecoder::Status::Frame) {
            seen.push_back(out.at("n").get<int>());
        }
    }
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
    EXPECT_EQ(dec.buffered(), 0u);
}

TEST(Framing, BadJsonIsConsumedAndDecodingContinues) {
    const std::string stream = rawFrame(5, "{oops") + lsim::encodeFrame(json{{"cmd", "PING"}});
    FrameDecoder dec;
    dec.feed(stream.data(), stream.size());

    json out;
    std::string err;
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::BadJson);
    EXPECT_FALSE(err.empty());
    ASSERT_EQ(dec.next(out, err), FrameDecoder::Status::Frame);
    EXPECT_EQ(out.at("cmd"), "PING");
}

TEST(Framing, OversizeLengthBreaksTheStream) {
    const std::string hdr = rawFrame(50000000u, "");
    FrameDecoder dec;
    dec.feed(hdr.data(), hdr.size());

    json out;
    std::string err;
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::Oversize);
    EXPECT_EQ(dec.declaredLength(), 50000000u);

    // Stays broken even if valid frames follow.
    const std::string more = lsim::encodeFrame(json{{"cmd", "PING"}});
    dec.feed(more.data(), more.size());
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::Oversize);
}

TEST(Framing, ZeroLengthIsRejected) {
    const std::string hdr = rawFrame(0, "");
    FrameDecoder dec;
    dec.feed(hdr.data(), hdr.size());
    json out;
    std::string err;
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::Empty);
}

TEST(Framing, CustomCapApplies) {
    FrameDecoder dec(16);
    const std::string frame = lsim::encodeFrame(json{{"payload", std::string(32, 'x')}});
    dec.feed(frame.data(), frame.size());
    json out;
    std::string err;
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::Oversize);

    EXPECT_THROW(lsim::encodeFrame(json{{"payload", std::string(32, 'x')}}, 16), lsim::FramingError);
}

TEST(Framing, PartialHeaderNeedsMore) {
    const std::string frame = lsim::encodeFrame(json{{"a", 1}});
    FrameDecoder dec;
    dec.feed(frame.data(), 3);
    json out;
    std::string err;
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::NeedMore);
    dec.feed(frame.data() + 3, frame.size() - 3);
    EXPECT_EQ(dec.next(out, err), FrameDecoder::Status::Frame);
}
