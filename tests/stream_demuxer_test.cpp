#include <gtest/gtest.h>
#include <utility>
#include <vector>
#include "docker/errors.hpp"
#include "docker/stream_demuxer.hpp"

using namespace sandkit::docker;

namespace {

struct Collected {
    std::string out;
    std::string err;
    std::vector<std::pair<StreamId, std::string>> frames;
};

StreamDemuxer collector(Collected& c) {
    return StreamDemuxer([&c](StreamId id, const char* data, size_t len) {
        std::string payload(data, len);
        c.frames.emplace_back(id, payload);
        if (id == StreamId::STDOUT) c.out += payload;
        if (id == StreamId::STDERR) c.err += payload;
    });
}

} // namespace

// NOLINTNEXTLINE
TEST(stream_demuxer, header_layout) {
    std::string frame = encode_frame(StreamId::STDERR, std::string(0x010203, 'x'));
    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + 0x010203);
    EXPECT_EQ(frame[0], 2);
    EXPECT_EQ(frame[1], 0);
    EXPECT_EQ(frame[4], 0x00);
    EXPECT_EQ(frame[5], 0x01);
    EXPECT_EQ(frame[6], 0x02);
    EXPECT_EQ(frame[7], 0x03);

    auto header = StreamDemuxer::parse_header(frame.data(), frame.size());
    ASSERT_TRUE(header);
    EXPECT_EQ(header->first, StreamId::STDERR);
    EXPECT_EQ(header->second, 0x010203u);
    EXPECT_FALSE(StreamDemuxer::parse_header(frame.data(), 7));
}

// NOLINTNEXTLINE
TEST(stream_demuxer, length_bytes_above_0x7f_are_unsigned) {
    std::string frame = encode_frame(StreamId::STDOUT, std::string(0x80FF, 'y'));
    auto header = StreamDemuxer::parse_header(frame.data(), frame.size());
    ASSERT_TRUE(header);
    EXPECT_EQ(header->second, 0x80FFu);

    Collected c;
    auto demux = collector(c);
    demux.feed(frame.data(), frame.size());
    EXPECT_EQ(c.out.size(), 0x80FFu);
    EXPECT_EQ(demux.pending(), 0u);
}

// NOLINTNEXTLINE
TEST(stream_demuxer, separates_interleaved_streams) {
    Collected c;
    auto demux = collector(c);
    std::string raw = encode_frame(StreamId::STDOUT, "partial ") +
                      encode_frame(StreamId::STDERR, "warning\n") +
                      encode_frame(StreamId::STDOUT, "output\n");
    demux.feed(raw.data(), raw.size());

    EXPECT_EQ(c.out, "partial output\n");
    EXPECT_EQ(c.err, "warning\n");
    EXPECT_EQ(c.frames.size(), 3u);
    EXPECT_EQ(demux.pending(), 0u);
}

// NOLINTNEXTLINE
TEST(stream_demuxer, frames_split_across_reads) {
    Collected c;
    auto demux = collector(c);
    std::string raw = encode_frame(StreamId::STDOUT, "hello world") +
                      encode_frame(StreamId::STDERR, "oops");

    // One byte at a time
    for (char ch : raw) {
        demux.feed(&ch, 1);
    }
    EXPECT_EQ(c.out, "hello world");
    EXPECT_EQ(c.err, "oops");
    EXPECT_EQ(demux.pending(), 0u);
}

// NOLINTNEXTLINE
TEST(stream_demuxer, incomplete_frame_stays_pending) {
    Collected c;
    auto demux = collector(c);
    std::string raw = encode_frame(StreamId::STDOUT, "abcdef");
    demux.feed(raw.data(), raw.size() - 2);
    EXPECT_TRUE(c.frames.empty());
    EXPECT_EQ(demux.pending(), raw.size() - 2);
    demux.feed(raw.data() + raw.size() - 2, 2);
    EXPECT_EQ(c.out, "abcdef");
}

// NOLINTNEXTLINE
TEST(stream_demuxer, empty_payload_frame) {
    Collected c;
    auto demux = collector(c);
    std::string raw = encode_frame(StreamId::STDOUT, "");
    demux.feed(raw.data(), raw.size());
    ASSERT_EQ(c.frames.size(), 1u);
    EXPECT_EQ(c.frames[0].second, "");
}

// NOLINTNEXTLINE
TEST(stream_demuxer, corrupt_header_is_transport_error) {
    Collected c;
    auto demux = collector(c);
    // Stream id 7 does not exist
    std::string raw(FRAME_HEADER_SIZE + 1, '\0');
    raw[0] = 7;
    raw[7] = 1;
    raw[8] = 'x';
    EXPECT_THROW(demux.feed(raw.data(), raw.size()), TransportError);

    std::string nonzero_padding = encode_frame(StreamId::STDOUT, "x");
    nonzero_padding[2] = 1;
    Collected c2;
    auto demux2 = collector(c2);
    EXPECT_THROW(demux2.feed(nonzero_padding.data(), nonzero_padding.size()), TransportError);
}
