/**
 * Multiplexed exec stream decoding
 *
 * A non-TTY exec attaches stdout and stderr to one connection. Each frame
 * is an 8-byte header (stream id, 3 zero bytes, big-endian payload length)
 * followed by the payload.
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sandkit::docker {

constexpr size_t FRAME_HEADER_SIZE = 8;

enum class StreamId : uint8_t {
    STDIN  = 0,
    STDOUT = 1,
    STDERR = 2
};

struct Frame {
    StreamId stream;
    std::string payload;
};

// Encode one frame (the daemon's side; used by tests and fakes)
std::string encode_frame(StreamId stream, const std::string& payload);

class StreamDemuxer {
public:
    using FrameHandler = std::function<void(StreamId, const char*, size_t)>;

    explicit StreamDemuxer(FrameHandler handler);

    // Consume raw bytes; complete frames are passed to the handler in order.
    // Throws TransportError on a corrupt header.
    void feed(const char* data, size_t len);

    // Bytes of an incomplete frame still buffered
    size_t pending() const { return buffer_.size(); }

    // Parse a frame header; nullopt if fewer than FRAME_HEADER_SIZE bytes
    static std::optional<std::pair<StreamId, uint32_t>> parse_header(const char* data, size_t len);

private:
    FrameHandler handler_;
    std::vector<char> buffer_;
};

} // namespace sandkit::docker
