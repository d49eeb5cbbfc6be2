#include "docker/stream_demuxer.hpp"
#include "docker/errors.hpp"

namespace sandkit::docker {

std::string encode_frame(StreamId stream, const std::string& payload) {
    std::string out(FRAME_HEADER_SIZE, '\0');
    auto size = static_cast<uint32_t>(payload.size());
    out[0] = static_cast<char>(stream);
    out[4] = static_cast<char>((size >> 24) & 0xFF);
    out[5] = static_cast<char>((size >> 16) & 0xFF);
    out[6] = static_cast<char>((size >> 8) & 0xFF);
    out[7] = static_cast<char>(size & 0xFF);
    out += payload;
    return out;
}

StreamDemuxer::StreamDemuxer(FrameHandler handler)
    : handler_(std::move(handler)) {}

std::optional<std::pair<StreamId, uint32_t>> StreamDemuxer::parse_header(const char* data, size_t len) {
    if (len < FRAME_HEADER_SIZE) {
        return std::nullopt;
    }
    auto byte = [data](size_t i) { return static_cast<uint8_t>(data[i]); };
    if (byte(0) > static_cast<uint8_t>(StreamId::STDERR) || byte(1) != 0 || byte(2) != 0 || byte(3) != 0) {
        throw TransportError("corrupt exec stream frame header");
    }
    uint32_t size = (static_cast<uint32_t>(byte(4)) << 24) |
                    (static_cast<uint32_t>(byte(5)) << 16) |
                    (static_cast<uint32_t>(byte(6)) << 8) |
                    static_cast<uint32_t>(byte(7));
    return std::make_pair(static_cast<StreamId>(byte(0)), size);
}

void StreamDemuxer::feed(const char* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);

    size_t offset = 0;
    while (true) {
        auto header = parse_header(buffer_.data() + offset, buffer_.size() - offset);
        if (!header) break;

        size_t frame_size = FRAME_HEADER_SIZE + header->second;
        if (buffer_.size() - offset < frame_size) break;  // Need more data

        handler_(header->first, buffer_.data() + offset + FRAME_HEADER_SIZE, header->second);
        offset += frame_size;
    }

    // Remove processed frames
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
}

} // namespace sandkit::docker
