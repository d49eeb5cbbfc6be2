#include "docker/http_client.hpp"
#include "docker/errors.hpp"
#include <spdlog/spdlog.h>
#include <boost/asio/buffer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <limits>
#include <sys/socket.h>

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using local_stream = boost::asio::local::stream_protocol;

namespace sandkit::docker {

namespace {

std::string to_std(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

http::request<http::string_body> make_request(http::verb method,
                                              const std::string& target,
                                              const std::string& body,
                                              const std::string& content_type) {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "docker");
    req.set(http::field::user_agent, "sandkit");
    if (!body.empty()) {
        req.set(http::field::content_type, content_type);
        req.body() = body;
    }
    req.prepare_payload();
    return req;
}

} // namespace

// ============================================================================
// HijackedStream
// ============================================================================

HijackedStream::HijackedStream(std::unique_ptr<asio::io_context> ioc,
                               std::unique_ptr<local_stream::socket> socket,
                               std::string leftover)
    : ioc_(std::move(ioc)),
      socket_(std::move(socket)),
      leftover_(std::move(leftover)),
      fd_(socket_->native_handle()) {}

HijackedStream::~HijackedStream() {
    boost::system::error_code ec;
    socket_->close(ec);
}

size_t HijackedStream::read_some(char* buffer, size_t size) {
    if (leftover_pos_ < leftover_.size()) {
        size_t n = std::min(size, leftover_.size() - leftover_pos_);
        std::copy_n(leftover_.data() + leftover_pos_, n, buffer);
        leftover_pos_ += n;
        return n;
    }
    if (aborted_) {
        return 0;
    }

    boost::system::error_code ec;
    size_t n = socket_->read_some(asio::buffer(buffer, size), ec);
    if (ec == asio::error::eof || aborted_) {
        return n;
    }
    if (ec) {
        throw TransportError("exec stream read failed: " + ec.message());
    }
    return n;
}

void HijackedStream::abort() {
    if (aborted_.exchange(true)) {
        return;
    }
    // shutdown() wakes a reader blocked in another thread; close() would not
    ::shutdown(fd_, SHUT_RDWR);
}

// ============================================================================
// UnixHttpClient
// ============================================================================

UnixHttpClient::UnixHttpClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

std::unique_ptr<local_stream::socket> UnixHttpClient::connect(asio::io_context& ioc) {
    auto socket = std::make_unique<local_stream::socket>(ioc);
    boost::system::error_code ec;
    socket->connect(local_stream::endpoint(socket_path_), ec);
    if (ec) {
        throw TransportError("cannot connect to " + socket_path_ + ": " + ec.message());
    }
    return socket;
}

HttpResponse UnixHttpClient::request(http::verb method,
                                     const std::string& target,
                                     const std::string& body,
                                     const std::string& content_type) {
    asio::io_context ioc;
    auto socket = connect(ioc);

    auto req = make_request(method, target, body, content_type);
    boost::system::error_code ec;
    http::write(*socket, req, ec);
    if (ec) {
        throw TransportError(to_std(http::to_string(method)) + " " + target + ": " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // Archives and build output can be large
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read(*socket, buffer, parser, ec);
    if (ec) {
        throw TransportError(to_std(http::to_string(method)) + " " + target + ": " + ec.message());
    }

    auto& res = parser.get();
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.content_type = to_std(res[http::field::content_type]);
    out.body = std::move(res.body());

    socket->shutdown(local_stream::socket::shutdown_both, ec);
    spdlog::trace("docker {} {} -> {}", to_std(http::to_string(method)), target, out.status);
    return out;
}

std::unique_ptr<HijackedStream> UnixHttpClient::open_stream(http::verb method,
                                                            const std::string& target,
                                                            const std::string& body,
                                                            HttpResponse& error_response) {
    auto ioc = std::make_unique<asio::io_context>();
    auto socket = connect(*ioc);

    auto req = make_request(method, target, body, "application/json");
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::upgrade, "tcp");

    boost::system::error_code ec;
    http::write(*socket, req, ec);
    if (ec) {
        throw TransportError(to_std(http::to_string(method)) + " " + target + ": " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read_header(*socket, buffer, parser, ec);
    if (ec) {
        throw TransportError("reading stream header for " + target + ": " + ec.message());
    }

    int status = static_cast<int>(parser.get().result_int());
    if (status == 101 || status == 200) {
        spdlog::trace("docker {} {} -> {} (stream)", to_std(http::to_string(method)), target, status);
        std::string leftover = beast::buffers_to_string(buffer.data());
        return std::make_unique<HijackedStream>(std::move(ioc), std::move(socket), std::move(leftover));
    }

    // Error responses carry a normal JSON body
    http::read(*socket, buffer, parser, ec);
    error_response.status = status;
    error_response.content_type = to_std(parser.get()[http::field::content_type]);
    if (!ec) {
        error_response.body = std::move(parser.get().body());
    }
    return nullptr;
}

std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

} // namespace sandkit::docker
