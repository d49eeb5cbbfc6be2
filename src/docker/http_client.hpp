/**
 * HTTP/1.1 over a unix domain socket
 *
 * One connection per request, so a single client can be shared by any
 * number of threads without locking.
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/http/verb.hpp>
#include "docker/container_runtime.hpp"

namespace sandkit::docker {

struct HttpResponse {
    int status = 0;
    std::string body;
    std::string content_type;

    bool ok() const { return status >= 200 && status < 300; }
};

// Connection taken over by the daemon after the response header
// (exec attach). Reads return raw bytes until the daemon closes it.
class HijackedStream : public ExecStream {
public:
    HijackedStream(std::unique_ptr<boost::asio::io_context> ioc,
                   std::unique_ptr<boost::asio::local::stream_protocol::socket> socket,
                   std::string leftover);
    ~HijackedStream() override;

    size_t read_some(char* buffer, size_t size) override;
    void abort() override;

private:
    std::unique_ptr<boost::asio::io_context> ioc_;
    std::unique_ptr<boost::asio::local::stream_protocol::socket> socket_;
    std::string leftover_;      // Bytes read past the header
    size_t leftover_pos_ = 0;
    int fd_;
    std::atomic<bool> aborted_{false};
};

class UnixHttpClient {
public:
    explicit UnixHttpClient(std::string socket_path);

    const std::string& socket_path() const { return socket_path_; }

    // Throws TransportError if the daemon cannot be reached
    HttpResponse request(boost::beast::http::verb method,
                         const std::string& target,
                         const std::string& body = "",
                         const std::string& content_type = "application/json");

    // Send a request expecting a hijacked stream (101 or 200). On any other
    // status the body is read and returned through error_response and the
    // result is null.
    std::unique_ptr<HijackedStream> open_stream(boost::beast::http::verb method,
                                                const std::string& target,
                                                const std::string& body,
                                                HttpResponse& error_response);

private:
    std::string socket_path_;

    std::unique_ptr<boost::asio::local::stream_protocol::socket> connect(boost::asio::io_context& ioc);
};

// Percent-encode a query parameter value
std::string url_encode(const std::string& value);

} // namespace sandkit::docker
