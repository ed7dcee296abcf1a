#pragma once

#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/client.hpp>
#include <boost/asio/ssl.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <voxturn/assistant/transport.hpp>
#include <voxturn/core/context.hpp>
#include <voxturn/core/errors.hpp>

namespace voxturn {

// Close code / handshake status -> transport status.
StatusCode statusFromCloseCode(uint16_t close_code);
StatusCode statusFromHttpStatus(int http_status);

/**
 * Assistant transport over a TLS WebSocket: one connection per turn attempt,
 * JSON text frames both ways (see wire_codec.hpp). A single asio thread runs
 * every connection of the process.
 */
class WebSocketTransport : public AssistTransport {
public:
    using client_t = websocketpp::client<websocketpp::config::asio_tls_client>;

    struct Options {
        std::string endpoint;                 // wss://host:port/path
        std::string access_token;             // sent as "Authorization: Bearer ..."
        bool verify_peer = true;
        std::string ca_file;                  // optional extra trust anchor
        size_t max_buffered_bytes = 64 * 1024; // writes block above this
    };

    WebSocketTransport(Context& ctx, Options opts);
    ~WebSocketTransport() override;

    bool start();
    void stop();

    // Must outlive every call it opened.
    std::unique_ptr<AssistCall> open(std::chrono::seconds deadline) override;

    const Options& options() const { return opts_; }

private:
    friend class WebSocketCall;

    Context& ctx_;
    Options opts_;
    client_t client_;
    std::thread io_thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace voxturn
