#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include <voxturn/core/errors.hpp>

namespace voxturn {

// JSON request/reply over HTTP(S), used by handlers that query web services.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // POSTs `body` as application/json and returns the decoded reply.
    // Throws TransportError when the request fails or the reply is not JSON.
    virtual nlohmann::json postJson(const std::string& url, const nlohmann::json& body) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    struct Options {
        std::string user;                   // basic auth, skipped when empty
        std::string password;
        bool verify_peer = true;
        std::chrono::seconds timeout{30};
    };

    explicit CurlHttpClient(Options opts);

    nlohmann::json postJson(const std::string& url, const nlohmann::json& body) override;

private:
    Options opts_;
};

// HTTP status of a finished request -> transport status.
StatusCode statusFromHttpReply(long http_status);

} // namespace voxturn
