#pragma once

#include <string>
#include <core/types.hpp>

struct ssl_ctx_st;

// Checks whether a Kubernetes API server answers at host:port.
class EndpointProbe {
public:
    virtual ~EndpointProbe() = default;

    // One attempt, bounded by timeout_ms. Ok once any HTTP response arrives.
    virtual Result<void> probe(const std::string& host, int port, int timeout_ms) = 0;
};

// TLS connect + `GET /`, certificate not verified. Any status line counts:
// an unauthenticated client usually gets 401/403, which still proves the
// server (and any tunnel in front of it) is up.
class HttpsProbe : public EndpointProbe {
public:
    HttpsProbe();
    ~HttpsProbe() override;

    HttpsProbe(const HttpsProbe&) = delete;
    HttpsProbe& operator=(const HttpsProbe&) = delete;

    Result<void> probe(const std::string& host, int port, int timeout_ms) override;

private:
    ssl_ctx_st* ctx_ = nullptr;
};
