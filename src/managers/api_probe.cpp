#include "api_probe.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <memory>
#include <stdexcept>
#include <fmt/format.h>

namespace {

struct SslDeleter {
    void operator()(SSL* ssl) const { SSL_free(ssl); }
};
using SSL_ptr = std::unique_ptr<SSL, SslDeleter>;

std::string ssl_error_string() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "TLS handshake failed";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

void set_io_timeout(int sock, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace

HttpsProbe::HttpsProbe() {
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        throw std::runtime_error("Cannot create TLS context: " + ssl_error_string());
    }
    SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
}

HttpsProbe::~HttpsProbe() {
    SSL_CTX_free(ctx_);
}

Result<void> HttpsProbe::probe(const std::string& host, int port, int timeout_ms) {
    auto sock = platform::tcp_connect(host, port, timeout_ms);
    if (sock.is_err()) return Result<void>::Err(sock.error);

    int fd = sock.value;
    set_io_timeout(fd, timeout_ms);

    SSL_ptr ssl(SSL_new(ctx_));
    if (!ssl) {
        platform::close_socket(fd);
        return Result<void>::Err("Cannot create TLS session: " + ssl_error_string());
    }
    SSL_set_fd(ssl.get(), fd);
    SSL_set_tlsext_host_name(ssl.get(), host.c_str());

    auto fail = [&](const std::string& msg) {
        ssl.reset();
        platform::close_socket(fd);
        return Result<void>::Err(fmt::format("{}:{}: {}", host, port, msg));
    };

    ERR_clear_error();
    if (SSL_connect(ssl.get()) != 1) {
        return fail(ssl_error_string());
    }

    std::string request = fmt::format(
        "GET / HTTP/1.1\r\nHost: {}:{}\r\nUser-Agent: ktun\r\nConnection: close\r\n\r\n",
        host, port);
    if (SSL_write(ssl.get(), request.data(), static_cast<int>(request.size())) <= 0) {
        return fail("TLS write failed");
    }

    char buf[256];
    int n = SSL_read(ssl.get(), buf, sizeof(buf) - 1);
    if (n <= 0) {
        return fail("no response");
    }
    std::string head(buf, n);
    if (head.rfind("HTTP/", 0) != 0) {
        return fail("unexpected response");
    }

    ktun_log(fmt::format("Probe {}:{}: {}", host, port, head.substr(0, head.find('\r'))));
    SSL_shutdown(ssl.get());
    ssl.reset();
    platform::close_socket(fd);
    return Result<void>::Ok();
}
