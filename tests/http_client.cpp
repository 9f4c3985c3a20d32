#include <doctest/doctest.h>
#include "trustchain/http_client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <thread>

using namespace trustchain;
using namespace std::chrono;

namespace {

/// Loopback listener that answers the first connection with a canned response
class CannedServer {
public:
    explicit CannedServer(std::string response) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(fd_, 1) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, response = std::move(response)] {
            int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }
            std::string request;
            char buffer[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) break;
                request.append(buffer, static_cast<size_t>(n));
            }
            ::send(client, response.data(), response.size(), MSG_NOSIGNAL);
            ::close(client);
        });
    }

    ~CannedServer() {
        ::shutdown(fd_, SHUT_RDWR);
        thread_.join();
        ::close(fd_);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
};

}  // namespace

TEST_CASE("JoinUrl") {
    CHECK(joinUrl("https://signer.internal", "sign") == "https://signer.internal/sign");
    CHECK(joinUrl("https://signer.internal/", "/sign") == "https://signer.internal/sign");
    CHECK(joinUrl("http://localhost:3001//", "api/mcp-trust/servers") ==
          "http://localhost:3001/api/mcp-trust/servers");
}

TEST_CASE("UrlHost") {
    CHECK(urlHost("https://Tasks.Example.com:8443/mcp") == "tasks.example.com");
    CHECK(urlHost("http://user:pw@127.0.0.1:7777/x") == "127.0.0.1");
    CHECK(urlHost("http://[::1]:8080/mcp") == "::1");
    CHECK(urlHost("http://[::1") == "");
}

TEST_CASE("IsLoopbackUrl") {
    CHECK(isLoopbackUrl("http://localhost:3001/mcp"));
    CHECK(isLoopbackUrl("http://127.4.5.6"));
    CHECK(isLoopbackUrl("http://[::1]:8080"));
    CHECK(isLoopbackUrl("http://0.0.0.0:9000"));
    CHECK_FALSE(isLoopbackUrl("https://tasks.example.com/mcp"));
    CHECK_FALSE(isLoopbackUrl("http://127.0.0.1.example.com"));
    CHECK_FALSE(isLoopbackUrl("http://10.0.0.1"));
}

TEST_CASE("CurlHttpClient returns redirects without following them") {
    CannedServer server(
        "HTTP/1.1 302 Found\r\n"
        "Location: http://127.0.0.1:1/elsewhere\r\n"
        "Content-Length: 5\r\n"
        "Connection: close\r\n"
        "\r\n"
        "moved");

    CurlHttpClient client;
    HttpError error;
    auto response = client.get(server.url("/api/mcp-trust/servers"), milliseconds(5000), error);
    REQUIRE(response.has_value());
    CHECK(response->status == 302);
    CHECK(response->body == "moved");
    CHECK_FALSE(response->ok());
    CHECK(error.message.empty());
}

TEST_CASE("CurlHttpClient reports connection failures") {
    CurlHttpClient client;
    HttpError error;
    auto response = client.get("http://127.0.0.1:1/health", milliseconds(2000), error);
    CHECK_FALSE(response.has_value());
    CHECK_FALSE(error.message.empty());
    CHECK_FALSE(error.timed_out);
}
