// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

// <utility> first: Boost 1.74 asio uses std::exchange without including it
#include <utility>
#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dnl::test {

namespace asio = boost::asio;
using asio::ip::tcp;

struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;  // lower-cased names

    // Inclusive "bytes=first-last" from the Range header
    [[nodiscard]] std::optional<std::pair<std::uint64_t, std::uint64_t>> range() const {
        auto it = headers.find("range");
        if (it == headers.end() || !it->second.starts_with("bytes=")) {
            return std::nullopt;
        }
        auto spec = it->second.substr(6);
        auto dash = spec.find('-');
        if (dash == std::string::npos || dash == 0 || dash + 1 == spec.size()) {
            return std::nullopt;
        }
        return std::make_pair(std::stoull(spec.substr(0, dash)), std::stoull(spec.substr(dash + 1)));
    }
};

struct HttpReply {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::optional<std::uint64_t> content_length;  // defaults to body.size()
    bool stall{false};                             // keep the connection open after the body
};

using RequestHandler = std::function<HttpReply(const HttpRequest&)>;

// Serves `payload` the way a range-capable server does
inline HttpReply serve_resource(const std::string& payload, const HttpRequest& request) {
    HttpReply reply;
    reply.headers.emplace_back("Accept-Ranges", "bytes");
    reply.headers.emplace_back("Content-Type", "application/octet-stream");
    if (request.method == "HEAD") {
        reply.content_length = payload.size();
        return reply;
    }
    if (auto range = request.range(); range && range->first < payload.size()) {
        auto last = std::min<std::uint64_t>(range->second, payload.size() - 1);
        reply.status = 206;
        reply.body = payload.substr(range->first, last - range->first + 1);
        reply.headers.emplace_back("Content-Range", "bytes " + std::to_string(range->first) + "-"
                                   + std::to_string(last) + "/" + std::to_string(payload.size()));
        return reply;
    }
    reply.body = payload;
    return reply;
}

// One-request-per-connection HTTP/1.1 server on 127.0.0.1, driven by an
// io_context on a background thread. The handler runs on that thread only.
class LoopbackServer {
public:
    explicit LoopbackServer(RequestHandler handler)
        : handler_(std::move(handler))
        , acceptor_(io_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {
        accept();
        thread_ = std::jthread([this] { io_.run(); });
    }

    ~LoopbackServer() {
        io_.stop();
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + path;
    }

    [[nodiscard]] std::uint32_t requests() const noexcept { return requests_.load(); }

private:
    struct Connection {
        explicit Connection(tcp::socket s) : socket(std::move(s)) {}
        tcp::socket socket;
        asio::streambuf buffer;
        std::string response;
    };

    void accept() {
        acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                return;
            }
            read(std::make_shared<Connection>(std::move(socket)));
            accept();
        });
    }

    void read(std::shared_ptr<Connection> conn) {
        asio::async_read_until(conn->socket, conn->buffer, "\r\n\r\n",
            [this, conn](boost::system::error_code ec, std::size_t) {
                if (ec) {
                    return;
                }
                std::istream in(&conn->buffer);
                auto request = parse(in);
                auto reply = handler_(request);
                ++requests_;
                conn->response = serialize(request, reply);
                asio::async_write(conn->socket, asio::buffer(conn->response),
                    [this, conn, stall = reply.stall](boost::system::error_code, std::size_t) {
                        if (stall) {
                            stalled_.push_back(conn);
                            return;
                        }
                        boost::system::error_code ignored;
                        conn->socket.shutdown(tcp::socket::shutdown_both, ignored);
                    });
            });
    }

    static HttpRequest parse(std::istream& in) {
        HttpRequest request;
        std::string line;
        std::getline(in, line);
        auto first = line.find(' ');
        auto second = line.find(' ', first + 1);
        request.method = line.substr(0, first);
        request.target = line.substr(first + 1, second - first - 1);

        while (std::getline(in, line) && line != "\r") {
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = line.substr(0, colon);
            for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            auto value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            if (!value.empty() && value.back() == '\r') value.pop_back();
            request.headers[name] = value;
        }
        return request;
    }

    static std::string reason(int status) {
        switch (status) {
            case 200: return "OK";
            case 206: return "Partial Content";
            case 404: return "Not Found";
            case 503: return "Service Unavailable";
            default: return "Status";
        }
    }

    static std::string serialize(const HttpRequest& request, const HttpReply& reply) {
        std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " + reason(reply.status) + "\r\n";
        for (const auto& [name, value] : reply.headers) {
            out += name + ": " + value + "\r\n";
        }
        out += "Content-Length: " + std::to_string(reply.content_length.value_or(reply.body.size())) + "\r\n";
        out += "Connection: close\r\n\r\n";
        if (request.method != "HEAD") {
            out += reply.body;
        }
        return out;
    }

    RequestHandler handler_;
    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::vector<std::shared_ptr<Connection>> stalled_;
    std::atomic<std::uint32_t> requests_{0};
    std::jthread thread_;
};

} // namespace dnl::test
