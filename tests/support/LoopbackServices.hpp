#pragma once

#include <asio.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace netsweep::testing {

/**
 * @brief TCP listener on 127.0.0.1 that accepts every connection, optionally
 *        writes a greeting, and closes.
 */
class LoopbackTcpServer {
public:
    explicit LoopbackTcpServer(std::string greeting = {})
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0)),
          greeting_(std::move(greeting)) {
        accept();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~LoopbackTcpServer() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackTcpServer(const LoopbackTcpServer&) = delete;
    LoopbackTcpServer& operator=(const LoopbackTcpServer&) = delete;

    uint16_t port() const { return acceptor_.local_endpoint().port(); }
    int accepted() const { return accepted_.load(); }

private:
    void accept() {
        acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            ++accepted_;
            if (!greeting_.empty()) {
                auto peer = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
                auto data = std::make_shared<std::string>(greeting_);
                asio::async_write(*peer, asio::buffer(*data),
                                  [peer, data](const asio::error_code&, size_t) {});
            }
            accept();
        });
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::string greeting_;
    std::atomic<int> accepted_{0};
    std::thread thread_;
};

/**
 * @brief UDP responder on 127.0.0.1 answering every datagram with a fixed reply.
 */
class LoopbackUdpResponder {
public:
    explicit LoopbackUdpResponder(std::string reply = "pong")
        : socket_(io_, asio::ip::udp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0)),
          reply_(std::move(reply)) {
        receive();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~LoopbackUdpResponder() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackUdpResponder(const LoopbackUdpResponder&) = delete;
    LoopbackUdpResponder& operator=(const LoopbackUdpResponder&) = delete;

    uint16_t port() const { return socket_.local_endpoint().port(); }
    size_t lastRequestSize() const { return lastRequestSize_.load(); }

private:
    void receive() {
        socket_.async_receive_from(
            asio::buffer(buffer_), sender_, [this](const asio::error_code& ec, size_t bytes) {
                if (ec) {
                    return;
                }
                lastRequestSize_ = bytes;
                asio::error_code ignored;
                socket_.send_to(asio::buffer(reply_), sender_, 0, ignored);
                receive();
            });
    }

    asio::io_context io_;
    asio::ip::udp::socket socket_;
    asio::ip::udp::endpoint sender_;
    std::array<char, 1500> buffer_{};
    std::string reply_;
    std::atomic<size_t> lastRequestSize_{0};
    std::thread thread_;
};

/**
 * @brief Returns a loopback TCP port with no listener, so connects are refused.
 */
inline uint16_t unusedTcpPort() {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(
        io, asio::ip::tcp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

/**
 * @brief Returns a loopback UDP port with no socket bound to it.
 */
inline uint16_t unusedUdpPort() {
    asio::io_context io;
    asio::ip::udp::socket socket(
        io, asio::ip::udp::endpoint(asio::ip::make_address_v4("127.0.0.1"), 0));
    uint16_t port = socket.local_endpoint().port();
    socket.close();
    return port;
}

inline asio::ip::address_v4 loopback() {
    return asio::ip::make_address_v4("127.0.0.1");
}

} // namespace netsweep::testing
