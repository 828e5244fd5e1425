#include "infrastructure/network/SocketProbe.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <memory>

namespace netsweep::infra {

namespace {

using Strand = ProbeRuntime::Strand;

// All handlers of one operation run on its strand, so the fields below need
// no further synchronisation. The generation counter discards timer
// completions that were already queued when the timer was re-armed.
struct TcpOperation {
    explicit TcpOperation(Strand s) : strand(s), socket(s), timer(s) {}

    Strand strand;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    std::promise<TcpProbeResult> promise;
    TcpProbeResult result;
    std::array<char, 1024> buffer{};
    std::chrono::steady_clock::time_point started;
    unsigned generation{0};
    bool connected{false};
    bool finished{false};

    void finish() {
        if (finished) {
            return;
        }
        finished = true;
        timer.cancel();
        asio::error_code ignored;
        socket.close(ignored);
        promise.set_value(std::move(result));
    }
};

struct UdpOperation {
    explicit UdpOperation(Strand s) : strand(s), socket(s), timer(s) {}

    Strand strand;
    asio::ip::udp::socket socket;
    asio::steady_timer timer;
    std::promise<UdpProbeResult> promise;
    UdpProbeResult result;
    std::vector<uint8_t> payload;
    std::array<char, 2048> buffer{};
    bool finished{false};

    void finish() {
        if (finished) {
            return;
        }
        finished = true;
        timer.cancel();
        asio::error_code ignored;
        socket.close(ignored);
        promise.set_value(std::move(result));
    }
};

void armTcpTimer(const std::shared_ptr<TcpOperation>& op, std::chrono::milliseconds timeout) {
    unsigned generation = ++op->generation;
    op->timer.expires_after(timeout);
    op->timer.async_wait([op, generation](const asio::error_code& ec) {
        if (ec || op->finished || generation != op->generation) {
            return;
        }
        if (!op->connected) {
            op->result.outcome = ConnectOutcome::TimedOut;
        }
        op->finish();
    });
}

} // namespace

SocketProbe::SocketProbe(ProbeRuntime& runtime) : runtime_(runtime) {}

ConnectOutcome SocketProbe::classify(const asio::error_code& ec) {
    if (!ec) {
        return ConnectOutcome::Connected;
    }
    if (ec == asio::error::connection_refused) {
        return ConnectOutcome::Refused;
    }
    if (ec == asio::error::timed_out) {
        return ConnectOutcome::TimedOut;
    }
    return ConnectOutcome::Unreachable;
}

std::string SocketProbe::outcomeToString(ConnectOutcome outcome) {
    switch (outcome) {
    case ConnectOutcome::Connected:
        return "connected";
    case ConnectOutcome::Refused:
        return "refused";
    case ConnectOutcome::TimedOut:
        return "timed out";
    case ConnectOutcome::Unreachable:
        return "unreachable";
    }
    return "unreachable";
}

std::future<TcpProbeResult> SocketProbe::connectAsync(const asio::ip::address_v4& address,
                                                      uint16_t port,
                                                      std::chrono::milliseconds timeout,
                                                      bool readBanner) {
    if (!runtime_.accepting()) {
        spdlog::debug("Connect to {}:{} skipped, probe runtime shut down", address.to_string(),
                      port);
        std::promise<TcpProbeResult> skipped;
        skipped.set_value(TcpProbeResult{});
        return skipped.get_future();
    }

    auto op = std::make_shared<TcpOperation>(runtime_.makeStrand());
    auto future = op->promise.get_future();
    asio::ip::tcp::endpoint endpoint(address, port);

    asio::post(op->strand, [op, endpoint, timeout, readBanner]() {
        op->started = std::chrono::steady_clock::now();
        armTcpTimer(op, timeout);

        op->socket.async_connect(endpoint, [op, timeout,
                                            readBanner](const asio::error_code& ec) {
            if (op->finished) {
                return;
            }

            op->result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - op->started);
            op->result.outcome = classify(ec);

            if (ec || !readBanner) {
                op->finish();
                return;
            }

            // Connected: give the service one timeout to announce itself
            op->connected = true;
            armTcpTimer(op, timeout);
            op->socket.async_read_some(
                asio::buffer(op->buffer), [op](const asio::error_code& readEc, size_t bytes) {
                    if (op->finished) {
                        return;
                    }
                    if (!readEc && bytes > 0) {
                        op->result.banner.assign(op->buffer.data(), bytes);
                    }
                    op->finish();
                });
        });
    });

    return future;
}

TcpProbeResult SocketProbe::connect(const asio::ip::address_v4& address, uint16_t port,
                                    std::chrono::milliseconds timeout, bool readBanner) {
    return connectAsync(address, port, timeout, readBanner).get();
}

std::future<UdpProbeResult> SocketProbe::exchangeAsync(const asio::ip::address_v4& address,
                                                       uint16_t port,
                                                       std::vector<uint8_t> payload,
                                                       std::chrono::milliseconds timeout) {
    if (!runtime_.accepting()) {
        spdlog::debug("UDP exchange with {}:{} skipped, probe runtime shut down",
                      address.to_string(), port);
        std::promise<UdpProbeResult> skipped;
        skipped.set_value(UdpProbeResult{});
        return skipped.get_future();
    }

    auto op = std::make_shared<UdpOperation>(runtime_.makeStrand());
    op->payload = std::move(payload);
    auto future = op->promise.get_future();
    asio::ip::udp::endpoint endpoint(address, port);

    asio::post(op->strand, [op, endpoint, timeout]() {
        asio::error_code ec;
        op->socket.open(asio::ip::udp::v4(), ec);
        if (!ec) {
            // A connected datagram socket surfaces ICMP port-unreachable as an error
            op->socket.connect(endpoint, ec);
        }
        if (ec) {
            spdlog::debug("UDP probe to {}:{} could not start: {}", endpoint.address().to_string(),
                          endpoint.port(), ec.message());
            op->finish();
            return;
        }

        op->timer.expires_after(timeout);
        op->timer.async_wait([op](const asio::error_code& timerEc) {
            if (timerEc || op->finished) {
                return;
            }
            op->finish();
        });

        op->socket.async_send(asio::buffer(op->payload), [op](const asio::error_code& sendEc,
                                                              size_t /*bytes*/) {
            if (op->finished) {
                return;
            }
            if (sendEc) {
                op->finish();
                return;
            }
            op->socket.async_receive(
                asio::buffer(op->buffer), [op](const asio::error_code& recvEc, size_t bytes) {
                    if (op->finished) {
                        return;
                    }
                    if (!recvEc) {
                        op->result.answered = true;
                        op->result.reply.assign(op->buffer.data(), bytes);
                    }
                    op->finish();
                });
        });
    });

    return future;
}

UdpProbeResult SocketProbe::exchange(const asio::ip::address_v4& address, uint16_t port,
                                     std::vector<uint8_t> payload,
                                     std::chrono::milliseconds timeout) {
    return exchangeAsync(address, port, std::move(payload), timeout).get();
}

} // namespace netsweep::infra
