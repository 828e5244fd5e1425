#pragma once

#include "infrastructure/network/ProbeRuntime.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <vector>

namespace netsweep::infra {

/**
 * @brief How a timed TCP connection attempt ended.
 */
enum class ConnectOutcome {
    Connected,  ///< Three-way handshake completed
    Refused,    ///< Peer answered with a reset
    TimedOut,   ///< No answer within the timeout
    Unreachable ///< Any other failure (no route, host unreachable, ...)
};

/**
 * @brief Result of a timed TCP connection attempt.
 */
struct TcpProbeResult {
    ConnectOutcome outcome{ConnectOutcome::Unreachable}; ///< How the attempt ended
    std::chrono::microseconds elapsed{0};                ///< Time until connect completed
    std::string banner;                                  ///< Raw bytes read after connecting
};

/**
 * @brief Result of a datagram request/response exchange.
 */
struct UdpProbeResult {
    bool answered{false}; ///< Whether any datagram came back
    std::string reply;    ///< Raw reply bytes
};

/**
 * @brief Timed TCP and UDP probe operations on a shared ProbeRuntime.
 *
 * Every operation owns its socket and timer, runs on its own strand, and is
 * bounded by its timeout, so callers waiting on the returned futures never
 * block longer than the timeout (twice the timeout when a banner is read).
 * Probes issued after the runtime shut down return an empty result at once.
 */
class SocketProbe {
public:
    /**
     * @brief Constructs a SocketProbe on the given runtime.
     * @param runtime I/O threads the operations run on.
     */
    explicit SocketProbe(ProbeRuntime& runtime);

    /**
     * @brief Starts a timed TCP connection attempt.
     * @param address Target address.
     * @param port Target port.
     * @param timeout Connect timeout; also bounds the banner read.
     * @param readBanner Read once from the connection after it is established.
     * @return Future holding the outcome.
     */
    std::future<TcpProbeResult> connectAsync(const asio::ip::address_v4& address, uint16_t port,
                                             std::chrono::milliseconds timeout,
                                             bool readBanner = false);

    /**
     * @brief Blocking form of connectAsync().
     */
    TcpProbeResult connect(const asio::ip::address_v4& address, uint16_t port,
                           std::chrono::milliseconds timeout, bool readBanner = false);

    /**
     * @brief Sends one datagram and waits for a single reply.
     * @param address Target address.
     * @param port Target port.
     * @param payload Datagram body, may be empty.
     * @param timeout Maximum time to wait for the reply.
     * @return Future holding whether a reply arrived, and its bytes.
     */
    std::future<UdpProbeResult> exchangeAsync(const asio::ip::address_v4& address, uint16_t port,
                                              std::vector<uint8_t> payload,
                                              std::chrono::milliseconds timeout);

    /**
     * @brief Blocking form of exchangeAsync().
     */
    UdpProbeResult exchange(const asio::ip::address_v4& address, uint16_t port,
                            std::vector<uint8_t> payload, std::chrono::milliseconds timeout);

    /**
     * @brief Maps a connect error to an outcome.
     */
    static ConnectOutcome classify(const asio::error_code& ec);

    static std::string outcomeToString(ConnectOutcome outcome);

private:
    ProbeRuntime& runtime_;
};

} // namespace netsweep::infra
