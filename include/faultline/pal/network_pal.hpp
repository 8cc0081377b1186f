// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Platform Abstraction Layer - Network Interface
//
// Asynchronous listener-side socket I/O driven by an event loop. The Linux
// implementation uses epoll. Outbound HTTP goes through libcurl instead
// (see http/http_client.hpp).

#ifndef FAULTLINE_PAL_NETWORK_PAL_HPP
#define FAULTLINE_PAL_NETWORK_PAL_HPP

#include "faultline/core/buffer.hpp"
#include "faultline/core/result.hpp"
#include "faultline/pal/pal_types.hpp"

#include <string>

namespace faultline {
namespace pal {

/**
 * @brief Abstract interface for event-loop driven socket I/O.
 *
 * ## Threading
 * - runEventLoop() blocks the calling thread until stopEventLoop().
 * - asyncAccept/asyncRead/asyncWrite/closeSocket may be called from any
 *   thread; requests are queued and picked up by the loop.
 * - Completion callbacks run on the loop thread with no internal lock held,
 *   so they may issue further requests or close sockets.
 *
 * ## Ownership
 * The Buffer passed to asyncRead must outlive the completion callback.
 * asyncWrite copies its data.
 */
class INetworkPAL {
public:
    virtual ~INetworkPAL() = default;

    // =========================================================================
    // Event Loop Control
    // =========================================================================

    virtual core::Result<void, NetworkError> initialize() = 0;

    virtual void runEventLoop() = 0;

    /**
     * @brief Request the loop to return. Safe from any thread.
     */
    virtual void stopEventLoop() = 0;

    virtual bool isRunning() const = 0;

    // =========================================================================
    // Server Socket Operations
    // =========================================================================

    /**
     * @brief Bind and listen on an IPv4 address.
     *
     * @param address Dotted-quad bind address ("0.0.0.0" for all interfaces)
     * @param port Port to bind, 0 for an ephemeral port
     * @return The listening socket with its actual bound port
     */
    virtual core::Result<ServerSocket, NetworkError> createServer(
        const std::string& address,
        uint16_t port,
        const ServerOptions& options
    ) = 0;

    // =========================================================================
    // Asynchronous I/O Operations
    // =========================================================================

    /**
     * @brief Accept one connection; call again to accept the next.
     */
    virtual void asyncAccept(
        const ServerSocket& server,
        AcceptCallback callback
    ) = 0;

    /**
     * @brief Read up to maxBytes once data is available.
     *
     * On success the buffer is resized to the bytes read. A peer close is
     * reported as NetworkErrorCode::ConnectionClosed.
     */
    virtual void asyncRead(
        SocketHandle socket,
        core::Buffer& buffer,
        size_t maxBytes,
        ReadCallback callback
    ) = 0;

    /**
     * @brief Write the whole buffer; the callback fires once all bytes are sent.
     */
    virtual void asyncWrite(
        SocketHandle socket,
        const core::Buffer& data,
        WriteCallback callback
    ) = 0;

    // =========================================================================
    // Socket Management
    // =========================================================================

    /**
     * @brief Close a socket. Pending callbacks on it are dropped.
     */
    virtual void closeSocket(SocketHandle socket) = 0;

    virtual core::Result<uint16_t, NetworkError> getLocalPort(
        SocketHandle socket
    ) const = 0;

    virtual core::Result<std::string, NetworkError> getPeerAddress(
        SocketHandle socket
    ) const = 0;
};

} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_NETWORK_PAL_HPP
