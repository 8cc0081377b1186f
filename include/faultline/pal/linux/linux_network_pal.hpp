// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Linux Network PAL Implementation
//
// Uses epoll (edge-triggered) for readiness and an eventfd to wake the
// loop when requests are queued from other threads.

#ifndef FAULTLINE_PAL_LINUX_LINUX_NETWORK_PAL_HPP
#define FAULTLINE_PAL_LINUX_LINUX_NETWORK_PAL_HPP

#include "faultline/core/buffer.hpp"
#include "faultline/core/result.hpp"
#include "faultline/pal/network_pal.hpp"
#include "faultline/pal/pal_types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

namespace faultline {
namespace pal {
namespace linux {

/**
 * @brief epoll-based INetworkPAL.
 *
 * Socket state lives in a map guarded by socketsMutex_. Event handlers
 * collect completions while holding the lock and run them after releasing
 * it, so a completion may re-enter the PAL (asyncRead, closeSocket, ...).
 */
class LinuxNetworkPAL : public INetworkPAL {
public:
    LinuxNetworkPAL();

    /**
     * @brief Stops the loop and closes every socket still registered.
     */
    ~LinuxNetworkPAL() override;

    LinuxNetworkPAL(const LinuxNetworkPAL&) = delete;
    LinuxNetworkPAL& operator=(const LinuxNetworkPAL&) = delete;
    LinuxNetworkPAL(LinuxNetworkPAL&&) = delete;
    LinuxNetworkPAL& operator=(LinuxNetworkPAL&&) = delete;

    // =========================================================================
    // INetworkPAL Implementation
    // =========================================================================

    core::Result<void, NetworkError> initialize() override;

    void runEventLoop() override;

    void stopEventLoop() override;

    bool isRunning() const override;

    core::Result<ServerSocket, NetworkError> createServer(
        const std::string& address,
        uint16_t port,
        const ServerOptions& options
    ) override;

    void asyncAccept(
        const ServerSocket& server,
        AcceptCallback callback
    ) override;

    void asyncRead(
        SocketHandle socket,
        core::Buffer& buffer,
        size_t maxBytes,
        ReadCallback callback
    ) override;

    void asyncWrite(
        SocketHandle socket,
        const core::Buffer& data,
        WriteCallback callback
    ) override;

    void closeSocket(SocketHandle socket) override;

    core::Result<uint16_t, NetworkError> getLocalPort(
        SocketHandle socket
    ) const override;

    core::Result<std::string, NetworkError> getPeerAddress(
        SocketHandle socket
    ) const override;

private:
    struct SocketInfo {
        int fd = -1;
        bool isServer = false;
        AcceptCallback acceptCallback;
        ReadCallback readCallback;
        WriteCallback writeCallback;
        core::Buffer* readBuffer = nullptr;
        size_t maxReadBytes = 0;
        core::Buffer writeBuffer;
        size_t writeOffset = 0;
    };

    struct PendingOp {
        enum class Type { Accept, Read, Write };
        Type type;
        SocketHandle socket;
        AcceptCallback acceptCb;
        ReadCallback readCb;
        WriteCallback writeCb;
        core::Buffer* buffer = nullptr;
        size_t maxBytes = 0;
        core::Buffer writeData;
    };

    using Completion = std::function<void()>;

    bool registerWithEpoll(int fd, uint32_t events, bool modify = false);

    void unregisterFromEpoll(int fd);

    void processEvents();

    void processPendingOps();

    void handleReadable(int fd, std::vector<Completion>& completions);

    void handleWritable(int fd, std::vector<Completion>& completions);

    void enqueue(PendingOp op);

    void wake();

    NetworkError errnoToNetworkError(int err) const;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    int epollFd_{-1};

    mutable std::mutex socketsMutex_;
    std::unordered_map<int, SocketInfo> sockets_;

    std::mutex opsMutex_;
    std::queue<PendingOp> pendingOps_;

    // Eventfd for waking up epoll
    int wakeEventFd_{-1};
};

} // namespace linux
} // namespace pal
} // namespace faultline

#endif // FAULTLINE_PAL_LINUX_LINUX_NETWORK_PAL_HPP
