// Faultline - Fault-injection harness for end-to-end-encrypted chat clients
// Linux Network PAL Implementation using epoll

#include "faultline/pal/linux/linux_network_pal.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace faultline {
namespace pal {
namespace linux {

namespace {

uint32_t interestFor(const bool wantsWrite) {
    return EPOLLIN | EPOLLET | (wantsWrite ? EPOLLOUT : 0u);
}

} // namespace

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxNetworkPAL::LinuxNetworkPAL() = default;

LinuxNetworkPAL::~LinuxNetworkPAL() {
    stopEventLoop();

    std::unordered_map<int, SocketInfo> remaining;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        remaining.swap(sockets_);
    }
    for (auto& pair : remaining) {
        if (pair.first >= 0) {
            close(pair.first);
        }
    }

    if (wakeEventFd_ >= 0) {
        close(wakeEventFd_);
        wakeEventFd_ = -1;
    }

    if (epollFd_ >= 0) {
        close(epollFd_);
        epollFd_ = -1;
    }
}

// =============================================================================
// Initialization
// =============================================================================

core::Result<void, NetworkError> LinuxNetworkPAL::initialize() {
    if (initialized_.load()) {
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::AlreadyInitialized, "Network PAL already initialized", 0}
        );
    }

    epollFd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed, "epoll_create1 failed: " + std::string(strerror(errno)), errno}
        );
    }

    wakeEventFd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeEventFd_ < 0) {
        int err = errno;
        close(epollFd_);
        epollFd_ = -1;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed, "eventfd failed: " + std::string(strerror(err)), err}
        );
    }

    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wakeEventFd_;
    if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, wakeEventFd_, &ev) < 0) {
        int err = errno;
        close(wakeEventFd_);
        close(epollFd_);
        wakeEventFd_ = -1;
        epollFd_ = -1;
        return core::Result<void, NetworkError>::error(
            NetworkError{NetworkErrorCode::InitializationFailed, "epoll_ctl failed: " + std::string(strerror(err)), err}
        );
    }

    initialized_ = true;
    return core::Result<void, NetworkError>::success();
}

// =============================================================================
// Event Loop
// =============================================================================

void LinuxNetworkPAL::runEventLoop() {
    if (!initialized_.load()) {
        return;
    }

    running_ = true;

    while (!stopRequested_.load()) {
        processPendingOps();
        processEvents();
    }

    running_ = false;
}

void LinuxNetworkPAL::stopEventLoop() {
    stopRequested_ = true;
    wake();
}

bool LinuxNetworkPAL::isRunning() const {
    return running_.load();
}

void LinuxNetworkPAL::wake() {
    if (wakeEventFd_ >= 0) {
        uint64_t val = 1;
        ssize_t result = write(wakeEventFd_, &val, sizeof(val));
        (void)result;  // EAGAIN means the counter is already non-zero
    }
}

void LinuxNetworkPAL::processEvents() {
    const int maxEvents = 64;
    struct epoll_event events[maxEvents];

    int nfds = epoll_wait(epollFd_, events, maxEvents, 100);
    if (nfds <= 0) {
        return;
    }

    std::vector<Completion> completions;
    for (int i = 0; i < nfds; ++i) {
        int fd = events[i].data.fd;

        if (fd == wakeEventFd_) {
            uint64_t val;
            while (read(wakeEventFd_, &val, sizeof(val)) > 0) {
            }
            continue;
        }

        if (events[i].events & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
            handleReadable(fd, completions);
        }

        if (events[i].events & (EPOLLOUT | EPOLLERR)) {
            handleWritable(fd, completions);
        }
    }

    for (auto& completion : completions) {
        completion();
    }
}

void LinuxNetworkPAL::processPendingOps() {
    std::queue<PendingOp> ops;
    {
        std::lock_guard<std::mutex> lock(opsMutex_);
        std::swap(ops, pendingOps_);
    }

    std::vector<Completion> completions;

    while (!ops.empty()) {
        PendingOp op = std::move(ops.front());
        ops.pop();

        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(static_cast<int>(op.socket.value));
        if (it == sockets_.end()) {
            if (op.type == PendingOp::Type::Accept && op.acceptCb) {
                completions.push_back([cb = std::move(op.acceptCb)]() {
                    cb(core::Result<SocketHandle, NetworkError>::error(
                        NetworkError{NetworkErrorCode::SocketNotFound, "Socket not found", 0}));
                });
            } else if (op.type == PendingOp::Type::Read && op.readCb) {
                completions.push_back([cb = std::move(op.readCb)]() {
                    cb(core::Result<size_t, NetworkError>::error(
                        NetworkError{NetworkErrorCode::SocketNotFound, "Socket not found", 0}));
                });
            } else if (op.type == PendingOp::Type::Write && op.writeCb) {
                completions.push_back([cb = std::move(op.writeCb)]() {
                    cb(core::Result<size_t, NetworkError>::error(
                        NetworkError{NetworkErrorCode::SocketNotFound, "Socket not found", 0}));
                });
            }
            continue;
        }

        SocketInfo& info = it->second;
        switch (op.type) {
            case PendingOp::Type::Accept:
                info.acceptCallback = std::move(op.acceptCb);
                // Re-arming with MOD reports connections that queued up meanwhile.
                registerWithEpoll(info.fd, interestFor(false), true);
                break;

            case PendingOp::Type::Read:
                info.readCallback = std::move(op.readCb);
                info.readBuffer = op.buffer;
                info.maxReadBytes = op.maxBytes;
                registerWithEpoll(info.fd, interestFor(static_cast<bool>(info.writeCallback)), true);
                break;

            case PendingOp::Type::Write:
                info.writeCallback = std::move(op.writeCb);
                info.writeBuffer = std::move(op.writeData);
                info.writeOffset = 0;
                registerWithEpoll(info.fd, interestFor(true), true);
                break;
        }
    }

    for (auto& completion : completions) {
        completion();
    }
}

void LinuxNetworkPAL::handleReadable(int fd, std::vector<Completion>& completions) {
    std::lock_guard<std::mutex> lock(socketsMutex_);

    auto it = sockets_.find(fd);
    if (it == sockets_.end()) {
        return;
    }

    SocketInfo& info = it->second;

    if (info.isServer) {
        if (!info.acceptCallback) {
            return;
        }
        struct sockaddr_in clientAddr;
        socklen_t addrLen = sizeof(clientAddr);

        int clientFd = accept4(fd, reinterpret_cast<struct sockaddr*>(&clientAddr), &addrLen,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (clientFd >= 0) {
            SocketInfo clientInfo;
            clientInfo.fd = clientFd;
            sockets_[clientFd] = std::move(clientInfo);
            registerWithEpoll(clientFd, interestFor(false), false);

            AcceptCallback cb = std::move(info.acceptCallback);
            info.acceptCallback = nullptr;
            SocketHandle clientHandle{static_cast<uint64_t>(clientFd)};
            completions.push_back([cb = std::move(cb), clientHandle]() {
                cb(core::Result<SocketHandle, NetworkError>::success(clientHandle));
            });
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
            NetworkError error = errnoToNetworkError(errno);
            AcceptCallback cb = std::move(info.acceptCallback);
            info.acceptCallback = nullptr;
            completions.push_back([cb = std::move(cb), error]() {
                cb(core::Result<SocketHandle, NetworkError>::error(error));
            });
        }
        return;
    }

    if (!info.readCallback || !info.readBuffer) {
        return;
    }

    info.readBuffer->resize(info.maxReadBytes);
    ssize_t bytesRead = read(fd, info.readBuffer->data(), info.maxReadBytes);

    if (bytesRead < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        info.readBuffer->resize(0);
        return;
    }

    ReadCallback cb = std::move(info.readCallback);
    info.readCallback = nullptr;
    core::Buffer* buffer = info.readBuffer;
    info.readBuffer = nullptr;

    if (bytesRead > 0) {
        buffer->resize(static_cast<size_t>(bytesRead));
        size_t count = static_cast<size_t>(bytesRead);
        completions.push_back([cb = std::move(cb), count]() {
            cb(core::Result<size_t, NetworkError>::success(count));
        });
    } else if (bytesRead == 0) {
        buffer->resize(0);
        completions.push_back([cb = std::move(cb)]() {
            cb(core::Result<size_t, NetworkError>::error(
                NetworkError{NetworkErrorCode::ConnectionClosed, "Connection closed by peer", 0}));
        });
    } else {
        buffer->resize(0);
        NetworkError error = errnoToNetworkError(errno);
        completions.push_back([cb = std::move(cb), error]() {
            cb(core::Result<size_t, NetworkError>::error(error));
        });
    }
}

void LinuxNetworkPAL::handleWritable(int fd, std::vector<Completion>& completions) {
    std::lock_guard<std::mutex> lock(socketsMutex_);

    auto it = sockets_.find(fd);
    if (it == sockets_.end()) {
        return;
    }

    SocketInfo& info = it->second;
    if (!info.writeCallback) {
        return;
    }

    // Edge-triggered: keep writing until done or the kernel buffer is full.
    while (info.writeOffset < info.writeBuffer.size()) {
        const uint8_t* data = info.writeBuffer.data() + info.writeOffset;
        size_t remaining = info.writeBuffer.size() - info.writeOffset;

        ssize_t bytesWritten = send(fd, data, remaining, MSG_NOSIGNAL);
        if (bytesWritten > 0) {
            info.writeOffset += static_cast<size_t>(bytesWritten);
            continue;
        }
        if (bytesWritten < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (bytesWritten < 0 && errno == EINTR) {
            continue;
        }

        NetworkError error = errnoToNetworkError(errno);
        WriteCallback cb = std::move(info.writeCallback);
        info.writeCallback = nullptr;
        info.writeBuffer.clear();
        info.writeOffset = 0;
        registerWithEpoll(fd, interestFor(false), true);
        completions.push_back([cb = std::move(cb), error]() {
            cb(core::Result<size_t, NetworkError>::error(error));
        });
        return;
    }

    size_t written = info.writeBuffer.size();
    WriteCallback cb = std::move(info.writeCallback);
    info.writeCallback = nullptr;
    info.writeBuffer.clear();
    info.writeOffset = 0;
    registerWithEpoll(fd, interestFor(false), true);
    completions.push_back([cb = std::move(cb), written]() {
        cb(core::Result<size_t, NetworkError>::success(written));
    });
}

// =============================================================================
// Server Socket Operations
// =============================================================================

core::Result<ServerSocket, NetworkError> LinuxNetworkPAL::createServer(
    const std::string& address,
    uint16_t port,
    const ServerOptions& options
) {
    if (!initialized_.load()) {
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::NotInitialized, "Network PAL not initialized", 0}
        );
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::InvalidAddress, "Invalid IPv4 address: " + address, 0}
        );
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::SocketCreationFailed, "socket failed: " + std::string(strerror(errno)), errno}
        );
    }

    if (options.reuseAddr) {
        int opt = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        NetworkError error = errnoToNetworkError(err);
        if (error.code != NetworkErrorCode::AddressInUse) {
            error.code = NetworkErrorCode::BindFailed;
        }
        error.message = "bind " + address + ":" + std::to_string(port) + " failed: " + strerror(err);
        return core::Result<ServerSocket, NetworkError>::error(error);
    }

    if (listen(fd, options.backlog) < 0) {
        int err = errno;
        close(fd);
        return core::Result<ServerSocket, NetworkError>::error(
            NetworkError{NetworkErrorCode::ListenFailed, "listen failed: " + std::string(strerror(err)), err}
        );
    }

    SocketInfo info;
    info.fd = fd;
    info.isServer = true;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        sockets_[fd] = std::move(info);
    }
    registerWithEpoll(fd, interestFor(false), false);

    ServerSocket server;
    server.handle = SocketHandle{static_cast<uint64_t>(fd)};
    server.address = address;
    server.port = getLocalPort(server.handle).valueOr(port);

    return core::Result<ServerSocket, NetworkError>::success(server);
}

// =============================================================================
// Async I/O Operations
// =============================================================================

void LinuxNetworkPAL::enqueue(PendingOp op) {
    {
        std::lock_guard<std::mutex> lock(opsMutex_);
        pendingOps_.push(std::move(op));
    }
    wake();
}

void LinuxNetworkPAL::asyncAccept(
    const ServerSocket& server,
    AcceptCallback callback
) {
    PendingOp op;
    op.type = PendingOp::Type::Accept;
    op.socket = server.handle;
    op.acceptCb = std::move(callback);
    enqueue(std::move(op));
}

void LinuxNetworkPAL::asyncRead(
    SocketHandle socket,
    core::Buffer& buffer,
    size_t maxBytes,
    ReadCallback callback
) {
    PendingOp op;
    op.type = PendingOp::Type::Read;
    op.socket = socket;
    op.readCb = std::move(callback);
    op.buffer = &buffer;
    op.maxBytes = maxBytes;
    enqueue(std::move(op));
}

void LinuxNetworkPAL::asyncWrite(
    SocketHandle socket,
    const core::Buffer& data,
    WriteCallback callback
) {
    PendingOp op;
    op.type = PendingOp::Type::Write;
    op.socket = socket;
    op.writeCb = std::move(callback);
    op.writeData = data;
    enqueue(std::move(op));
}

// =============================================================================
// Socket Management
// =============================================================================

void LinuxNetworkPAL::closeSocket(SocketHandle socket) {
    if (socket == INVALID_SOCKET_HANDLE) {
        return;
    }

    int fd = static_cast<int>(socket.value);

    // Callbacks may own the last reference to their connection state; destroy
    // them after the lock is released.
    SocketInfo removed;
    {
        std::lock_guard<std::mutex> lock(socketsMutex_);
        auto it = sockets_.find(fd);
        if (it == sockets_.end()) {
            return;
        }
        removed = std::move(it->second);
        sockets_.erase(it);
        unregisterFromEpoll(fd);
        close(fd);
    }
}

core::Result<uint16_t, NetworkError> LinuxNetworkPAL::getLocalPort(
    SocketHandle socket
) const {
    int fd = static_cast<int>(socket.value);

    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(addr);

    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) < 0) {
        return core::Result<uint16_t, NetworkError>::error(
            errnoToNetworkError(errno)
        );
    }

    return core::Result<uint16_t, NetworkError>::success(ntohs(addr.sin_port));
}

core::Result<std::string, NetworkError> LinuxNetworkPAL::getPeerAddress(
    SocketHandle socket
) const {
    int fd = static_cast<int>(socket.value);

    struct sockaddr_in addr;
    socklen_t addrLen = sizeof(addr);

    if (getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) < 0) {
        return core::Result<std::string, NetworkError>::error(
            errnoToNetworkError(errno)
        );
    }

    char addrStr[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &addr.sin_addr, addrStr, sizeof(addrStr)) == nullptr) {
        return core::Result<std::string, NetworkError>::error(
            errnoToNetworkError(errno)
        );
    }

    return core::Result<std::string, NetworkError>::success(std::string(addrStr));
}

// =============================================================================
// Helper Functions
// =============================================================================

bool LinuxNetworkPAL::registerWithEpoll(int fd, uint32_t events, bool modify) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    int op = modify ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
    return epoll_ctl(epollFd_, op, fd, &ev) >= 0;
}

void LinuxNetworkPAL::unregisterFromEpoll(int fd) {
    epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr);
}

NetworkError LinuxNetworkPAL::errnoToNetworkError(int err) const {
    NetworkErrorCode code;
    std::string message;

    switch (err) {
        case ECONNREFUSED:
            code = NetworkErrorCode::ConnectionRefused;
            message = "Connection refused";
            break;

        case ECONNRESET:
        case EPIPE:
            code = NetworkErrorCode::ConnectionReset;
            message = "Connection reset by peer";
            break;

        case EADDRINUSE:
            code = NetworkErrorCode::AddressInUse;
            message = "Address already in use";
            break;

        case EADDRNOTAVAIL:
            code = NetworkErrorCode::AddressNotAvailable;
            message = "Address not available";
            break;

        case EMFILE:
        case ENFILE:
            code = NetworkErrorCode::TooManyOpenFiles;
            message = "Too many open files";
            break;

        case EACCES:
        case EPERM:
            code = NetworkErrorCode::PermissionDenied;
            message = "Permission denied";
            break;

        case ETIMEDOUT:
            code = NetworkErrorCode::Timeout;
            message = "Operation timed out";
            break;

        default:
            code = NetworkErrorCode::Unknown;
            message = strerror(err);
            break;
    }

    return NetworkError{code, message, err};
}

} // namespace linux
} // namespace pal
} // namespace faultline
