#include "cortexgrid/network/SessionManager.hpp"

#include "cortexgrid/crypto/CryptoManager.hpp"
#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace cortexgrid::network {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

constexpr std::size_t kLengthFieldSize = sizeof(std::uint32_t);
// Handshake messages are small; anything larger is refused before authentication.
constexpr std::size_t kMaxHandshakeFrame = 64 * 1024;
constexpr std::size_t kDrainChunk = 4096;
constexpr std::chrono::seconds kTeardownWait{2};

std::string session_id_string(const SessionId& id) {
    return bytes_to_hex(id.data(), id.size());
}

}  // namespace

SessionManager::SessionManager(const LocalIdentity& identity, NonceLedger& ledger, HandshakeSettings settings)
    : identity_(identity),
      ledger_(ledger),
      settings_(std::move(settings)) {}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::start(const std::string& host, std::uint16_t port) {
    if (running_) {
        return;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address: " + host);
    }

    const SocketHandle server_socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (server_socket == kInvalidSocket) {
        throw std::runtime_error("Failed to create listen socket");
    }

    int opt = 1;
    if (::setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close_socket(server_socket);
        throw std::runtime_error("Failed to configure listen socket");
    }

    if (::bind(server_socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto error = errno;
        close_socket(server_socket);
        throw std::runtime_error("Failed to bind listen socket: error " + std::to_string(error));
    }

    if (::listen(server_socket, SOMAXCONN) < 0) {
        const auto error = errno;
        close_socket(server_socket);
        throw std::runtime_error("Failed to listen on socket: error " + std::to_string(error));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_socket, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    listen_socket_ = server_socket;
    running_ = true;
    accept_thread_ = std::thread(&SessionManager::accept_loop, this);

    log_event(StructuredLogger::Level::Info,
              "transport.listening",
              {{"host", host}, {"port", std::to_string(bound_port_)}});
}

void SessionManager::stop() {
    if (running_.exchange(false)) {
        close_socket(listen_socket_);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        listen_socket_ = kInvalidSocket;
    }

    teardown_sessions();

    const auto deadline = std::chrono::steady_clock::now() + kTeardownWait;
    while (pending_handshakes_.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void SessionManager::set_message_handler(MessageHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    on_message_ = std::move(handler);
}

void SessionManager::set_session_handler(SessionHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    on_session_ = std::move(handler);
}

void SessionManager::set_disconnect_handler(DisconnectHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    on_disconnect_ = std::move(handler);
}

Result<NodeId> SessionManager::connect(const std::string& host,
                                       std::uint16_t port,
                                       std::optional<NodeId> expected_peer) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* resolved = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &resolved); err != 0 || resolved == nullptr) {
        if (resolved != nullptr) {
            ::freeaddrinfo(resolved);
        }
        return make_error(ErrorCode::NotConnected, "cannot resolve " + host);
    }

    sockaddr_in address = *reinterpret_cast<sockaddr_in*>(resolved->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(resolved);

    const SocketHandle socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket == kInvalidSocket) {
        return make_error(ErrorCode::NotConnected, "socket() failed");
    }

    if (::connect(socket, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        const auto error = errno;
        close_socket(socket);
        return make_error(ErrorCode::NotConnected,
                          host + ":" + std::to_string(port) + " refused, error " + std::to_string(error));
    }

    auto handshake = Handshake::initiator(identity_, ledger_, settings_, expected_peer);
    auto hello = handshake.start();
    if (!hello) {
        close_socket(socket);
        return hello.error();
    }

    auto session = drive_handshake(socket, handshake, std::move(hello).value());
    if (!session) {
        close_socket(socket);
        return session.error();
    }

    const auto peer = session->peer().node_id;
    register_session(socket, std::move(session).value(), "outbound");
    return peer;
}

Status SessionManager::send(const NodeId& peer, const protocol::Message& message) {
    std::shared_ptr<Connection> connection;
    {
        std::scoped_lock lock(sessions_mutex_);
        const auto it = sessions_.find(node_id_to_string(peer));
        if (it != sessions_.end()) {
            connection = it->second;
        }
    }
    if (!connection || !connection->running.load()) {
        return make_error(ErrorCode::NotConnected, "no session with " + node_id_to_string(peer));
    }

    const auto frame = connection->session.seal(message);
    const auto limit = static_cast<std::size_t>(connection->session.params().max_message_size) +
                       crypto::CryptoManager::kFrameOverhead + protocol::kEnvelopeHeaderSize;
    if (frame.size() > limit) {
        return make_error(ErrorCode::Malformed, "message exceeds negotiated maximum");
    }

    bool written = false;
    {
        std::scoped_lock lock(connection->write_mutex);
        written = write_frame(connection->socket, frame);
    }
    if (!written) {
        auto error = make_error(ErrorCode::ConnectionReset, "write failed");
        release(peer, connection, error);
        return error;
    }
    return {};
}

bool SessionManager::disconnect(const NodeId& peer) {
    std::shared_ptr<Connection> connection;
    {
        std::scoped_lock lock(sessions_mutex_);
        const auto it = sessions_.find(node_id_to_string(peer));
        if (it == sessions_.end()) {
            return false;
        }
        connection = it->second;
        sessions_.erase(it);
    }
    connection->running.store(false);
    close_connection(connection);
    log_event(StructuredLogger::Level::Info, "session.disconnected", {{"peer", node_id_to_string(peer)}});
    return true;
}

bool SessionManager::is_connected(const NodeId& peer) const {
    std::scoped_lock lock(sessions_mutex_);
    const auto it = sessions_.find(node_id_to_string(peer));
    return it != sessions_.end() && it->second->running.load();
}

std::optional<protocol::Capabilities> SessionManager::peer_capabilities(const NodeId& peer) const {
    std::scoped_lock lock(sessions_mutex_);
    const auto it = sessions_.find(node_id_to_string(peer));
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->session.peer_capabilities();
}

std::vector<NodeId> SessionManager::connected_peers() const {
    std::scoped_lock lock(sessions_mutex_);
    std::vector<NodeId> peers;
    peers.reserve(sessions_.size());
    for (const auto& [_, connection] : sessions_) {
        peers.push_back(connection->session.peer().node_id);
    }
    return peers;
}

std::size_t SessionManager::active_session_count() const {
    std::scoped_lock lock(sessions_mutex_);
    return sessions_.size();
}

void SessionManager::accept_loop() {
    while (running_) {
        sockaddr_in remote{};
        socklen_t len = sizeof(remote);
        const SocketHandle client = ::accept(listen_socket_, reinterpret_cast<sockaddr*>(&remote), &len);
        if (client == kInvalidSocket) {
            if (running_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }

        ++pending_handshakes_;
        std::thread(&SessionManager::serve_inbound, this, client).detach();
    }
}

void SessionManager::serve_inbound(SocketHandle socket) {
    auto handshake = Handshake::responder(identity_, ledger_, settings_);
    auto session = drive_handshake(socket, handshake, std::nullopt);
    if (!session) {
        log_event(StructuredLogger::Level::Warning,
                  "session.inbound_rejected",
                  {{"endpoint", endpoint_string(socket)}, {"code", to_string(session.error().code)}});
        close_socket(socket);
    } else if (!running_) {
        close_socket(socket);
    } else {
        register_session(socket, std::move(session).value(), "inbound");
    }
    --pending_handshakes_;
}

Result<Session> SessionManager::drive_handshake(SocketHandle socket,
                                                Handshake& handshake,
                                                std::optional<protocol::Message> first) {
    set_recv_timeout(socket, std::chrono::duration_cast<std::chrono::milliseconds>(settings_.timeout));

    if (first.has_value() && !write_frame(socket, protocol::encode(*first))) {
        handshake.cancel();
        return make_error(ErrorCode::ConnectionReset, "could not send handshake message");
    }

    while (!handshake.completed()) {
        const auto frame = read_frame(socket, kMaxHandshakeFrame);
        if (!frame.has_value() || frame->empty()) {
            const auto timed_out = handshake.elapsed() >= settings_.timeout;
            handshake.cancel();
            return make_error(timed_out ? ErrorCode::Timeout : ErrorCode::ConnectionReset,
                              timed_out ? "handshake deadline exceeded" : "connection closed during handshake");
        }

        const auto decoded = protocol::decode(*frame);
        if (!decoded) {
            handshake.cancel();
            return decoded.error();
        }

        auto reply = handshake.process(*decoded);
        if (!reply) {
            const auto error = reply.error();
            const auto notice = protocol::encode(protocol::make_error_message(error.code, decoded->kind(), error.message));
            if (decoded->kind() != protocol::MessageKind::Error && !write_frame(socket, notice)) {
                log_event(StructuredLogger::Level::Info,
                          "handshake.notice_unsent",
                          {{"code", to_string(error.code)}});
            }
            return error;
        }
        if (reply->has_value() && !write_frame(socket, protocol::encode(**reply))) {
            handshake.cancel();
            return make_error(ErrorCode::ConnectionReset, "could not send handshake reply");
        }
    }

    set_recv_timeout(socket, std::chrono::milliseconds::zero());
    auto session = handshake.take_session();
    if (!session.has_value()) {
        return make_error(ErrorCode::UnexpectedMessage, "handshake finished without a session");
    }
    return std::move(*session);
}

void SessionManager::register_session(SocketHandle socket, Session session, const char* origin) {
    const auto peer = session.peer().node_id;
    auto connection = std::make_shared<Connection>(socket, std::move(session), endpoint_string(socket));

    std::shared_ptr<Connection> replaced;
    {
        std::scoped_lock lock(sessions_mutex_);
        auto& slot = sessions_[node_id_to_string(peer)];
        replaced = std::move(slot);
        slot = connection;
    }
    if (replaced) {
        replaced->running.store(false);
        close_connection(replaced);
    }

    log_event(StructuredLogger::Level::Info,
              "session.established",
              {{"peer", node_id_to_string(peer)},
               {"endpoint", connection->endpoint},
               {"origin", origin},
               {"session", session_id_string(connection->session.id())},
               {"replaced", replaced ? "true" : "false"}});

    SessionHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = on_session_;
    }
    if (handler) {
        handler(peer, connection->session);
    }

    std::thread(&SessionManager::receive_loop, this, peer, connection).detach();
}

void SessionManager::receive_loop(NodeId peer, std::shared_ptr<Connection> connection) {
    const auto limit = static_cast<std::size_t>(connection->session.params().max_message_size) +
                       crypto::CryptoManager::kFrameOverhead + protocol::kEnvelopeHeaderSize;
    auto reason = make_error(ErrorCode::ConnectionReset, "connection closed by peer");

    while (connection->running.load()) {
        const auto frame = read_frame(connection->socket, limit);
        if (!frame.has_value()) {
            break;
        }
        if (frame->empty()) {
            log_event(StructuredLogger::Level::Warning,
                      "protocol.dropped",
                      {{"peer", node_id_to_string(peer)}, {"code", to_string(ErrorCode::Malformed)}});
            continue;
        }

        auto message = connection->session.open(*frame);
        if (!message) {
            if (message.error().code == ErrorCode::DecryptionFailed) {
                reason = message.error();
                log_event(StructuredLogger::Level::Error,
                          "session.auth_failed",
                          {{"peer", node_id_to_string(peer)}, {"detail", reason.message}});
                break;
            }
            log_event(StructuredLogger::Level::Warning,
                      "protocol.dropped",
                      {{"peer", node_id_to_string(peer)},
                       {"code", to_string(message.error().code)},
                       {"detail", message.error().message}});
            continue;
        }

        MessageHandler handler;
        {
            std::scoped_lock lock(handler_mutex_);
            handler = on_message_;
        }
        if (handler) {
            handler(peer, *message);
        }
    }

    release(peer, connection, reason);
    connection->alive.store(false);
}

void SessionManager::release(const NodeId& peer, const std::shared_ptr<Connection>& connection, const Error& reason) {
    connection->running.store(false);
    close_connection(connection);

    bool current = false;
    {
        std::scoped_lock lock(sessions_mutex_);
        const auto it = sessions_.find(node_id_to_string(peer));
        if (it != sessions_.end() && it->second == connection) {
            sessions_.erase(it);
            current = true;
        }
    }
    if (!current) {
        return;
    }

    log_event(StructuredLogger::Level::Warning,
              "session.closed",
              {{"peer", node_id_to_string(peer)}, {"code", to_string(reason.code)}});

    DisconnectHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = on_disconnect_;
    }
    if (handler) {
        handler(peer, reason);
    }
}

void SessionManager::teardown_sessions() {
    std::unordered_map<std::string, std::shared_ptr<Connection>> sessions_copy;
    {
        std::scoped_lock lock(sessions_mutex_);
        sessions_copy.swap(sessions_);
    }

    for (auto& [_, connection] : sessions_copy) {
        connection->running.store(false);
        close_connection(connection);

        const auto deadline = std::chrono::steady_clock::now() + kTeardownWait;
        while (connection->alive.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (connection->alive.load()) {
            log_event(StructuredLogger::Level::Error,
                      "session.teardown_timeout",
                      {{"endpoint", connection->endpoint}});
        }
    }
}

bool SessionManager::write_frame(SocketHandle socket, std::span<const std::uint8_t> bytes) {
    std::vector<std::uint8_t> frame(kLengthFieldSize + bytes.size());
    const auto length = static_cast<std::uint32_t>(bytes.size());
    frame[0] = static_cast<std::uint8_t>(length & 0xFFu);
    frame[1] = static_cast<std::uint8_t>((length >> 8) & 0xFFu);
    frame[2] = static_cast<std::uint8_t>((length >> 16) & 0xFFu);
    frame[3] = static_cast<std::uint8_t>((length >> 24) & 0xFFu);
    std::copy(bytes.begin(), bytes.end(), frame.begin() + kLengthFieldSize);
    return send_all(socket, frame.data(), frame.size());
}

std::optional<std::vector<std::uint8_t>> SessionManager::read_frame(SocketHandle socket, std::size_t max_size) {
    std::array<std::uint8_t, kLengthFieldSize> length_bytes{};
    if (!recv_all(socket, length_bytes.data(), length_bytes.size())) {
        return std::nullopt;
    }
    const auto length = static_cast<std::uint32_t>(length_bytes[0])
        | (static_cast<std::uint32_t>(length_bytes[1]) << 8)
        | (static_cast<std::uint32_t>(length_bytes[2]) << 16)
        | (static_cast<std::uint32_t>(length_bytes[3]) << 24);

    if (length > max_size) {
        // Discard the oversized frame so the stream stays aligned.
        std::array<std::uint8_t, kDrainChunk> sink{};
        std::size_t remaining = length;
        while (remaining > 0) {
            const auto step = std::min(remaining, sink.size());
            if (!recv_all(socket, sink.data(), step)) {
                return std::nullopt;
            }
            remaining -= step;
        }
        return std::vector<std::uint8_t>{};
    }

    std::vector<std::uint8_t> buffer(length);
    if (length > 0 && !recv_all(socket, buffer.data(), buffer.size())) {
        return std::nullopt;
    }
    return buffer;
}

bool SessionManager::send_all(SocketHandle socket, const std::uint8_t* data, std::size_t length) {
    std::size_t sent_total = 0;
    while (sent_total < length) {
        const auto sent = ::send(socket, data + sent_total, length - sent_total, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && errno == EINTR) {
                continue;
            }
            return false;
        }
        sent_total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool SessionManager::recv_all(SocketHandle socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t received_total = 0;
    while (received_total < length) {
        const auto received = ::recv(socket, buffer + received_total, length - received_total, 0);
        if (received <= 0) {
            if (received < 0 && errno == EINTR) {
                continue;
            }
            return false;
        }
        received_total += static_cast<std::size_t>(received);
    }
    return true;
}

bool SessionManager::set_recv_timeout(SocketHandle socket, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

void SessionManager::close_socket(SocketHandle socket) {
    if (socket == kInvalidSocket) {
        return;
    }
    ::shutdown(socket, SHUT_RDWR);
    ::close(socket);
}

void SessionManager::close_connection(const std::shared_ptr<Connection>& connection) {
    bool expected = false;
    if (connection->socket_closed.compare_exchange_strong(expected, true)) {
        close_socket(connection->socket);
    }
}

std::string SessionManager::endpoint_string(SocketHandle socket) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        char buffer[INET_ADDRSTRLEN]{};
        if (const char* text = ::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer))) {
            return std::string(text) + ":" + std::to_string(ntohs(addr.sin_port));
        }
    }
    return "unknown";
}

}  // namespace cortexgrid::network
