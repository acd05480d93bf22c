#pragma once

#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"
#include "cortexgrid/core/Identity.hpp"
#include "cortexgrid/network/Handshake.hpp"
#include "cortexgrid/network/NonceLedger.hpp"
#include "cortexgrid/network/Session.hpp"
#include "cortexgrid/protocol/Message.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cortexgrid::network {

// TCP transport. Every connection runs the four-message handshake in plain
// frames, then carries sealed frames under the session key. Frames are a
// u32 little-endian length followed by the bytes.
class SessionManager {
public:
    using MessageHandler = std::function<void(const NodeId& peer, const protocol::Message& message)>;
    using SessionHandler = std::function<void(const NodeId& peer, const Session& session)>;
    using DisconnectHandler = std::function<void(const NodeId& peer, const Error& reason)>;
    using SocketHandle = int;
    static constexpr SocketHandle kInvalidSocket = -1;

    SessionManager(const LocalIdentity& identity, NonceLedger& ledger, HandshakeSettings settings);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Throws std::runtime_error when the listener cannot be set up.
    void start(const std::string& host, std::uint16_t port);
    void stop();
    std::uint16_t listening_port() const noexcept { return bound_port_; }

    void set_message_handler(MessageHandler handler);
    void set_session_handler(SessionHandler handler);
    void set_disconnect_handler(DisconnectHandler handler);

    // Dials and runs the initiator handshake within the handshake timeout.
    Result<NodeId> connect(const std::string& host,
                           std::uint16_t port,
                           std::optional<NodeId> expected_peer = std::nullopt);
    Status send(const NodeId& peer, const protocol::Message& message);
    bool disconnect(const NodeId& peer);

    bool is_connected(const NodeId& peer) const;
    std::optional<protocol::Capabilities> peer_capabilities(const NodeId& peer) const;
    std::vector<NodeId> connected_peers() const;
    std::size_t active_session_count() const;

private:
    struct Connection {
        Connection(SocketHandle handle, Session established, std::string remote)
            : socket(handle), session(std::move(established)), endpoint(std::move(remote)) {}

        SocketHandle socket;
        Session session;
        std::string endpoint;
        std::mutex write_mutex;
        std::atomic<bool> running{true};
        std::atomic<bool> alive{true};
        std::atomic<bool> socket_closed{false};
    };

    void accept_loop();
    void serve_inbound(SocketHandle socket);
    Result<Session> drive_handshake(SocketHandle socket, Handshake& handshake, std::optional<protocol::Message> first);
    void register_session(SocketHandle socket, Session session, const char* origin);
    void receive_loop(NodeId peer, std::shared_ptr<Connection> connection);
    void release(const NodeId& peer, const std::shared_ptr<Connection>& connection, const Error& reason);
    void teardown_sessions();

    static bool write_frame(SocketHandle socket, std::span<const std::uint8_t> bytes);
    static std::optional<std::vector<std::uint8_t>> read_frame(SocketHandle socket, std::size_t max_size);
    static bool send_all(SocketHandle socket, const std::uint8_t* data, std::size_t length);
    static bool recv_all(SocketHandle socket, std::uint8_t* buffer, std::size_t length);
    static bool set_recv_timeout(SocketHandle socket, std::chrono::milliseconds timeout);
    static void close_socket(SocketHandle socket);
    static void close_connection(const std::shared_ptr<Connection>& connection);
    static std::string endpoint_string(SocketHandle socket);

    const LocalIdentity& identity_;
    NonceLedger& ledger_;
    HandshakeSettings settings_;

    mutable std::mutex handler_mutex_;
    MessageHandler on_message_{};
    SessionHandler on_session_{};
    DisconnectHandler on_disconnect_{};

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> pending_handshakes_{0};
    SocketHandle listen_socket_{kInvalidSocket};
    std::thread accept_thread_;
    std::uint16_t bound_port_{0};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> sessions_;
};

}  // namespace cortexgrid::network
