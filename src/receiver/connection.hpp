#pragma once

#include <string>
#include <string_view>

enum class ConnectionState { Opened, Reading, Matched, Ignored, Closed };

enum class ChunkOutcome {
    Matched,     // chunk equals the expected signal
    Ignored,     // valid text, but not the signal
    Undecodable, // not UTF-8; dropped silently
    Rejected,    // connection already closed
};

const char* to_string(ConnectionState state);

// One accepted signal connection. Owns the socket fd and closes it on
// destruction. Each received chunk is matched on its own; chunks are never
// reassembled, so a signal split across two receives does not match.
class Connection {
public:
    Connection(int fd, std::string peer, std::string expected_signal);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Opened -> Reading
    void start();

    // Reading | Matched | Ignored -> Matched | Ignored (Undecodable keeps Reading)
    ChunkOutcome on_chunk(std::string_view chunk);

    // Peer finished sending.
    void on_complete();

    // Receive error; reason is kept for logging.
    void on_error(std::string reason);

    ConnectionState state() const { return state_; }
    int fd() const { return fd_; }
    const std::string& peer() const { return peer_; }
    const std::string& error() const { return error_; }
    size_t chunks() const { return chunks_; }
    size_t matches() const { return matches_; }

private:
    void close_fd();

    int fd_ = -1;
    std::string peer_;
    std::string expected_;
    ConnectionState state_ = ConnectionState::Opened;
    std::string error_;
    size_t chunks_ = 0;
    size_t matches_ = 0;
};
