#include "connection.hpp"

#include "signal_message.hpp"

#include <unistd.h>
#include <utility>

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Opened: return "opened";
        case ConnectionState::Reading: return "reading";
        case ConnectionState::Matched: return "matched";
        case ConnectionState::Ignored: return "ignored";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

Connection::Connection(int fd, std::string peer, std::string expected_signal)
    : fd_(fd), peer_(std::move(peer)), expected_(std::move(expected_signal)) {}

Connection::~Connection() {
    close_fd();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), peer_(std::move(other.peer_)),
      expected_(std::move(other.expected_)),
      state_(std::exchange(other.state_, ConnectionState::Closed)),
      error_(std::move(other.error_)), chunks_(other.chunks_), matches_(other.matches_) {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close_fd();
        fd_ = std::exchange(other.fd_, -1);
        peer_ = std::move(other.peer_);
        expected_ = std::move(other.expected_);
        state_ = std::exchange(other.state_, ConnectionState::Closed);
        error_ = std::move(other.error_);
        chunks_ = other.chunks_;
        matches_ = other.matches_;
    }
    return *this;
}

void Connection::start() {
    if (state_ == ConnectionState::Opened) {
        state_ = ConnectionState::Reading;
    }
}

ChunkOutcome Connection::on_chunk(std::string_view chunk) {
    if (state_ == ConnectionState::Closed) return ChunkOutcome::Rejected;
    start();
    chunks_++;

    if (!signal_message::is_valid_utf8(chunk)) {
        state_ = ConnectionState::Reading;
        return ChunkOutcome::Undecodable;
    }

    if (chunk == expected_) {
        state_ = ConnectionState::Matched;
        matches_++;
        return ChunkOutcome::Matched;
    }

    state_ = ConnectionState::Ignored;
    return ChunkOutcome::Ignored;
}

void Connection::on_complete() {
    state_ = ConnectionState::Closed;
    close_fd();
}

void Connection::on_error(std::string reason) {
    error_ = std::move(reason);
    state_ = ConnectionState::Closed;
    close_fd();
}

void Connection::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
