// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file connection.h
/// @brief Subscription handles for change handlers and result listeners.
///
/// A Connection does not own what it is connected to. It carries the
/// function that unregisters the subscription and, optionally, a liveness check that
/// tells whether the other side still holds it. Disconnecting twice, or
/// after the other side went away, is a no-op.
///
/// Usage:
/// @code
///   ScopedConnection conn = controller.add_listener(listener);
///   // ... listener is called until conn goes out of scope
/// @endcode

#pragma once

#include <functional>
#include <utility>

namespace fetched_results {

class Connection {
public:
    using Disconnector = std::function<void()>;
    using LivenessCheck = std::function<bool()>;

    Connection() noexcept = default;
    explicit Connection(Disconnector disconnector, LivenessCheck alive = {}) noexcept;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection() = default;

    void disconnect();

    [[nodiscard]] bool connected() const noexcept;
    [[nodiscard]] explicit operator bool() const noexcept { return connected(); }

private:
    Disconnector disconnector_;
    LivenessCheck alive_;
};

/// RAII wrapper for Connection - disconnects on destruction
class ScopedConnection {
public:
    ScopedConnection() noexcept = default;
    ScopedConnection(Connection conn) noexcept;
    ScopedConnection(ScopedConnection&&) noexcept = default;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(Connection conn) noexcept;
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    void reset();
    [[nodiscard]] Connection release() noexcept;
    [[nodiscard]] bool connected() const noexcept { return conn_.connected(); }
    [[nodiscard]] explicit operator bool() const noexcept { return connected(); }

private:
    Connection conn_;
};

// ============================================================
// Inline Implementations
// ============================================================

inline Connection::Connection(Disconnector disconnector, LivenessCheck alive) noexcept
    : disconnector_(std::move(disconnector)), alive_(std::move(alive)) {}

inline Connection::Connection(Connection&& other) noexcept
    : disconnector_(std::move(other.disconnector_)), alive_(std::move(other.alive_)) {
    other.disconnector_ = nullptr;
    other.alive_ = nullptr;
}

inline Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        disconnector_ = std::move(other.disconnector_);
        alive_ = std::move(other.alive_);
        other.disconnector_ = nullptr;
        other.alive_ = nullptr;
    }
    return *this;
}

inline void Connection::disconnect() {
    if (disconnector_) {
        auto d = std::move(disconnector_);
        disconnector_ = nullptr;
        alive_ = nullptr;
        d();
    }
}

inline bool Connection::connected() const noexcept {
    return disconnector_ != nullptr && (!alive_ || alive_());
}

inline ScopedConnection::ScopedConnection(Connection conn) noexcept : conn_(std::move(conn)) {}

inline ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        conn_.disconnect();
        conn_ = std::move(other.conn_);
    }
    return *this;
}

inline ScopedConnection& ScopedConnection::operator=(Connection conn) noexcept {
    conn_.disconnect();
    conn_ = std::move(conn);
    return *this;
}

inline ScopedConnection::~ScopedConnection() {
    conn_.disconnect();
}

inline void ScopedConnection::reset() {
    conn_.disconnect();
}

inline Connection ScopedConnection::release() noexcept {
    return std::move(conn_);
}

} // namespace fetched_results
