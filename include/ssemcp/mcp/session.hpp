#pragma once
#include "ssemcp/types.hpp"

#include <mutex>
#include <string>

namespace ssemcp::mcp
{

enum class SessionState
{
    Uninitialized, ///< no initialize received yet
    Initializing,  ///< initialize answered, waiting for the initialized notification
    Ready          ///< handshake complete
};

inline std::string to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Uninitialized:
        return "uninitialized";
    case SessionState::Initializing:
        return "initializing";
    case SessionState::Ready:
        return "ready";
    }
    return "uninitialized";
}

/**
 * Per-connection protocol state.
 *
 * Lives as long as the SSE stream it was created for. Mutated only by the
 * ProtocolHandler; each accessor takes the session lock so concurrent POSTs
 * against one session never tear a field (their relative order is unspecified).
 */
class Session
{
  public:
    explicit Session(std::string id = {}) : id_(std::move(id)) {}

    const std::string& id() const
    {
        return id_;
    }

    SessionState state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }
    bool initialized() const
    {
        return state() == SessionState::Ready;
    }

    ssemcp::Json client_capabilities() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_capabilities_;
    }
    ssemcp::Json client_info() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return client_info_;
    }
    std::string protocol_version() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return protocol_version_;
    }

    /// Record the client's half of the handshake and move to Initializing.
    /// A repeated initialize restarts the handshake.
    void begin_initialize(std::string protocol_version, ssemcp::Json capabilities,
                          ssemcp::Json client_info)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        protocol_version_ = std::move(protocol_version);
        client_capabilities_ = std::move(capabilities);
        client_info_ = std::move(client_info);
        state_ = SessionState::Initializing;
    }

    /// Move to Ready. Returns false if the session already was Ready.
    bool mark_initialized()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Ready)
            return false;
        state_ = SessionState::Ready;
        return true;
    }

  private:
    std::string id_;
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    ssemcp::Json client_capabilities_ = ssemcp::Json::object();
    ssemcp::Json client_info_;
    std::string protocol_version_;
};

} // namespace ssemcp::mcp
