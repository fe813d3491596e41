#pragma once

#include <toolpipe/core/result.hpp>
#include <toolpipe/protocol/dispatcher.hpp>
#include <toolpipe/protocol/frame_codec.hpp>
#include <toolpipe/protocol/handshake.hpp>
#include <toolpipe/protocol/i_transport.hpp>
#include <toolpipe/protocol/tool_registry.hpp>

#include <cstddef>
#include <cstdint>

namespace toolpipe {

enum class SessionState {
    AwaitingHandshake,
    Ready,
    Draining,
    Closed,
};

const char* SessionStateName(SessionState state);

struct SessionOptions {
    std::size_t max_frame_bytes = kDefaultMaxFrameBytes;
    std::size_t read_chunk_bytes = 64 * 1024;
    ServerProfile profile = DefaultServerProfile();
};

struct SessionStats {
    std::uint64_t frames_in = 0;
    std::uint64_t frames_out = 0;
    std::uint64_t calls = 0;
    std::uint64_t failed_calls = 0;
};

// ---------------------------------------------------------------------------
// Session: one client paired with this server over one transport.
//
// Run() drives the handshake, then answers list_tools and call messages
// strictly in arrival order until the stream ends. A handler that blocks
// blocks the whole session.
//
// Run() returns Ok on a clean end of stream. Otherwise it returns the fatal
// error for the owning process to act on:
//   Framing / Transport           nothing is sent, the stream is unusable
//   ProtocolSequence / Version..  an ErrorNotice is sent first
// The session is Closed afterwards in every case and cannot be rerun.
// ---------------------------------------------------------------------------
class Session {
public:
    Session(const ToolRegistry& registry, ITransport& transport,
            SessionOptions options = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] Result<void, Error> Run();

    [[nodiscard]] SessionState State() const noexcept { return state_; }
    [[nodiscard]] const SessionStats& Stats() const noexcept { return stats_; }
    [[nodiscard]] const HandshakeCoordinator& Handshake() const noexcept {
        return handshake_;
    }

private:
    Result<void, Error> DrainFrames();
    Result<void, Error> Route(const Message& message);
    Result<void, Error> Send(const Message& message);
    Result<void, Error> Close(Error error, bool notify_peer);

    ITransport& transport_;
    SessionOptions options_;
    FrameDecoder decoder_;
    HandshakeCoordinator handshake_;
    Dispatcher dispatcher_;
    SessionState state_ = SessionState::AwaitingHandshake;
    SessionStats stats_;
};

} // namespace toolpipe
