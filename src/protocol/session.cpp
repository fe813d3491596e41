#include <toolpipe/protocol/session.hpp>

#include <toolpipe/core/log.hpp>

#include <string>
#include <vector>

namespace toolpipe {

namespace {

constexpr const char* kComponent = "session";

Error SequenceError(const std::string& message) {
    return Error::Make(ErrorCategory::ProtocolSequence, "Session", message);
}

// Ties a session-fatal error to the request that caused it.
Error Correlated(Error error, const Message& message) {
    if (!error.correlation_id) error.correlation_id = CorrelationId(message);
    return error;
}

} // anonymous namespace

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::AwaitingHandshake: return "AwaitingHandshake";
        case SessionState::Ready:             return "Ready";
        case SessionState::Draining:          return "Draining";
        case SessionState::Closed:            return "Closed";
    }
    return "Unknown";
}

Session::Session(const ToolRegistry& registry, ITransport& transport,
                 SessionOptions options)
    : transport_(transport),
      options_(std::move(options)),
      decoder_(options_.max_frame_bytes),
      handshake_(registry, options_.profile),
      dispatcher_(registry) {}

Result<void, Error> Session::Run() {
    if (state_ != SessionState::AwaitingHandshake) {
        return Result<void, Error>::Err(
            SequenceError("Session has already run; open a new one"));
    }

    handshake_.Begin();
    LogInfo(kComponent, "Session opened, awaiting handshake");

    std::vector<char> chunk(options_.read_chunk_bytes > 0
                                ? options_.read_chunk_bytes
                                : std::size_t{4096});
    while (true) {
        auto read = transport_.Read(chunk.data(), chunk.size());
        if (read.IsErr()) {
            return Close(std::move(read).Error(), false);
        }
        if (read.Value() == 0) break;

        decoder_.Feed(std::string_view(chunk.data(), read.Value()));
        auto drained = DrainFrames();
        if (drained.IsErr()) return drained;
    }

    state_ = SessionState::Draining;
    if (decoder_.HasPartialFrame()) {
        return Close(Error::Make(ErrorCategory::Framing, "Session",
                                 "Stream ended inside a frame (" +
                                     std::to_string(decoder_.BufferedBytes()) +
                                     " bytes unterminated)"),
                     false);
    }

    state_ = SessionState::Closed;
    LogInfo(kComponent, "Client closed the stream after " +
                            std::to_string(stats_.calls) + " calls (" +
                            std::to_string(stats_.failed_calls) + " failed)");
    return Result<void, Error>::Ok();
}

Result<void, Error> Session::DrainFrames() {
    while (true) {
        auto next = decoder_.Next();
        if (next.IsErr()) {
            return Close(std::move(next).Error(), false);
        }
        if (!next.Value().has_value()) {
            return Result<void, Error>::Ok();
        }
        ++stats_.frames_in;
        auto routed = Route(*next.Value());
        if (routed.IsErr()) return routed;
    }
}

Result<void, Error> Session::Route(const Message& message) {
    if (state_ == SessionState::AwaitingHandshake) {
        auto ack = handshake_.Handle(message);
        if (ack.IsErr()) {
            return Close(Correlated(std::move(ack).Error(), message), true);
        }
        auto sent = Send(Message(std::move(ack).Value()));
        if (sent.IsErr()) return sent;
        state_ = SessionState::Ready;
        LogInfo(kComponent, "Session ready (protocol " +
                                handshake_.NegotiatedVersion() + ")");
        return Result<void, Error>::Ok();
    }

    if (const auto* call = std::get_if<CallRequest>(&message)) {
        ++stats_.calls;
        auto response = dispatcher_.Dispatch(*call);
        if (!response.Ok()) ++stats_.failed_calls;
        return Send(Message(std::move(response)));
    }
    if (const auto* list = std::get_if<ToolListRequest>(&message)) {
        return Send(Message(dispatcher_.ListTools(*list)));
    }
    if (std::holds_alternative<HandshakeRequest>(message)) {
        auto again = handshake_.Handle(message);
        return Close(again.IsErr()
                         ? std::move(again).Error()
                         : SequenceError("Duplicate handshake"),
                     true);
    }
    return Close(Correlated(SequenceError("Unexpected '" +
                                          std::string(MessageTypeName(message)) +
                                          "' message from client"),
                            message),
                 true);
}

Result<void, Error> Session::Send(const Message& message) {
    auto written = transport_.Write(EncodeFrame(message));
    if (written.IsErr()) {
        return Close(std::move(written).Error(), false);
    }
    ++stats_.frames_out;
    return Result<void, Error>::Ok();
}

Result<void, Error> Session::Close(Error error, bool notify_peer) {
    state_ = SessionState::Draining;
    if (notify_peer) {
        ErrorNotice notice{error.KindName(), error.message, error.correlation_id};
        auto written = transport_.Write(EncodeFrame(Message(std::move(notice))));
        if (written.IsErr()) {
            LogWarn(kComponent, "Could not deliver error notice: " +
                                    written.Error().message);
        } else {
            ++stats_.frames_out;
        }
    }
    state_ = SessionState::Closed;
    LogError(kComponent, "Session closed: " + error.ToString());
    return Result<void, Error>::Err(std::move(error));
}

} // namespace toolpipe
