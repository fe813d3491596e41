#pragma once

#include <toolpipe/core/result.hpp>
#include <toolpipe/protocol/message.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolpipe {

// Frames larger than this are rejected unless configured otherwise.
constexpr std::size_t kDefaultMaxFrameBytes = 4 * 1024 * 1024;

// Deepest array/object nesting a frame may contain.
constexpr int kMaxFrameDepth = 128;

// ---------------------------------------------------------------------------
// Message <-> JSON object mapping.
//
// MessageFromJson fails with a Framing error when the object does not
// describe a well-formed message (unknown type, missing or mistyped
// fields). Numeric correlation ids are accepted and kept as their decimal
// string. The `arguments` of a call are taken as-is; checking them is the
// Dispatcher's job.
// ---------------------------------------------------------------------------
nlohmann::json MessageToJson(const Message& message);
Result<Message, Error> MessageFromJson(const nlohmann::json& json);

// One frame: compact JSON object + '\n'. Does not throw; invalid UTF-8 in
// strings is replaced rather than rejected.
std::string EncodeFrame(const Message& message);

// ---------------------------------------------------------------------------
// FrameDecoder: incremental decoder for newline-delimited frames.
//
// Feed() accepts chunks of any size, split anywhere. Next() yields:
//   Ok(message)  a complete frame was buffered and decoded
//   Ok(nullopt)  more bytes are needed
//   Err(...)     Framing error: malformed frame, a frame nested deeper
//                than kMaxFrameDepth, or a frame (terminated or not)
//                longer than max_frame_bytes
//
// After an error the decoder stays failed and keeps returning that error.
// ---------------------------------------------------------------------------
class FrameDecoder {
public:
    using NextResult = Result<std::optional<Message>, Error>;

    explicit FrameDecoder(std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

    void Feed(std::string_view bytes);

    [[nodiscard]] NextResult Next();

    /// Buffered bytes that do not yet form a complete frame, ignoring
    /// whitespace. At end of stream this means the last frame was truncated.
    [[nodiscard]] bool HasPartialFrame() const;

    [[nodiscard]] std::size_t BufferedBytes() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t MaxFrameBytes() const noexcept { return max_frame_bytes_; }

private:
    NextResult Fail(Error error);

    std::string buffer_;
    std::size_t scan_pos_ = 0;  // bytes of buffer_ known to hold no '\n'
    std::size_t max_frame_bytes_;
    std::optional<Error> fault_;
};

} // namespace toolpipe
