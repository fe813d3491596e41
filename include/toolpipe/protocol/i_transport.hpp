#pragma once

#include <toolpipe/core/result.hpp>

#include <cstddef>
#include <string_view>

namespace toolpipe {

// ---------------------------------------------------------------------------
// ITransport: ordered, reliable, bidirectional byte channel.
//
// The Session depends on this interface rather than on stdin/stdout, so a
// session can run over pipes, in-memory streams or a scripted test double.
// Read() may return fewer bytes than requested; 0 means end of stream.
// Write() either writes every byte or fails.
// ---------------------------------------------------------------------------
class ITransport {
public:
    ITransport() = default;
    virtual ~ITransport() = default;

    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    [[nodiscard]] virtual Result<std::size_t, Error> Read(char* buffer,
                                                          std::size_t capacity) = 0;

    [[nodiscard]] virtual Result<void, Error> Write(std::string_view bytes) = 0;
};

} // namespace toolpipe
