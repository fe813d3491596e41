#pragma once

#include <toolpipe/protocol/i_transport.hpp>

#include <istream>
#include <ostream>

namespace toolpipe {

// ---------------------------------------------------------------------------
// FdTransport: POSIX file descriptors, normally stdin/stdout of the server
// process. Does not own (or close) the descriptors.
// ---------------------------------------------------------------------------
class FdTransport : public ITransport {
public:
    FdTransport(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

    [[nodiscard]] Result<std::size_t, Error> Read(char* buffer,
                                                  std::size_t capacity) override;
    [[nodiscard]] Result<void, Error> Write(std::string_view bytes) override;

private:
    int in_fd_;
    int out_fd_;
};

// ---------------------------------------------------------------------------
// StreamTransport: C++ streams. Read() returns what the stream buffer
// already holds, blocking for at most one byte when it is empty. Every
// Write() is flushed.
// ---------------------------------------------------------------------------
class StreamTransport : public ITransport {
public:
    StreamTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    [[nodiscard]] Result<std::size_t, Error> Read(char* buffer,
                                                  std::size_t capacity) override;
    [[nodiscard]] Result<void, Error> Write(std::string_view bytes) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace toolpipe
