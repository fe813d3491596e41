#include <toolpipe/protocol/transport.hpp>

#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

namespace toolpipe {

namespace {

Error TransportError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorCategory::Transport, operation, message);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FdTransport
// ---------------------------------------------------------------------------
Result<std::size_t, Error> FdTransport::Read(char* buffer, std::size_t capacity) {
    while (true) {
        const auto n = ::read(in_fd_, buffer, capacity);
        if (n >= 0) {
            return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(n));
        }
        if (errno == EINTR) continue;
        return Result<std::size_t, Error>::Err(TransportError(
            "FdTransport::Read", std::string("read failed: ") + std::strerror(errno)));
    }
}

Result<void, Error> FdTransport::Write(std::string_view bytes) {
    std::size_t written = 0;
    while (written < bytes.size()) {
        const auto n = ::write(out_fd_, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void, Error>::Err(TransportError(
                "FdTransport::Write",
                std::string("write failed: ") + std::strerror(errno)));
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// StreamTransport
// ---------------------------------------------------------------------------
Result<std::size_t, Error> StreamTransport::Read(char* buffer, std::size_t capacity) {
    if (capacity == 0) {
        return Result<std::size_t, Error>::Ok(std::size_t{0});
    }
    if (in_.bad()) {
        return Result<std::size_t, Error>::Err(
            TransportError("StreamTransport::Read", "input stream is bad"));
    }
    if (in_.eof()) {
        return Result<std::size_t, Error>::Ok(std::size_t{0});
    }

    // Take what is buffered; if nothing is, block for a single byte.
    auto n = in_.readsome(buffer, static_cast<std::streamsize>(capacity));
    if (n == 0) {
        in_.read(buffer, 1);
        n = in_.gcount();
        if (n > 0 && capacity > 1) {
            n += in_.readsome(buffer + 1, static_cast<std::streamsize>(capacity - 1));
        }
    }
    if (in_.bad()) {
        return Result<std::size_t, Error>::Err(
            TransportError("StreamTransport::Read", "input stream failed"));
    }
    return Result<std::size_t, Error>::Ok(static_cast<std::size_t>(n));
}

Result<void, Error> StreamTransport::Write(std::string_view bytes) {
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(
            TransportError("StreamTransport::Write", "output stream failed"));
    }
    return Result<void, Error>::Ok();
}

} // namespace toolpipe
