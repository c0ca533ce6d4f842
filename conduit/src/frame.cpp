#include <conduit/frame.hpp>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace conduit::frame {

namespace {

using Clock = std::chrono::steady_clock;

// Milliseconds left before the deadline, -1 for none
struct Deadline {
    bool bounded = false;
    Clock::time_point at;

    static Deadline after(int timeout_ms) {
        Deadline d;
        if (timeout_ms >= 0) {
            d.bounded = true;
            d.at = Clock::now() + std::chrono::milliseconds(timeout_ms);
        }
        return d;
    }

    int remaining_ms() const {
        if (!bounded) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at - Clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }
};

void wait_ready(int fd, short events, const Deadline& deadline, const char* what) {
    while (true) {
        pollfd pfd = {fd, events, 0};
        int ret = ::poll(&pfd, 1, deadline.remaining_ms());
        if (ret > 0) return;
        if (ret == 0) {
            throw TransportError(std::string(what) + " timed out");
        }
        if (errno != EINTR) {
            throw TransportError(std::string("poll() failed: ") + strerror(errno));
        }
    }
}

// Read until n bytes arrived or the peer closed. Returns bytes read.
size_t read_fully(int fd, char* buf, size_t n, const Deadline& deadline) {
    size_t got = 0;
    while (got < n) {
        wait_ready(fd, POLLIN, deadline, "read");
        ssize_t r = ::recv(fd, buf + got, n - got, MSG_DONTWAIT);
        if (r > 0) {
            got += static_cast<size_t>(r);
        } else if (r == 0) {
            break;
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw TransportError(std::string("read() failed: ") + strerror(errno));
        }
    }
    return got;
}

void write_fully(int fd, const char* buf, size_t n, const Deadline& deadline) {
    size_t sent = 0;
    while (sent < n) {
        wait_ready(fd, POLLOUT, deadline, "write");
        ssize_t w = ::send(fd, buf + sent, n - sent, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (w > 0) {
            sent += static_cast<size_t>(w);
        } else if (w < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            throw TransportError(std::string("write() failed: ") + strerror(errno));
        }
    }
}

}  // anonymous namespace

std::string encode(const std::string& payload) {
    if (payload.empty()) {
        throw FramingError("refusing to encode empty payload");
    }
    if (payload.size() > MAX_PAYLOAD_SIZE) {
        throw FramingError("message too large: " + std::to_string(payload.size()) + " bytes");
    }

    auto len = static_cast<uint32_t>(payload.size());
    std::string out;
    out.reserve(HEADER_SIZE + payload.size());
    out += static_cast<char>((len >> 24) & 0xFF);
    out += static_cast<char>((len >> 16) & 0xFF);
    out += static_cast<char>((len >> 8) & 0xFF);
    out += static_cast<char>(len & 0xFF);
    out += payload;
    return out;
}

uint32_t decode_length(const std::array<unsigned char, HEADER_SIZE>& header) {
    uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                   (static_cast<uint32_t>(header[1]) << 16) |
                   (static_cast<uint32_t>(header[2]) << 8) |
                   static_cast<uint32_t>(header[3]);
    if (len == 0) {
        throw FramingError("received empty message");
    }
    if (len > MAX_PAYLOAD_SIZE) {
        throw FramingError("message too large: " + std::to_string(len) + " bytes");
    }
    return len;
}

std::string decode(const std::string& buffer, size_t* consumed) {
    if (buffer.size() < HEADER_SIZE) {
        throw FramingError("truncated frame header");
    }
    std::array<unsigned char, HEADER_SIZE> header;
    std::memcpy(header.data(), buffer.data(), HEADER_SIZE);
    uint32_t len = decode_length(header);

    if (buffer.size() - HEADER_SIZE < len) {
        throw FramingError("truncated frame: expected " + std::to_string(len) +
                           " payload bytes, have " + std::to_string(buffer.size() - HEADER_SIZE));
    }
    if (consumed) *consumed = HEADER_SIZE + len;
    return buffer.substr(HEADER_SIZE, len);
}

std::optional<std::string> read_frame(int fd, int timeout_ms) {
    auto deadline = Deadline::after(timeout_ms);

    std::array<unsigned char, HEADER_SIZE> header;
    size_t got = read_fully(fd, reinterpret_cast<char*>(header.data()), HEADER_SIZE, deadline);
    if (got == 0) {
        return std::nullopt;
    }
    if (got < HEADER_SIZE) {
        throw FramingError("connection closed inside frame header");
    }

    uint32_t len = decode_length(header);

    std::string payload(len, '\0');
    got = read_fully(fd, &payload[0], len, deadline);
    if (got < len) {
        throw FramingError("connection closed after " + std::to_string(got) + " of " +
                           std::to_string(len) + " payload bytes");
    }
    return payload;
}

void write_frame(int fd, const std::string& payload, int timeout_ms) {
    std::string bytes = encode(payload);
    write_fully(fd, bytes.data(), bytes.size(), Deadline::after(timeout_ms));
}

} // namespace conduit::frame
