#pragma once

#include <json/json.h>
#include <chrono>
#include <string>
#include <utility>

namespace codegate {

// Owning file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1);
    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

enum class ReadStatus {
    OK,
    CLOSED,       // Peer hung up
    TIMEOUT,      // Deadline passed before a full message arrived
    MALFORMED     // Oversized frame or invalid JSON
};

// Length-prefixed JSON messages over a stream socket: a 4-byte big-endian
// payload length followed by compact JSON text.
class MessageChannel {
public:
    explicit MessageChannel(UniqueFd fd);

    // Connected AF_UNIX stream pair; throws std::system_error
    static std::pair<UniqueFd, UniqueFd> create_pair();

    // Compact JSON text of a message, as framed by send()
    static std::string serialize(const Json::Value& message);

    // False when the peer is gone or the message exceeds MAX_FRAME_BYTES
    bool send(const Json::Value& message);

    // Blocks until a message or end of stream
    ReadStatus receive(Json::Value& message);

    // Gives up at `deadline`
    ReadStatus receive(Json::Value& message, std::chrono::steady_clock::time_point deadline);

    int fd() const { return fd_.get(); }

private:
    UniqueFd fd_;
    std::string buffer_;

    // Pops one complete frame from the buffer if present
    bool extract(Json::Value& message, ReadStatus& status);
    ReadStatus fill(int timeout_ms);
};

} // namespace codegate
