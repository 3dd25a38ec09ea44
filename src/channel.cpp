#include "channel.h"
#include "codegate/constants.h"
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <system_error>

namespace codegate {

namespace {

constexpr size_t HEADER_BYTES = 4;

std::string encode_frame(const std::string& payload) {
    uint32_t length = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(HEADER_BYTES + payload.size());
    frame += static_cast<char>((length >> 24) & 0xFF);
    frame += static_cast<char>((length >> 16) & 0xFF);
    frame += static_cast<char>((length >> 8) & 0xFF);
    frame += static_cast<char>(length & 0xFF);
    frame += payload;
    return frame;
}

} // namespace

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

MessageChannel::MessageChannel(UniqueFd fd) : fd_(std::move(fd)) {}

std::pair<UniqueFd, UniqueFd> MessageChannel::create_pair() {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
        throw std::system_error(errno, std::generic_category(), "socketpair");
    }
    return {UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::string MessageChannel::serialize(const Json::Value& message) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, message);
}

bool MessageChannel::send(const Json::Value& message) {
    std::string payload = serialize(message);
    if (payload.size() > MAX_FRAME_BYTES) return false;

    std::string frame = encode_frame(payload);
    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd_.get(), frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool MessageChannel::extract(Json::Value& message, ReadStatus& status) {
    if (buffer_.size() < HEADER_BYTES) return false;
    uint32_t length = (static_cast<uint32_t>(static_cast<unsigned char>(buffer_[0])) << 24) |
                      (static_cast<uint32_t>(static_cast<unsigned char>(buffer_[1])) << 16) |
                      (static_cast<uint32_t>(static_cast<unsigned char>(buffer_[2])) << 8) |
                      static_cast<uint32_t>(static_cast<unsigned char>(buffer_[3]));
    if (length > MAX_FRAME_BYTES) {
        status = ReadStatus::MALFORMED;
        return true;
    }
    if (buffer_.size() < HEADER_BYTES + length) return false;

    Json::CharReaderBuilder builder;
    builder["stackLimit"] = static_cast<Json::UInt>(MAX_MESSAGE_NESTING);
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    const char* begin = buffer_.data() + HEADER_BYTES;
    std::string errors;
    bool parsed = false;
    try {
        parsed = reader->parse(begin, begin + length, &message, &errors);
    } catch (const Json::Exception&) {
        parsed = false;
    }
    buffer_.erase(0, HEADER_BYTES + length);
    status = (parsed && message.isObject()) ? ReadStatus::OK : ReadStatus::MALFORMED;
    return true;
}

ReadStatus MessageChannel::fill(int timeout_ms) {
    pollfd pfd{fd_.get(), POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
        if (errno == EINTR) return ReadStatus::OK;
        return ReadStatus::CLOSED;
    }
    if (ready == 0) return ReadStatus::TIMEOUT;

    char chunk[PIPE_BUFFER_SIZE];
    ssize_t n = ::recv(fd_.get(), chunk, sizeof(chunk), 0);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) return ReadStatus::OK;
        return ReadStatus::CLOSED;
    }
    if (n == 0) return ReadStatus::CLOSED;
    buffer_.append(chunk, static_cast<size_t>(n));
    return ReadStatus::OK;
}

ReadStatus MessageChannel::receive(Json::Value& message) {
    ReadStatus status = ReadStatus::OK;
    while (!extract(message, status)) {
        ReadStatus filled = fill(-1);
        if (filled != ReadStatus::OK) return filled;
    }
    return status;
}

ReadStatus MessageChannel::receive(Json::Value& message, std::chrono::steady_clock::time_point deadline) {
    ReadStatus status = ReadStatus::OK;
    while (!extract(message, status)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) return ReadStatus::TIMEOUT;
        ReadStatus filled = fill(static_cast<int>(remaining.count()) + 1);
        if (filled != ReadStatus::OK) return filled;
    }
    return status;
}

} // namespace codegate
