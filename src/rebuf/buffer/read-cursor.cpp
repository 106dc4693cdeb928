// Plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <span>
#include <mutex>
#include <memory>
#include <cstddef>
#include <optional>

// rebuf
#include <src/common/macros.hpp>
#include <src/common/exceptions.hpp>
#include <src/rebuf/buffer/chunked-buffer.hpp>

// local
#include "read-cursor.hpp"

using namespace rebuf;


std::shared_ptr<ReadCursor> ReadCursor::configure(std::shared_ptr<ChunkedBuffer> buffer) {
    REBUF_THROW_UNLESS(RebufInvalidArgument, "read cursor requires a buffer", buffer);
    return std::make_shared<ReadCursor>(std::move(buffer), Private());
}

ReadCursor::ReadCursor(std::shared_ptr<ChunkedBuffer> buffer, Private access)
    : buffer_(std::move(buffer))
    , closed_("read cursor")
    , position_(0)
{
    REBUF_UNUSED(access);
    PLOG(plog::debug) << "read cursor created: " << this << "; buffer: " << buffer_.get();
}

std::optional<char> ReadCursor::read() {
    auto open = closed_.ensureOpen();
    std::unique_lock<std::mutex> locked(positionLock_);

    auto byte = buffer_->readByte(position_);
    if (byte.has_value()) {
        ++position_;
    }

    return byte;
}

std::optional<std::size_t> ReadCursor::read(std::span<char> dest, std::size_t destOffset, std::size_t length) {
    auto open = closed_.ensureOpen();
    std::unique_lock<std::mutex> locked(positionLock_);

    auto bytesRead = buffer_->read(dest, position_, destOffset, length);
    if (bytesRead.has_value()) {
        position_ += *bytesRead;
    }

    return bytesRead;
}

std::optional<std::size_t> ReadCursor::read(std::span<char> dest) {
    return read(dest, 0, dest.size());
}

void ReadCursor::reset() {
    auto open = closed_.ensureOpen();
    std::unique_lock<std::mutex> locked(positionLock_);

    position_ = 0;
}

void ReadCursor::close() {
    closed_.close();
    PLOG(plog::debug) << "read cursor closed: " << this;
}

std::size_t ReadCursor::position() const {
    std::unique_lock<std::mutex> locked(positionLock_);
    return position_;
}

std::shared_ptr<ChunkedBuffer> ReadCursor::buffer() const {
    return buffer_;
}
