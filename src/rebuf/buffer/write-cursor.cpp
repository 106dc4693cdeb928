// Plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <span>
#include <mutex>
#include <memory>
#include <cstddef>

// rebuf
#include <src/common/macros.hpp>
#include <src/common/exceptions.hpp>
#include <src/rebuf/buffer/chunked-buffer.hpp>

// local
#include "write-cursor.hpp"

using namespace rebuf;


std::shared_ptr<WriteCursor> WriteCursor::configure(std::size_t chunkSize) {
    return configure(ChunkedBuffer::configure({.chunkSize = chunkSize}));
}

std::shared_ptr<WriteCursor> WriteCursor::configure(std::shared_ptr<ChunkedBuffer> buffer) {
    REBUF_THROW_UNLESS(RebufInvalidArgument, "write cursor requires a buffer", buffer);
    return std::make_shared<WriteCursor>(std::move(buffer), Private());
}

WriteCursor::WriteCursor(std::shared_ptr<ChunkedBuffer> buffer, Private access)
    : buffer_(std::move(buffer))
    , closed_("write cursor")
    , position_(0)
{
    REBUF_UNUSED(access);
    PLOG(plog::debug) << "write cursor created: " << this << "; buffer: " << buffer_.get();
}

void WriteCursor::write(char byte) {
    auto open = closed_.ensureOpen();
    std::unique_lock<std::mutex> locked(positionLock_);

    buffer_->writeByte(byte, position_);
    ++position_;
}

void WriteCursor::write(std::span<const char> data, std::size_t sourceOffset, std::size_t length) {
    auto open = closed_.ensureOpen();
    std::unique_lock<std::mutex> locked(positionLock_);

    // buffer writes are all or nothing, position is advanced only on success
    buffer_->write(data, position_, sourceOffset, length);
    position_ += length;
}

void WriteCursor::write(std::span<const char> data) {
    write(data, 0, data.size());
}

void WriteCursor::close() {
    closed_.close();
    PLOG(plog::debug) << "write cursor closed: " << this;
}

std::size_t WriteCursor::position() const {
    std::unique_lock<std::mutex> locked(positionLock_);
    return position_;
}

std::shared_ptr<ChunkedBuffer> WriteCursor::buffer() const {
    return buffer_;
}
