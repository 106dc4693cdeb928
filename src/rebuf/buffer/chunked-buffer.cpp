// Abseil
#include <absl/strings/str_cat.h>

// Plog
#include <plog/Log.h>
#include <plog/Severity.h>

// standard
#include <span>
#include <limits>
#include <memory>
#include <vector>
#include <cstring>
#include <iterator>
#include <cstddef>
#include <optional>
#include <algorithm>

// rebuf
#include <src/common/macros.hpp>
#include <src/common/rw-lock.hpp>
#include <src/common/exceptions.hpp>
#include <src/rebuf/buffer/read-cursor.hpp>
#include <src/rebuf/buffer/write-cursor.hpp>

// local
#include "chunked-buffer.hpp"

using namespace rebuf;


ActualOffset rebuf::toActualOffset(std::size_t offset, std::size_t chunkSize) {
    return ActualOffset{
        .chunkIndex = offset / chunkSize,
        .arrayIndex = offset % chunkSize
    };
}

std::size_t rebuf::toGlobalOffset(ActualOffset offset, std::size_t chunkSize) {
    return offset.chunkIndex * chunkSize + offset.arrayIndex;
}

std::shared_ptr<ChunkedBuffer> ChunkedBuffer::configure(Settings settings) {
    return std::make_shared<ChunkedBuffer>(std::move(settings), Private());
}

ChunkedBuffer::ChunkedBuffer(Settings settings, Private access)
    : chunkSize_(settings.chunkSize)
    , usedSize_(0)
    , closed_(false)
{
    REBUF_UNUSED(access);
    REBUF_THROW_UNLESS(RebufInvalidArgument, absl::StrCat("illegal chunk size: ", chunkSize_), chunkSize_ > 0);

    chunks_.emplace_back(chunkSize_);
    PLOG(plog::debug) << "buffer created: " << this << "; chunk size: " << chunkSize_;
}

void ChunkedBuffer::ensureOpen() const {
    if (closed_) {
        PLOG(plog::warning) << "operation on closed buffer: " << this;
        throw RebufClosed("buffer is already closed");
    }
}

void ChunkedBuffer::growFor(ActualOffset last) {
    // caller holds exclusive lock
    if (last.chunkIndex < chunks_.size()) {
        return;
    }

    // allocate aside first, so that failed allocation leaves buffer untouched
    std::size_t chunksNeeded = last.chunkIndex - chunks_.size() + 1;
    std::vector<Chunk> appended;
    appended.reserve(chunksNeeded);
    for (std::size_t chunk = 0; chunk < chunksNeeded; ++chunk) {
        appended.emplace_back(chunkSize_);
    }

    chunks_.reserve(chunks_.size() + chunksNeeded);
    PLOG(plog::debug) << "buffer " << this << " grows from " << chunks_.size()
        << " to " << chunks_.size() + chunksNeeded << " chunks";
    std::move(appended.begin(), appended.end(), std::back_inserter(chunks_));
}

void ChunkedBuffer::write(std::span<const char> data, std::size_t offset, std::size_t sourceOffset, std::size_t length) {
    auto locked = lock_.exclusive();
    ensureOpen();

    if (sourceOffset > data.size() || length > data.size() - sourceOffset) {
        PLOG(plog::warning) << "rejecting write on buffer " << this << ": data size " << data.size()
            << " is smaller than source offset " << sourceOffset << " + length " << length;
        throw RebufInvalidArgument(absl::StrCat(
            "data size ", data.size(), " is smaller than source offset ", sourceOffset, " + length ", length));
    }
    REBUF_THROW_UNLESS(
        RebufInvalidArgument, 
        absl::StrCat("write at offset ", offset, " of ", length, " bytes overflows address space"), 
        length <= std::numeric_limits<std::size_t>::max() - offset);

    if (length == 0) {
        return;
    }

    growFor(toActualOffset(offset + length - 1, chunkSize_));

    auto current = toActualOffset(offset, chunkSize_);
    const char* src = data.data() + sourceOffset;
    std::size_t bytesToWrite = length;
    while (bytesToWrite > 0) {
        std::size_t portion = std::min(bytesToWrite, chunkSize_ - current.arrayIndex);
        std::memcpy(chunks_[current.chunkIndex].data() + current.arrayIndex, src, portion);

        src += portion;
        bytesToWrite -= portion;
        ++current.chunkIndex;
        current.arrayIndex = 0;
    }

    usedSize_ = std::max(usedSize_, offset + length);
}

void ChunkedBuffer::writeByte(char byte, std::size_t offset) {
    auto locked = lock_.exclusive();
    ensureOpen();

    REBUF_THROW_UNLESS(
        RebufInvalidArgument, 
        absl::StrCat("write at offset ", offset, " overflows address space"), 
        offset < std::numeric_limits<std::size_t>::max());

    auto actual = toActualOffset(offset, chunkSize_);
    growFor(actual);

    chunks_[actual.chunkIndex][actual.arrayIndex] = byte;
    usedSize_ = std::max(usedSize_, offset + 1);
}

std::optional<std::size_t> ChunkedBuffer::read(std::span<char> dest, std::size_t offset, std::size_t destOffset, std::size_t length) const {
    auto locked = lock_.shared();
    ensureOpen();

    if (destOffset > dest.size() || length > dest.size() - destOffset) {
        PLOG(plog::warning) << "rejecting read on buffer " << this << ": destination size " << dest.size()
            << " is smaller than destination offset " << destOffset << " + length " << length;
        throw RebufOutOfBounds(absl::StrCat(
            "destination size ", dest.size(), " is smaller than destination offset ", destOffset, " + length ", length));
    }

    if (offset >= usedSize_) {
        return std::nullopt;
    }

    auto current = toActualOffset(offset, chunkSize_);
    char* target = dest.data() + destOffset;
    std::size_t bytesToRead = std::min(length, usedSize_ - offset);
    std::size_t bytesRead = 0;
    // used size never exceeds allocated size, chunk bound is a safety net only
    while (bytesToRead > 0 && current.chunkIndex < chunks_.size()) {
        std::size_t portion = std::min(bytesToRead, chunkSize_ - current.arrayIndex);
        std::memcpy(target, chunks_[current.chunkIndex].data() + current.arrayIndex, portion);

        target += portion;
        bytesToRead -= portion;
        bytesRead += portion;
        ++current.chunkIndex;
        current.arrayIndex = 0;
    }

    return bytesRead;
}

std::optional<char> ChunkedBuffer::readByte(std::size_t offset) const {
    auto locked = lock_.shared();
    ensureOpen();

    if (offset >= usedSize_) {
        return std::nullopt;
    }

    auto actual = toActualOffset(offset, chunkSize_);
    return chunks_[actual.chunkIndex][actual.arrayIndex];
}

std::size_t ChunkedBuffer::size() const {
    auto locked = lock_.shared();
    ensureOpen();

    return usedSize_;
}

std::size_t ChunkedBuffer::allocatedSize() const {
    auto locked = lock_.shared();
    ensureOpen();

    return chunks_.size() * chunkSize_;
}

std::size_t ChunkedBuffer::chunkSize() const noexcept {
    return chunkSize_;
}

void ChunkedBuffer::clear() {
    auto locked = lock_.exclusive();
    ensureOpen();

    chunks_.clear();
    chunks_.emplace_back(chunkSize_);
    usedSize_ = 0;

    PLOG(plog::debug) << "buffer cleared: " << this;
}

void ChunkedBuffer::close() {
    auto locked = lock_.exclusive();
    ensureOpen();

    chunks_.clear();
    chunks_.shrink_to_fit();
    usedSize_ = 0;
    closed_ = true;

    PLOG(plog::debug) << "buffer closed: " << this;
}

std::shared_ptr<ReadCursor> ChunkedBuffer::inputStream() {
    auto locked = lock_.shared();
    ensureOpen();

    return ReadCursor::configure(shared_from_this());
}

std::shared_ptr<WriteCursor> ChunkedBuffer::outputStream() {
    auto locked = lock_.shared();
    ensureOpen();

    return WriteCursor::configure(shared_from_this());
}
