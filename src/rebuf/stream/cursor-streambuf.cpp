// standard
#include <span>
#include <memory>
#include <vector>
#include <cstddef>
#include <streambuf>

// rebuf
#include <src/common/macros.hpp>
#include <src/common/exceptions.hpp>
#include <src/rebuf/buffer/read-cursor.hpp>
#include <src/rebuf/buffer/write-cursor.hpp>

// local
#include "cursor-streambuf.hpp"

using namespace rebuf;


ReadCursorStreamBuf::ReadCursorStreamBuf(std::shared_ptr<ReadCursor> cursor, std::size_t blockSize)
    : cursor_(std::move(cursor))
    , block_(blockSize)
{
    REBUF_THROW_UNLESS(RebufInvalidArgument, "stream requires a read cursor", cursor_);
    REBUF_THROW_UNLESS(RebufInvalidArgument, "stream block size must be positive", blockSize > 0);
    setg(block_.data(), block_.data(), block_.data());
}

ReadCursorStreamBuf::int_type ReadCursorStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    auto bytesRead = cursor_->read(std::span<char>(block_));
    if (!bytesRead.has_value() || *bytesRead == 0) {
        return traits_type::eof();
    }

    setg(block_.data(), block_.data(), block_.data() + *bytesRead);
    return traits_type::to_int_type(*gptr());
}

WriteCursorStreamBuf::WriteCursorStreamBuf(std::shared_ptr<WriteCursor> cursor)
    : cursor_(std::move(cursor))
{
    REBUF_THROW_UNLESS(RebufInvalidArgument, "stream requires a write cursor", cursor_);
}

WriteCursorStreamBuf::int_type WriteCursorStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }

    cursor_->write(traits_type::to_char_type(ch));
    return ch;
}

std::streamsize WriteCursorStreamBuf::xsputn(const char* src, std::streamsize count) {
    if (count <= 0) {
        return 0;
    }

    cursor_->write(std::span<const char>(src, static_cast<std::size_t>(count)));
    return count;
}
