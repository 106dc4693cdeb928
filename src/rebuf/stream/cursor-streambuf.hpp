#pragma once

// rebuf
#include <src/rebuf/macros.hpp>
#include <src/rebuf/buffer/read-cursor.hpp>
#include <src/rebuf/buffer/write-cursor.hpp>

// std
#include <memory>
#include <vector>
#include <cstddef>
#include <streambuf>


namespace rebuf {

    // Input side of std::iostream over a read cursor. Cursor is read
    // ahead in blocks of blockSize bytes, end of data maps to eof.
    class ReadCursorStreamBuf : public std::streambuf {
    public:

        explicit ReadCursorStreamBuf(std::shared_ptr<ReadCursor> cursor, std::size_t blockSize = StreamBlockSize);

    protected:
        virtual int_type underflow() override;

    private:
        std::shared_ptr<ReadCursor> cursor_;
        std::vector<char> block_;
    };

    // Output side, unbuffered: every put reaches the buffer immediately.
    class WriteCursorStreamBuf : public std::streambuf {
    public:

        explicit WriteCursorStreamBuf(std::shared_ptr<WriteCursor> cursor);

    protected:
        virtual int_type overflow(int_type ch) override;
        virtual std::streamsize xsputn(const char* src, std::streamsize count) override;

    private:
        std::shared_ptr<WriteCursor> cursor_;
    };

}
