#pragma once

// rebuf
#include <src/common/rw-lock.hpp>
#include <src/rebuf/buffer/chunked-buffer.hpp>

// std
#include <span>
#include <mutex>
#include <memory>
#include <cstddef>


namespace rebuf {

    // Sequential writer, either over a buffer shared with others
    // or over a private one created for this cursor.
    class WriteCursor {
    private: struct Private { };
    public:

        // creates private buffer with given chunk size
        static std::shared_ptr<WriteCursor> configure(std::size_t chunkSize);
        static std::shared_ptr<WriteCursor> configure(std::shared_ptr<ChunkedBuffer> buffer);
        WriteCursor(std::shared_ptr<ChunkedBuffer> buffer, Private access);

        void write(char byte);
        void write(std::span<const char> data, std::size_t sourceOffset, std::size_t length);
        void write(std::span<const char> data);

        void close();

        std::size_t position() const;
        std::shared_ptr<ChunkedBuffer> buffer() const;

    private:
        std::shared_ptr<ChunkedBuffer> buffer_;
        ClosedFlag closed_;

        mutable std::mutex positionLock_;
        std::size_t position_;
    };

}
