#pragma once

// rebuf
#include <src/common/rw-lock.hpp>
#include <src/rebuf/buffer/chunked-buffer.hpp>

// std
#include <span>
#include <mutex>
#include <memory>
#include <cstddef>
#include <optional>


namespace rebuf {

    // Sequential reader over a shared buffer. Each cursor has its own
    // position; closing cursor leaves buffer open.
    class ReadCursor {
    private: struct Private { };
    public:

        static std::shared_ptr<ReadCursor> configure(std::shared_ptr<ChunkedBuffer> buffer);
        ReadCursor(std::shared_ptr<ChunkedBuffer> buffer, Private access);

        // nullopt once position reaches buffer size
        std::optional<char> read();
        std::optional<std::size_t> read(std::span<char> dest, std::size_t destOffset, std::size_t length);
        std::optional<std::size_t> read(std::span<char> dest);

        void reset();
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
