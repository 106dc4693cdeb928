#pragma once

// rebuf
#include <src/common/rw-lock.hpp>
#include <src/rebuf/macros.hpp>

// std
#include <span>
#include <memory>
#include <vector>
#include <cstddef>
#include <optional>


namespace rebuf {

    // Offset translated to chunk coordinates.
    struct ActualOffset {
        std::size_t chunkIndex;
        std::size_t arrayIndex;

        bool operator==(const ActualOffset& other) const = default;
    };

    ActualOffset toActualOffset(std::size_t offset, std::size_t chunkSize);
    std::size_t toGlobalOffset(ActualOffset offset, std::size_t chunkSize);

    class ReadCursor;
    class WriteCursor;

    // Growable byte storage split into chunks of equal size. Random access
    // is thread-safe: writes, clear() and close() are exclusive, reads and size
    // queries are shared. Closed buffer rejects everything with RebufClosed.
    class ChunkedBuffer
        : public std::enable_shared_from_this<ChunkedBuffer>
    {
    private: struct Private { };
    public:

        struct Settings {
            std::size_t chunkSize = DefaultChunkSize;
        };

        // throws RebufInvalidArgument on zero chunk size
        static std::shared_ptr<ChunkedBuffer> configure(Settings settings);
        ChunkedBuffer(Settings settings, Private access);

        ChunkedBuffer(const ChunkedBuffer&) = delete;
        ChunkedBuffer& operator=(const ChunkedBuffer&) = delete;

        // Copies length bytes from data[sourceOffset..] to offset, growing
        // storage to cover the last written byte. All or nothing.
        void write(std::span<const char> data, std::size_t offset, std::size_t sourceOffset, std::size_t length);
        void writeByte(char byte, std::size_t offset);

        // Returns count of bytes copied into dest[destOffset..], which is clamped
        // to used size, or nullopt if offset is at or past used size.
        std::optional<std::size_t> read(std::span<char> dest, std::size_t offset, std::size_t destOffset, std::size_t length) const;
        std::optional<char> readByte(std::size_t offset) const;

        // high-water mark of written bytes
        std::size_t size() const;
        // chunk count * chunk size
        std::size_t allocatedSize() const;
        std::size_t chunkSize() const noexcept;

        void clear();
        void close();

        std::shared_ptr<ReadCursor> inputStream();
        std::shared_ptr<WriteCursor> outputStream();

    private:
        using Chunk = std::vector<char>;

        void ensureOpen() const;
        void growFor(ActualOffset last);

    private:
        const std::size_t chunkSize_;

        RWLock lock_;
        std::vector<Chunk> chunks_;
        std::size_t usedSize_;
        bool closed_;
    };

}
