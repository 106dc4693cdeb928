// GTest
#include <gtest/gtest.h>

// standard
#include <span>
#include <array>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <optional>

// rebuf
#include <src/common/exceptions.hpp>
#include <src/rebuf/buffer/read-cursor.hpp>
#include <src/rebuf/buffer/write-cursor.hpp>
#include <src/rebuf/buffer/chunked-buffer.hpp>

namespace {

    class CursorTest : public ::testing::Test {
    public:

        void SetUp() override {
            buffer = rebuf::ChunkedBuffer::configure({.chunkSize = 5});
        }

        void fill(const std::string& content) {
            buffer->write(std::span<const char>(content), 0, 0, content.size());
        }

        std::shared_ptr<rebuf::ChunkedBuffer> buffer;

    };

}

TEST_F(CursorTest, HelloWorldEndToEnd) {
    std::string hello = "Hello, World!";

    auto writer = buffer->outputStream();
    writer->write(std::span<const char>(hello));
    EXPECT_EQ(writer->position(), hello.size());
    writer->close();

    EXPECT_EQ(buffer->size(), 13);
    EXPECT_EQ(buffer->allocatedSize(), 15);

    auto reader = buffer->inputStream();
    std::string collected;
    std::array<char, 4> block;
    while (true) {
        auto read = reader->read(block);
        if (!read.has_value()) {
            break;
        }
        collected.append(block.data(), *read);
    }

    EXPECT_EQ(collected, hello);
    EXPECT_EQ(reader->read(block), std::nullopt);
    EXPECT_EQ(reader->read(), std::nullopt);
}

TEST_F(CursorTest, SingleByteReadStartsAtFirstByte) {
    fill("abc");
    auto reader = buffer->inputStream();

    EXPECT_EQ(reader->read(), std::optional<char>('a'));
    EXPECT_EQ(reader->read(), std::optional<char>('b'));
    EXPECT_EQ(reader->read(), std::optional<char>('c'));
    EXPECT_EQ(reader->position(), 3);

    // end of data does not move position
    EXPECT_EQ(reader->read(), std::nullopt);
    EXPECT_EQ(reader->position(), 3);

    // data written later becomes visible to the same cursor
    buffer->writeByte('d', 3);
    EXPECT_EQ(reader->read(), std::optional<char>('d'));
}

TEST_F(CursorTest, BufferedReadWithDestinationOffset) {
    fill("0123456789");
    auto reader = buffer->inputStream();

    std::array<char, 8> dest;
    dest.fill('.');
    auto read = reader->read(dest, 2, 6);

    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, 6);
    EXPECT_EQ(std::string(dest.data(), dest.size()), "..012345");
    EXPECT_EQ(reader->position(), 6);

    EXPECT_THROW(reader->read(dest, 4, 5), rebuf::RebufOutOfBounds);
    EXPECT_EQ(reader->position(), 6);
}

TEST_F(CursorTest, IndependentReadersAndReset) {
    fill("abcdef");
    auto first = buffer->inputStream();
    auto second = buffer->inputStream();

    std::array<char, 4> dest;
    ASSERT_EQ(first->read(dest), std::optional<std::size_t>(4));
    EXPECT_EQ(first->position(), 4);
    EXPECT_EQ(second->position(), 0);

    EXPECT_EQ(second->read(), std::optional<char>('a'));
    EXPECT_EQ(second->read(), std::optional<char>('b'));

    first->reset();
    EXPECT_EQ(first->position(), 0);
    EXPECT_EQ(second->position(), 2);

    ASSERT_EQ(first->read(dest), std::optional<std::size_t>(4));
    EXPECT_EQ(std::string(dest.data(), dest.size()), "abcd");
    EXPECT_EQ(second->read(), std::optional<char>('c'));
}

TEST_F(CursorTest, SingleAndBufferedWrites) {
    auto writer = buffer->outputStream();
    std::string tail = "__world";

    writer->write('h');
    writer->write('i');
    writer->write(std::span<const char>(tail), 1, 6);
    EXPECT_EQ(writer->position(), 8);

    std::array<char, 8> dest;
    ASSERT_EQ(buffer->read(dest, 0, 0, dest.size()), std::optional<std::size_t>(8));
    EXPECT_EQ(std::string(dest.data(), dest.size()), "hi_world");
}

TEST_F(CursorTest, FailedWriteKeepsPosition) {
    auto writer = buffer->outputStream();
    std::string data = "abc";

    writer->write(std::span<const char>(data));
    EXPECT_THROW(writer->write(std::span<const char>(data), 2, 5), rebuf::RebufInvalidArgument);

    EXPECT_EQ(writer->position(), 3);
    EXPECT_EQ(buffer->size(), 3);
}

TEST_F(CursorTest, WriteCursorWithPrivateBuffer) {
    auto writer = rebuf::WriteCursor::configure(3);
    auto privateBuffer = writer->buffer();

    ASSERT_NE(privateBuffer, nullptr);
    EXPECT_NE(privateBuffer, buffer);
    EXPECT_EQ(privateBuffer->chunkSize(), 3);

    std::string data = "seven!!";
    writer->write(std::span<const char>(data));
    EXPECT_EQ(privateBuffer->size(), 7);
    EXPECT_EQ(privateBuffer->allocatedSize(), 9);
    EXPECT_EQ(buffer->size(), 0);

    EXPECT_THROW(rebuf::WriteCursor::configure(std::size_t{0}), rebuf::RebufInvalidArgument);
}

TEST_F(CursorTest, TwoWritersOverSharedBufferOverwrite) {
    auto first = buffer->outputStream();
    auto second = rebuf::WriteCursor::configure(buffer);
    std::string a = "aaaa", b = "bb";

    first->write(std::span<const char>(a));
    second->write(std::span<const char>(b));

    std::array<char, 4> dest;
    ASSERT_EQ(buffer->read(dest, 0, 0, dest.size()), std::optional<std::size_t>(4));
    EXPECT_EQ(std::string(dest.data(), dest.size()), "bbaa");
}

TEST_F(CursorTest, ClosingCursorKeepsBufferOpen) {
    fill("abc");
    auto reader = buffer->inputStream();
    auto writer = buffer->outputStream();
    std::array<char, 2> dest;

    reader->close();
    writer->close();

    EXPECT_THROW(reader->read(), rebuf::RebufClosed);
    EXPECT_THROW(reader->read(dest), rebuf::RebufClosed);
    EXPECT_THROW(reader->reset(), rebuf::RebufClosed);
    EXPECT_THROW(reader->close(), rebuf::RebufClosed);
    EXPECT_THROW(writer->write('x'), rebuf::RebufClosed);
    EXPECT_THROW(writer->write(std::span<const char>(dest)), rebuf::RebufClosed);
    EXPECT_THROW(writer->close(), rebuf::RebufClosed);

    EXPECT_EQ(buffer->size(), 3);
    auto another = buffer->inputStream();
    EXPECT_EQ(another->read(), std::optional<char>('a'));
}

TEST_F(CursorTest, ClosedBufferFailsOpenCursors) {
    fill("abc");
    auto reader = buffer->inputStream();
    auto writer = buffer->outputStream();

    buffer->close();

    EXPECT_THROW(reader->read(), rebuf::RebufClosed);
    EXPECT_THROW(writer->write('x'), rebuf::RebufClosed);
    EXPECT_EQ(reader->position(), 0);
    EXPECT_EQ(writer->position(), 0);
    // cursors themselves are still open
    EXPECT_NO_THROW(reader->close());
    EXPECT_NO_THROW(writer->close());
}

TEST_F(CursorTest, SharedCursorKeepsOrderAcrossThreads) {
    constexpr int threads = 4;
    constexpr int bytesPerThread = 500;
    auto writer = buffer->outputStream();

    std::vector<std::thread> workers;
    for (int worker = 0; worker < threads; ++worker) {
        workers.emplace_back([writer]() {
            for (int i = 0; i < bytesPerThread; ++i) {
                writer->write('x');
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // no position update was lost
    EXPECT_EQ(writer->position(), threads * bytesPerThread);
    EXPECT_EQ(buffer->size(), threads * bytesPerThread);

    auto reader = buffer->inputStream();
    std::atomic<int> consumed = 0;
    std::vector<std::thread> readers;
    for (int worker = 0; worker < threads; ++worker) {
        readers.emplace_back([reader, &consumed]() {
            while (reader->read().has_value()) {
                ++consumed;
            }
        });
    }
    for (auto& worker : readers) {
        worker.join();
    }

    // each byte was handed out exactly once
    EXPECT_EQ(consumed, threads * bytesPerThread);
}
