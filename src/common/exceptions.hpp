#pragma once

// standard
#include <cstddef>
#include <exception>
#include <string>


namespace rebuf {

    // zero chunk size, source range outside of provided data,
    // offsets that do not fit into the address space
    class RebufInvalidArgument : public std::exception {
    public:

        RebufInvalidArgument() = default;
        RebufInvalidArgument(std::string message)
        : message_(std::move(message))
        {}

        virtual const char* what() const noexcept override {
            return message_.data();
        }

    private:
        std::string message_ = "invalid argument passed to buffer operation";
    };

    // destination is too small to hold requested amount of bytes
    class RebufOutOfBounds : public std::exception {
    public:

        RebufOutOfBounds() = default;
        RebufOutOfBounds(std::string message)
        : message_(std::move(message))
        {}

        RebufOutOfBounds(std::size_t index)
        : message_("destination index out of bounds: " + std::to_string(index))
        {}

        virtual const char* what() const noexcept override {
            return message_.data();
        }

    private:
        std::string message_ = "destination index out of bounds";
    };

    // buffer or cursor was closed, closing is terminal
    class RebufClosed : public std::exception {
    public:

        RebufClosed() = default;
        RebufClosed(std::string message)
        : message_(std::move(message))
        {}

        virtual const char* what() const noexcept override {
            return message_.data();
        }

    private:
        std::string message_ = "already closed";
    };

}
