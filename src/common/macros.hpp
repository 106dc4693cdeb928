#pragma once
/* 
 * Macros for general purpose use.
 */

template<typename Dummy>
void dummy(const Dummy& variable) {}

#define REBUF_THROW_UNLESS(exception, message, condition)   \
    do {                                                    \
        if (!(condition)) {                                 \
            throw exception(message);                       \
        }                                                   \
    } while (false)

#define REBUF_UNUSED(variable)  \
    dummy(variable)
