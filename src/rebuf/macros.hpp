#pragma once

// STD
#include <cstddef>

namespace rebuf {

    inline constexpr std::size_t DefaultChunkSize = 256;
    // get area of cursor stream buffers
    inline constexpr std::size_t StreamBlockSize = 512;
    inline constexpr int DefaultRecordRepeat = 50;
    inline constexpr int DefaultReaders = 4;

}
