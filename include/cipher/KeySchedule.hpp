#pragma once
#include <cstddef>

// Position in the two rotating key streams. One instance per top-level call.
struct KeySchedule {
    std::size_t first = 0;     // index into key1
    std::size_t second = 0;    // index into key2
    std::size_t position = 0;  // characters processed so far

    void advance(std::size_t firstLength, std::size_t secondLength) {
        first = (first + 1) % firstLength;
        second = (second + 1) % secondLength;
        ++position;
    }
};
