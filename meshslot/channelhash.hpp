#pragma once
#include <cstdint>
#include <string>

namespace meshslot {

constexpr uint32_t DJB2_SEED = 5381;
constexpr uint32_t SURROGATE_ESCAPE_BASE = 0xDC00;

// hash*33 + c, wrapping at 32 bits like the firmware's uint32_t
constexpr uint32_t djb2Step(uint32_t hash, uint32_t codePoint)
{
    return ((hash << 5) + hash) + codePoint;
}

// djb2 over the unicode code points of a UTF-8 encoded channel name.
// A byte that does not start a well-formed sequence hashes as
// SURROGATE_ESCAPE_BASE + byte and decoding resumes at the following byte.
uint32_t hashChannelName(const std::string& name);

}
