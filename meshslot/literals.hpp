#pragma once
#include <cstdint>

namespace meshslot {

// bandwidths are carried as integral kHz, band edges as MHz doubles
constexpr uint32_t operator""_kHz(unsigned long long v)
{
    return uint32_t(v);
}

constexpr double kHzToMHz(uint32_t khz)
{
    return double(khz)/1000.0;
}

// half a channel, used to centre slot 0 inside the band
constexpr double halfChannelMHz(uint32_t khz)
{
    return double(khz)/2000.0;
}

}
