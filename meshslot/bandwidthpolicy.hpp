#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "literals.hpp"

namespace meshslot {

constexpr uint32_t SHORT_TURBO_BANDWIDTH = 500_kHz;
constexpr uint32_t LONG_RANGE_BANDWIDTH = 125_kHz;
constexpr uint32_t DEFAULT_BANDWIDTH = 250_kHz;

// bandwidth implied by a modem preset name, exact and case-sensitive match
uint32_t presetBandwidth(const std::string& channelName);

// an override always wins over the preset name; non-positive overrides throw InvalidBandwidth
uint32_t resolveBandwidth(const std::string& channelName, std::optional<int> bandwidthOverride = std::nullopt);

}
