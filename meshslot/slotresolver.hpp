#pragma once
#include <cstdint>
#include <string>
#include "regionband.hpp"

namespace meshslot {

// channels of width bandwidthKHz (plus spacing, in MHz) between freqStart and freqEnd,
// throws DegenerateBand when not even one fits
uint32_t slotCount(double freqStart, double freqEnd, double spacing, uint32_t bandwidthKHz);
uint32_t slotCount(const RegionBand& band, uint32_t bandwidthKHz);

// zero based; numSlots must be at least 1
uint32_t slotIndex(const std::string& channelName, uint32_t numSlots);

// centre frequency in MHz of the zero based slot
double slotFrequency(double freqStart, uint32_t slotIndex, uint32_t bandwidthKHz);

}
