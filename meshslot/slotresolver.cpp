#include "slotresolver.hpp"
#include "channelhash.hpp"
#include "exceptions.hpp"
#include "literals.hpp"
#include <cmath>
#include <limits>
#include <boost/format.hpp>

using namespace meshslot;

uint32_t meshslot::slotCount(double freqStart, double freqEnd, double spacing, uint32_t bandwidthKHz)
{
    const double span = freqEnd - freqStart;
    const double slots = std::floor(span / (spacing + kHzToMHz(bandwidthKHz)));

    // also catches the NaN/inf of a zero width channel
    if(!(slots >= 1.0) || !std::isfinite(slots))
        throw DegenerateBand(span, spacing, bandwidthKHz);
    if(slots > double(std::numeric_limits<uint32_t>::max()))
        throw std::out_of_range(boost::str(boost::format("slotCount: %g slots do not fit in 32 bits") % slots));

    return uint32_t(slots);
}

uint32_t meshslot::slotCount(const RegionBand& band, uint32_t bandwidthKHz)
{
    return slotCount(band.freqStart(), band.freqEnd(), band.spacing(), bandwidthKHz);
}

uint32_t meshslot::slotIndex(const std::string& channelName, uint32_t numSlots)
{
    if(numSlots == 0)
        throw DegenerateBand(numSlots);
    return hashChannelName(channelName) % numSlots;
}

double meshslot::slotFrequency(double freqStart, uint32_t slotIndex, uint32_t bandwidthKHz)
{
    return freqStart + halfChannelMHz(bandwidthKHz) + double(slotIndex) * kHzToMHz(bandwidthKHz);
}
