#include "bandwidthpolicy.hpp"
#include "exceptions.hpp"

using namespace meshslot;

uint32_t meshslot::presetBandwidth(const std::string& channelName)
{
    if(channelName == "ShortTurbo")
        return SHORT_TURBO_BANDWIDTH;
    if(channelName == "LongMod" || channelName == "LongSlow")
        return LONG_RANGE_BANDWIDTH;

    // LongFast and anything unrecognized
    return DEFAULT_BANDWIDTH;
}

uint32_t meshslot::resolveBandwidth(const std::string& channelName, std::optional<int> bandwidthOverride)
{
    if(bandwidthOverride) {
        if(*bandwidthOverride <= 0)
            throw InvalidBandwidth(*bandwidthOverride);
        return uint32_t(*bandwidthOverride);
    }
    return presetBandwidth(channelName);
}
