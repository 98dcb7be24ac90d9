#include "channelresolver.hpp"
#include "bandwidthpolicy.hpp"
#include "channelhash.hpp"
#include "slotresolver.hpp"
#include <tuple>

using namespace meshslot;

bool ResolutionResult::operator==(const ResolutionResult& other) const
{
    auto fields = [](const ResolutionResult& r) {
        return std::tie(r.RegionId, r.RegionDescription, r.FreqStart, r.FreqEnd, r.Spacing,
            r.ChannelName, r.BandwidthKHz, r.ChannelHash, r.NumSlots, r.SlotIndex, r.FrequencyMHz);
    };
    return fields(*this) == fields(other);
}

ChannelResolver::ChannelResolver()
    :   m_table{RegionTable::builtin()}
{
}

ResolutionResult ChannelResolver::resolve(const ResolutionRequest& request) const
{
    const RegionBand& band = m_table.lookup(request.RegionId);

    ResolutionResult result;
    result.RegionId = band.id();
    result.RegionDescription = band.description();
    result.FreqStart = band.freqStart();
    result.FreqEnd = band.freqEnd();
    result.Spacing = band.spacing();
    result.ChannelName = request.ChannelName;

    result.BandwidthKHz = resolveBandwidth(request.ChannelName, request.BandwidthOverride);
    result.NumSlots = slotCount(band, result.BandwidthKHz);
    result.ChannelHash = hashChannelName(request.ChannelName);
    result.SlotIndex = slotIndex(request.ChannelName, result.NumSlots);
    result.FrequencyMHz = slotFrequency(band.freqStart(), result.SlotIndex, result.BandwidthKHz);
    return result;
}

ResolutionResult ChannelResolver::resolve(const std::string& regionId, const std::string& channelName, std::optional<int> bandwidthOverride) const
{
    ResolutionRequest request;
    request.RegionId = regionId;
    request.ChannelName = channelName;
    request.BandwidthOverride = bandwidthOverride;
    return resolve(request);
}
