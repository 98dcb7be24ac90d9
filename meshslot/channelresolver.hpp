#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "regionband.hpp"

namespace meshslot {

struct ResolutionRequest
{
    std::string RegionId = "US";
    std::string ChannelName = "LongFast";
    std::optional<int> BandwidthOverride;
};

struct ResolutionResult
{
    std::string RegionId;
    std::string RegionDescription;
    double FreqStart = 0.0;
    double FreqEnd = 0.0;
    double Spacing = 0.0;
    std::string ChannelName;
    uint32_t BandwidthKHz = 0;
    uint32_t ChannelHash = 0;
    uint32_t NumSlots = 0;
    uint32_t SlotIndex = 0;
    double FrequencyMHz = 0.0;

    // 1-based, as the firmware logs it
    uint32_t slotNumber() const { return SlotIndex + 1; }

    bool operator==(const ResolutionResult& other) const;
    bool operator!=(const ResolutionResult& other) const { return !(*this == other); }
};

// Resolves a channel name to the frequency the firmware would tune to.
// Throws UnknownRegion, DegenerateBand or InvalidBandwidth, nothing is cached.
class ChannelResolver
{
public:
    ChannelResolver();

    ResolutionResult resolve(const ResolutionRequest& request) const;
    ResolutionResult resolve(const std::string& regionId, const std::string& channelName, std::optional<int> bandwidthOverride = std::nullopt) const;

    const std::vector<RegionBand>& regions() const { return m_table.regions(); }
    const RegionTable& table() const { return m_table; }

private:
    const RegionTable& m_table;
};

}
