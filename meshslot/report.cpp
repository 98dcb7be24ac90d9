#include "report.hpp"
#include <array>
#include <charconv>
#include <system_error>
#include <boost/format.hpp>

using namespace meshslot;

std::string meshslot::formatFrequency(double mhz)
{
    std::array<char, 64> buf;
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), mhz, std::chars_format::fixed);
    if(ec != std::errc())
        return boost::str(boost::format("%.17g") % mhz);

    std::string s(buf.data(), end);
    if(s.find('.') == std::string::npos)
        s += ".0";
    return s;
}

std::string meshslot::formatResult(const ResolutionResult& result)
{
    boost::format fmt(
        "Region: %s (%s)\n"
        "Frequency Range: %s - %s MHz\n"
        "Channel Name: %s\n"
        "Number of Frequency Slots: %d\n"
        "Frequency Slot: %d\n"
        "Selected Frequency: %s MHz\n"
        "Bandwidth: %d kHz\n");

    fmt % result.RegionId % result.RegionDescription
        % formatFrequency(result.FreqStart) % formatFrequency(result.FreqEnd)
        % result.ChannelName
        % result.NumSlots
        % result.slotNumber()
        % formatFrequency(result.FrequencyMHz)
        % result.BandwidthKHz;
    return fmt.str();
}

std::string meshslot::formatRegionList(const std::vector<RegionBand>& regions)
{
    std::string out;
    for(auto& region : regions)
        out += boost::str(boost::format("  %s: %s\n") % region.id() % region.description());
    return out;
}
