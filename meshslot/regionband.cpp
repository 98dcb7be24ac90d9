#include "regionband.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <boost/format.hpp>

using namespace meshslot;

RegionTable::RegionTable(std::vector<RegionBand> regions)
    :   m_regions{std::move(regions)}
{
    for(auto it = m_regions.begin(); it != m_regions.end(); ++it) {
        if(!(it->freqEnd() > it->freqStart()))
            throw std::logic_error(boost::str(boost::format("RegionTable: region %s ends (%g) before it starts (%g)") % it->id() % it->freqEnd() % it->freqStart()));

        auto dup = std::find_if(m_regions.begin(), it, [&](const RegionBand& r) { return r.id() == it->id(); });
        if(dup != it)
            throw std::logic_error(boost::str(boost::format("RegionTable: duplicate region %s") % it->id()));
    }
}

const RegionTable& RegionTable::builtin()
{
    // keep this order, it is the order regions are listed to the user
    static const RegionTable table({
        { "US",     902.0, 928.0,  0, "North America - 915 MHz ISM Band" },
        { "EU_868", 863.0, 870.0,  0, "Europe - 868 MHz ISM Band" },
        { "EU_433", 433.0, 434.79, 0, "Europe - 433 MHz ISM Band" },
        { "ANZ",    915.0, 928.0,  0, "Australia/New Zealand - 915 MHz ISM Band" },
        { "NZ_865", 864.0, 868.0,  0, "New Zealand - 865 MHz Band" },
        { "CN",     470.0, 510.0,  0, "China - 470-510 MHz Band" },
        { "JP",     920.0, 928.0,  0, "Japan - 920 MHz Band" },
        { "KR",     920.0, 923.0,  0, "Korea - 920 MHz Band" },
        { "TW",     920.0, 925.0,  0, "Taiwan - 920 MHz Band" },
        { "RU",     868.7, 869.2,  0, "Russia - 868 MHz Band" },
        { "IN",     865.0, 867.0,  0, "India - 865 MHz Band" },
        { "NP_865", 865.0, 867.0,  0, "Nepal - 865 MHz Band" },
        { "TH",     920.0, 925.0,  0, "Thailand - 920 MHz Band" },
        { "MY_919", 919.0, 924.0,  0, "Malaysia - 919 MHz Band" },
        { "MY_433", 433.0, 435.0,  0, "Malaysia - 433 MHz Band" },
        { "SG_923", 920.0, 925.0,  0, "Singapore - 923 MHz Band" },
        { "UA_868", 863.0, 870.0,  0, "Ukraine - 868 MHz Band" },
        { "UA_433", 433.0, 434.79, 0, "Ukraine - 433 MHz Band" }
    });
    return table;
}

const RegionBand* RegionTable::find(const std::string& regionId) const
{
    for(auto& region : m_regions) {
        if(region.id() == regionId)
            return &region;
    }
    return nullptr;
}

const RegionBand& RegionTable::lookup(const std::string& regionId) const
{
    auto region = find(regionId);
    if(region == nullptr)
        throw UnknownRegion(regionId);
    return *region;
}

bool RegionTable::contains(const std::string& regionId) const
{
    return find(regionId) != nullptr;
}
