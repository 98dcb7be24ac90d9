#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace meshslot {

class RegionBand
{
public:
    RegionBand(std::string id, double freqStart, double freqEnd, double spacing, std::string description) noexcept
        :   m_id{std::move(id)},
            m_freqStart{freqStart},
            m_freqEnd{freqEnd},
            m_spacing{spacing},
            m_description{std::move(description)}
    { }

    const std::string& id() const { return m_id; }
    const std::string& description() const { return m_description; }
    double freqStart() const { return m_freqStart; }
    double freqEnd() const { return m_freqEnd; }
    double spacing() const { return m_spacing; }
    double span() const { return m_freqEnd - m_freqStart; }

private:
    std::string m_id;
    double m_freqStart;
    double m_freqEnd;
    double m_spacing;
    std::string m_description;
};

// Regulatory regions known to the mesh firmware, in declaration order.
// Built on first use and never modified afterwards, safe to read from any thread.
class RegionTable
{
public:
    RegionTable(const RegionTable&) = delete;
    RegionTable& operator=(const RegionTable&) = delete;

    static const RegionTable& builtin();

    // throws UnknownRegion
    const RegionBand& lookup(const std::string& regionId) const;
    bool contains(const std::string& regionId) const;

    const std::vector<RegionBand>& regions() const { return m_regions; }
    size_t size() const { return m_regions.size(); }

private:
    explicit RegionTable(std::vector<RegionBand> regions);

    const RegionBand* find(const std::string& regionId) const;

private:
    std::vector<RegionBand> m_regions;
};

}
