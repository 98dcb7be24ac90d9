#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace meshslot {

class UnknownRegion : public std::invalid_argument
{
public:
    explicit UnknownRegion(const std::string& regionId);

    const std::string& regionId() const { return m_regionId; }

private:
    std::string m_regionId;
};

// the band cannot hold a single channel of the requested width
class DegenerateBand : public std::domain_error
{
public:
    DegenerateBand(double span, double spacing, uint32_t bandwidthKHz);
    explicit DegenerateBand(uint32_t numSlots);

    double span() const { return m_span; }
    double spacing() const { return m_spacing; }
    uint32_t bandwidthKHz() const { return m_bandwidthKHz; }

private:
    double m_span = 0.0;
    double m_spacing = 0.0;
    uint32_t m_bandwidthKHz = 0;
};

class InvalidBandwidth : public std::invalid_argument
{
public:
    explicit InvalidBandwidth(long long value);

    long long value() const { return m_value; }

private:
    long long m_value;
};

}
