#include "exceptions.hpp"
#include <boost/format.hpp>

using namespace meshslot;

UnknownRegion::UnknownRegion(const std::string& regionId)
    :   std::invalid_argument(boost::str(boost::format("Invalid region '%s' specified.") % regionId)),
        m_regionId{regionId}
{
}

DegenerateBand::DegenerateBand(double span, double spacing, uint32_t bandwidthKHz)
    :   std::domain_error(boost::str(boost::format("band of %g MHz cannot hold a %d kHz channel (spacing %g MHz)") % span % bandwidthKHz % spacing)),
        m_span{span},
        m_spacing{spacing},
        m_bandwidthKHz{bandwidthKHz}
{
}

DegenerateBand::DegenerateBand(uint32_t numSlots)
    :   std::domain_error(boost::str(boost::format("cannot select a slot out of %d frequency slots") % numSlots))
{
}

InvalidBandwidth::InvalidBandwidth(long long value)
    :   std::invalid_argument(boost::str(boost::format("bandwidth must be a positive number of kHz, got %d") % value)),
        m_value{value}
{
}
