#pragma once
#include <string>
#include <vector>
#include "channelresolver.hpp"
#include "regionband.hpp"

namespace meshslot {

// shortest decimal that reads back to the same double, "902.0" rather than "902"
std::string formatFrequency(double mhz);

std::string formatResult(const ResolutionResult& result);

// "  <id>: <description>" per region, in table order
std::string formatRegionList(const std::vector<RegionBand>& regions);

}
