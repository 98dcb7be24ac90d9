#include <stdlib.h>
#include <boost/program_options.hpp>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "channelresolver.hpp"
#include "exceptions.hpp"
#include "report.hpp"

namespace po = boost::program_options;

struct MeshSlotOptions
{
    std::string ChannelName = "LongFast";
    std::string RegionId = "US";
    std::optional<int> Bandwidth;
    bool Verbose = false;
};

static void printUsage(const po::options_description& desc)
{
    std::cout << "Calculate Meshtastic channel frequency based on region and channel name." << std::endl;
    std::cout << desc << std::endl;
    std::cout << "The older spelling -bw <kHz> is accepted for --bandwidth." << std::endl;
}

// program_options only knows single letter short options, map the
// two letter -bw onto --bandwidth before parsing
static std::vector<std::string> legacyArguments(int argc, char *argv[])
{
    std::vector<std::string> args;
    for(int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if(arg == "-bw")
            arg = "--bandwidth";
        else if(arg.compare(0, 4, "-bw=") == 0)
            arg = "--bandwidth=" + arg.substr(4);
        args.emplace_back(std::move(arg));
    }
    return args;
}

int main(int argc, char *argv[])
{
    using namespace meshslot;

    MeshSlotOptions opts;
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this help")
        ("channel-name,n", po::value<std::string>(&opts.ChannelName)->default_value(opts.ChannelName),
            "channel name")
        ("bandwidth,b", po::value<int>(),
            "bandwidth in kHz, overrides the one implied by the channel name")
        ("region,r", po::value<std::string>(&opts.RegionId)->default_value(opts.RegionId),
            "LoRa region, use --region help to see available regions")
        ("verbose,v", po::bool_switch(&opts.Verbose), "trace intermediate values on stderr");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(legacyArguments(argc, argv)).options(desc).run(), vm);
        po::notify(vm);
    }
    catch(const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(desc);
        return EXIT_FAILURE;
    }

    if(vm.count("help")) {
        printUsage(desc);
        return EXIT_SUCCESS;
    }
    if(vm.count("bandwidth"))
        opts.Bandwidth = vm["bandwidth"].as<int>();

    ChannelResolver resolver;

    if(opts.RegionId == "help") {
        std::cout << "Available LoRa regions:" << std::endl;
        std::cout << formatRegionList(resolver.regions());
        return EXIT_SUCCESS;
    }

    try {
        auto result = resolver.resolve(opts.RegionId, opts.ChannelName, opts.Bandwidth);
        if(opts.Verbose) {
            fprintf(stderr, "hash(\"%s\") = %u\n", result.ChannelName.c_str(), result.ChannelHash);
            fprintf(stderr, "spacing = %g MHz, bandwidth = %u kHz%s\n", result.Spacing, result.BandwidthKHz,
                opts.Bandwidth ? " (override)" : "");
            fprintf(stderr, "slot index = %u mod %u = %u\n", result.ChannelHash, result.NumSlots, result.SlotIndex);
        }
        std::cout << formatResult(result);
    }
    catch(const UnknownRegion& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << std::endl << "Available regions:" << std::endl;
        std::cerr << formatRegionList(resolver.regions());
        return EXIT_FAILURE;
    }
    catch(const std::logic_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
