#include "ircline/config.hpp"
#include "ircline/dump.hpp"
#include "ircline/utilities.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

const char *DEFAULT_CONFIG = "ircline.cfg";

ircline::Config
loadConfig(int argc, char *argv[])
{
    if (argc >= 3) {
        return ircline::Config::load(argv[2]);
    }
    std::ifstream configcfg(DEFAULT_CONFIG);
    if (!configcfg) {
        return ircline::Config();
    }
    return ircline::Config::read(configcfg);
}

}  // namespace

int
main(int argc, char *argv[])
{
    // ircline-dump [input-file|-] [config-file]
    std::string inputPath = argc >= 2 ? argv[1] : "-";

    ircline::Config config;
    try {
        config = loadConfig(argc, argv);
    } catch (std::exception &e) {
        std::cerr << ircline::utcDateTime() << " Exception occured reading config: "
                  << e.what() << std::endl;
        return 2;
    }

    std::ifstream file;
    if (inputPath != "-") {
        file.open(inputPath);
        if (!file) {
            std::cerr << ircline::utcDateTime() << " Input file \"" << inputPath
                      << "\" could not be opened" << std::endl;
            return 2;
        }
    }
    std::istream &input = inputPath == "-" ? std::cin : file;

    if (config.verbose) {
        std::cerr << ircline::utcDateTime() << " Reading " << inputPath << " with "
                  << config.toString() << std::endl;
    }

    ircline::LineDumper dumper(config, std::cout, std::cerr);
    std::string line;
    while (std::getline(input, line)) {
        dumper.feed(std::move(line));
        if (dumper.shouldStop()) {
            break;
        }
    }

    if (config.verbose) {
        std::cerr << ircline::utcDateTime() << " Decoded " << dumper.decoded()
                  << " lines, " << dumper.failed() << " failed" << std::endl;
    }
    return dumper.failed() == 0 ? 0 : 1;
}
