#include "ircline/config.hpp"

#include "ircline/utilities.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pt = boost::property_tree;

namespace ircline {

namespace {

bool
getFlag(const pt::ptree &tree, const std::string &path, bool fallback)
{
    if (!tree.get_optional<std::string>(path)) {
        return fallback;
    }
    try {
        return tree.get<bool>(path);
    } catch (const pt::ptree_bad_data &) {
        throw std::runtime_error("Config value \"" + path +
                                 "\" is not a boolean: " +
                                 tree.get<std::string>(path));
    }
}

}  // namespace

Config
Config::read(std::istream &stream)
{
    pt::ptree tree;
    try {
        pt::read_ini(stream, tree);
    } catch (const pt::ini_parser_error &e) {
        throw std::runtime_error(std::string("Config is not valid: ") + e.what());
    }

    Config config;
    if (auto format = tree.get_optional<std::string>("dump.format"); format) {
        config.format = parseFormat(*format);
    }
    config.appendTerminator =
        getFlag(tree, "dump.append_terminator", config.appendTerminator);
    config.stopOnError = getFlag(tree, "dump.stop_on_error", config.stopOnError);
    config.reportErrors = getFlag(tree, "log.report_errors", config.reportErrors);
    config.verbose = getFlag(tree, "log.verbose", config.verbose);
    return config;
}

Config
Config::load(const std::string &path)
{
    std::ifstream configcfg(path);
    if (!configcfg) {
        throw std::runtime_error("Config file \"" + path + "\" could not be opened");
    }
    return Config::read(configcfg);
}

std::string
Config::toString() const
{
    std::stringstream ss;
    ss << "format=" << formatToString(this->format)
       << " append_terminator=" << this->appendTerminator
       << " stop_on_error=" << this->stopOnError
       << " report_errors=" << this->reportErrors;
    return ss.str();
}

Config::Format
parseFormat(const std::string &value)
{
    auto lowered = changeToLower_copy(value);
    if (lowered == "fields") {
        return Config::Format::FIELDS;
    } else if (lowered == "wire") {
        return Config::Format::WIRE;
    } else if (lowered == "joined") {
        return Config::Format::JOINED;
    }
    throw std::runtime_error("Unknown output format: " + value);
}

const char *
formatToString(Config::Format format) noexcept
{
    switch (format) {
        case Config::Format::FIELDS:
            return "fields";
        case Config::Format::WIRE:
            return "wire";
        case Config::Format::JOINED:
            return "joined";
    }
    return "fields";
}

}  // namespace ircline
