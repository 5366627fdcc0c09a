/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the configuration structs. Parsing
 * never fails: values that are missing or of the wrong type keep their
 * defaults.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <optional>
#include <string_view>
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace mw {

class ConfigParsers {
public:
    static bool parseDebug(const toml::table& tbl);
    static void parseRecorder(const toml::table& tbl, RecorderConfig& cfg);

    static std::optional<Quality> parseQuality(std::string_view name);
    static std::optional<VideoCodec> parseVideoCodec(std::string_view name);

    static toml::table serialize(const RecorderConfig& recorder, bool debug);
};

} // namespace mw
