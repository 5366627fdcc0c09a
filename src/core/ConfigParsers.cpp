#include "ConfigParsers.hpp"
#include <algorithm>
#include <cctype>
#include "Logger.hpp"

namespace mw {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>()) {
                if (*val >= 0)
                    return static_cast<T>(*val);
            }
        }
        LOG_WARN("Config: ignoring malformed value for '{}'", key);
    }
    return defaultVal;
}

bool equalsNoCase(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}
} // namespace

const char* qualityName(Quality quality) {
    switch (quality) {
    case Quality::Good:
        return "Good";
    case Quality::Best:
        return "Best";
    case Quality::Realtime:
        break;
    }
    return "Realtime";
}

const char* videoCodecName(VideoCodec codec) {
    switch (codec) {
    case VideoCodec::H264:
        return "H264";
    case VideoCodec::AV1:
        return "AV1";
    case VideoCodec::VP9:
        break;
    }
    return "VP9";
}

std::optional<Quality> ConfigParsers::parseQuality(std::string_view name) {
    if (equalsNoCase(name, "Realtime"))
        return Quality::Realtime;
    if (equalsNoCase(name, "Good"))
        return Quality::Good;
    if (equalsNoCase(name, "Best"))
        return Quality::Best;
    return std::nullopt;
}

std::optional<VideoCodec> ConfigParsers::parseVideoCodec(
        std::string_view name) {
    if (equalsNoCase(name, "VP9"))
        return VideoCodec::VP9;
    if (equalsNoCase(name, "H264"))
        return VideoCodec::H264;
    if (equalsNoCase(name, "AV1"))
        return VideoCodec::AV1;
    return std::nullopt;
}

bool ConfigParsers::parseDebug(const toml::table& tbl) {
    if (auto gen = tbl["general"].as_table())
        return get(*gen, "debug", false);
    return false;
}

void ConfigParsers::parseRecorder(const toml::table& tbl,
                                  RecorderConfig& cfg) {
    cfg = RecorderConfig{};
    auto rec = tbl["recording"].as_table();
    if (!rec)
        return;

    cfg.threadCount = std::min(get(*rec, "thread_count", 0u), 64u);
    cfg.alphaChannel = get(*rec, "alpha_channel", false);
    cfg.enableAudio = get(*rec, "enable_audio", true);
    cfg.audioBitrate =
            std::clamp(get(*rec, "audio_bitrate", 128u), 16u, 512u);
    cfg.maxFileSizeMb = get(*rec, "max_file_size_mb", 0u);

    auto quality = get(*rec, "quality", std::string("Realtime"));
    if (auto q = parseQuality(quality)) {
        cfg.quality = *q;
    } else {
        LOG_WARN("Config: unknown quality '{}', using Realtime", quality);
    }

    auto codec = get(*rec, "codec", std::string("VP9"));
    if (auto c = parseVideoCodec(codec)) {
        cfg.codec = *c;
    } else {
        LOG_WARN("Config: unknown codec '{}', using VP9", codec);
    }
}

toml::table ConfigParsers::serialize(const RecorderConfig& recorder,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("recording",
                toml::table{{"thread_count", (i64)recorder.threadCount},
                            {"quality", qualityName(recorder.quality)},
                            {"alpha_channel", recorder.alphaChannel},
                            {"enable_audio", recorder.enableAudio},
                            {"codec", videoCodecName(recorder.codec)},
                            {"audio_bitrate", (i64)recorder.audioBitrate},
                            {"max_file_size_mb",
                             (i64)recorder.maxFileSizeMb}});
    return root;
}

} // namespace mw
