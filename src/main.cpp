// main.cpp - moviewriter-cli
// Renders a synthetic clip (moving test pattern + sine tone) through the
// same MovieWriter path a host application would use.

#include <QCommandLineParser>
#include <QGuiApplication>
#include <QImage>
#include <QPainter>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numbers>
#include <vector>

#include "core/Config.hpp"
#include "core/ConfigParsers.hpp"
#include "core/Logger.hpp"
#include "recorder/MovieWriter.hpp"
#include "util/FileUtils.hpp"

namespace {

using namespace mw;

struct CliOptions {
    QString output;
    QSize size{1280, 720};
    u32 fps{30};
    u32 frames{150};
    bool debug{false};
};

bool parseSize(const QString& text, QSize& out) {
    auto parts = text.toLower().split('x');
    if (parts.size() != 2)
        return false;
    bool okW = false;
    bool okH = false;
    int w = parts[0].toInt(&okW);
    int h = parts[1].toInt(&okH);
    if (!okW || !okH || w <= 0 || h <= 0)
        return false;
    out = QSize(w, h);
    return true;
}

void paintTestPattern(QImage& image, u32 frame, u32 fps) {
    static const QColor bars[] = {Qt::white,
                                  Qt::yellow,
                                  Qt::cyan,
                                  Qt::green,
                                  Qt::magenta,
                                  Qt::red,
                                  Qt::blue};
    constexpr int barCount = sizeof(bars) / sizeof(bars[0]);

    QPainter painter(&image);
    int w = image.width();
    int h = image.height();
    for (int i = 0; i < barCount; ++i) {
        painter.fillRect(i * w / barCount, 0, w / barCount + 1, h, bars[i]);
    }

    // A box sweeping left to right once per second
    int box = std::max(8, h / 6);
    int x = static_cast<int>((frame % fps) * static_cast<u32>(w - box) / fps);
    painter.fillRect(x, (h - box) / 2, box, box, Qt::black);

    painter.setPen(Qt::black);
    painter.drawText(8, h - 8, QString("frame %1").arg(frame));
}

// One tick's worth of a 440 Hz tone, interleaved int32.
void fillTone(std::vector<i32>& pcm, u64& phase, u32 mixRate, u32 channels) {
    constexpr f64 freq = 440.0;
    constexpr f64 amplitude = 0.25;
    usize frames = pcm.size() / channels;
    for (usize i = 0; i < frames; ++i, ++phase) {
        f64 t = static_cast<f64>(phase) / mixRate;
        f64 v = amplitude * std::sin(2.0 * std::numbers::pi * freq * t);
        auto sample = static_cast<i32>(v * 2147483647.0);
        for (u32 c = 0; c < channels; ++c)
            pcm[i * channels + c] = sample;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("moviewriter-cli");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Record a synthetic clip to WebM/MKV/MP4");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption outputOption({"o", "output"}, "Output file", "file");
    QCommandLineOption sizeOption({"s", "size"}, "Frame size", "WxH", "1280x720");
    QCommandLineOption fpsOption("fps", "Frames per second", "n", "30");
    QCommandLineOption framesOption({"n", "frames"}, "Frames to record", "n", "150");
    QCommandLineOption noAudioOption("no-audio", "Record video only");
    QCommandLineOption alphaOption("alpha", "Add an alpha stream");
    QCommandLineOption qualityOption(
            {"q", "quality"}, "realtime, good or best", "tier");
    QCommandLineOption codecOption("codec", "vp9, h264 or av1", "codec");
    QCommandLineOption threadsOption(
            "threads", "Encoder threads (0 = auto)", "n");
    QCommandLineOption maxSizeOption(
            "max-size", "Stop writing past this many MiB (0 = no limit)", "mib");
    QCommandLineOption configOption({"c", "config"}, "Config file", "file");
    QCommandLineOption debugOption({"d", "debug"}, "Debug logging");

    parser.addOptions({outputOption,
                       sizeOption,
                       fpsOption,
                       framesOption,
                       noAudioOption,
                       alphaOption,
                       qualityOption,
                       codecOption,
                       threadsOption,
                       maxSizeOption,
                       configOption,
                       debugOption});
    parser.process(app);

    CliOptions opts;
    opts.debug = parser.isSet(debugOption);
    Logger::init("moviewriter", opts.debug);

    auto loaded = parser.isSet(configOption)
                          ? CONFIG.load(file::expandHome(
                                  parser.value(configOption).toStdString()))
                          : CONFIG.loadDefault();
    if (!loaded) {
        LOG_WARN("Using default settings: {}", loaded.error().message);
    }
    if (CONFIG.debug() && !opts.debug) {
        Logger::setDebug(true);
    }

    if (!parser.isSet(outputOption)) {
        std::cerr << "Error: --output is required.\n";
        std::cerr << "Try --help for usage information.\n";
        return 1;
    }
    opts.output = QString::fromStdString(
            file::expandHome(parser.value(outputOption).toStdString()).string());

    if (!parseSize(parser.value(sizeOption), opts.size)) {
        std::cerr << "Error: invalid --size, expected WxH\n";
        return 1;
    }
    bool ok = false;
    opts.fps = parser.value(fpsOption).toUInt(&ok);
    if (!ok || opts.fps == 0) {
        std::cerr << "Error: invalid --fps\n";
        return 1;
    }
    opts.frames = parser.value(framesOption).toUInt(&ok);
    if (!ok) {
        std::cerr << "Error: invalid --frames\n";
        return 1;
    }

    // Command line overrides the file, for this run only
    RecorderConfig rec = CONFIG.recorder();
    if (parser.isSet(noAudioOption))
        rec.enableAudio = false;
    if (parser.isSet(alphaOption))
        rec.alphaChannel = true;
    if (parser.isSet(qualityOption)) {
        auto q = ConfigParsers::parseQuality(
                parser.value(qualityOption).toStdString());
        if (!q) {
            std::cerr << "Error: unknown quality tier\n";
            return 1;
        }
        rec.quality = *q;
    }
    if (parser.isSet(codecOption)) {
        auto c = ConfigParsers::parseVideoCodec(
                parser.value(codecOption).toStdString());
        if (!c) {
            std::cerr << "Error: unknown codec\n";
            return 1;
        }
        rec.codec = *c;
    }
    if (parser.isSet(threadsOption)) {
        rec.threadCount = parser.value(threadsOption).toUInt(&ok);
        if (!ok) {
            std::cerr << "Error: invalid --threads\n";
            return 1;
        }
    }
    if (parser.isSet(maxSizeOption)) {
        rec.maxFileSizeMb = parser.value(maxSizeOption).toUInt(&ok);
        if (!ok) {
            std::cerr << "Error: invalid --max-size\n";
            return 1;
        }
    }
    CONFIG.setRecorder(rec);

    if (!MovieWriter::handlesFile(opts.output)) {
        std::cerr << "Error: output must end in .webm, .mkv or .mp4\n";
        return 1;
    }

    MovieWriter writer;
    Status status = writer.writeBegin(opts.size, opts.fps, opts.output);
    if (status != Status::Ok) {
        std::cerr << "Could not start recording: " << statusName(status) << "\n";
        return 1;
    }

    u32 mixRate = writer.audioMixRate();
    u32 channels = writer.audioChannels();
    std::vector<i32> pcm(mixRate > 0 ? (mixRate / opts.fps) * channels : 0);
    u64 phase = 0;

    QImage image(opts.size, QImage::Format_RGBA8888);
    int exitCode = 0;
    for (u32 i = 0; i < opts.frames; ++i) {
        paintTestPattern(image, i, opts.fps);
        const void* audio = nullptr;
        if (!pcm.empty()) {
            fillTone(pcm, phase, mixRate, channels);
            audio = pcm.data();
        }

        status = writer.writeFrame(image, audio);
        if (status == Status::CantCreate) {
            std::cerr << "Recording failed, see log for details\n";
            exitCode = 1;
            break;
        }
        if (status != Status::Ok) {
            LOG_WARN("Frame {}: {}", i, statusName(status));
        }
    }

    writer.writeEnd();

    const auto& stats = writer.session().stats();
    std::cout << "Wrote " << stats.framesWritten << " frames ("
              << stats.bytesWritten << " bytes) to "
              << opts.output.toStdString() << "\n";

    Logger::shutdown();
    return exitCode;
}
