#include <QTemporaryDir>
#include <QtTest>
#include <cmath>
#include <map>
#include <vector>
#include "convert/PlaneConverter.hpp"
#include "recorder/FFmpegUtils.hpp"
#include "recorder/RecordingSession.hpp"

using namespace mw;

namespace {

struct StreamSummary {
    AVMediaType type{AVMEDIA_TYPE_UNKNOWN};
    i64 packets{0};
    bool monotonic{true};
    f64 start{0.0};
    f64 end{0.0};
    f64 last{0.0};  // pts of the latest packet
    f64 delay{0.0}; // codec priming, in seconds
    AVColorRange range{AVCOL_RANGE_UNSPECIFIED};
};

// Demuxes path and collects per stream packet counts and pts order.
std::map<int, StreamSummary> inspect(const QString& path, bool& trailerOk) {
    std::map<int, StreamSummary> out;
    AVFormatContext* raw = nullptr;
    trailerOk = avformat_open_input(&raw, path.toUtf8().constData(), nullptr,
                                    nullptr) == 0;
    if (!trailerOk)
        return out;
    std::unique_ptr<AVFormatContext, void (*)(AVFormatContext*)> ctx(
            raw, [](AVFormatContext* c) { avformat_close_input(&c); });
    if (avformat_find_stream_info(ctx.get(), nullptr) < 0) {
        trailerOk = false;
        return out;
    }

    std::map<int, i64> lastPts;
    AVPacketPtr packet(av_packet_alloc());
    while (av_read_frame(ctx.get(), packet.get()) >= 0) {
        AVStream* stream = ctx->streams[packet->stream_index];
        auto& s = out[packet->stream_index];
        const AVCodecParameters* par = stream->codecpar;
        s.type = par->codec_type;
        s.range = par->color_range;
        if (par->codec_type == AVMEDIA_TYPE_AUDIO && par->sample_rate > 0)
            s.delay = static_cast<f64>(par->initial_padding) / par->sample_rate;
        if (packet->pts != AV_NOPTS_VALUE) {
            auto it = lastPts.find(packet->stream_index);
            if (it != lastPts.end() && packet->pts < it->second)
                s.monotonic = false;
            lastPts[packet->stream_index] = packet->pts;

            f64 tb = av_q2d(stream->time_base);
            f64 begin = static_cast<f64>(packet->pts) * tb;
            f64 finish = static_cast<f64>(packet->pts + packet->duration) * tb;
            if (s.packets == 0 || begin < s.start)
                s.start = begin;
            if (finish > s.end)
                s.end = finish;
            if (begin > s.last)
                s.last = begin;
        }
        ++s.packets;
        av_packet_unref(packet.get());
    }
    return out;
}

std::vector<u8> solidFrame(u32 w, u32 h, u8 r, u8 g, u8 b) {
    std::vector<u8> px(static_cast<usize>(w) * h * 4);
    for (usize i = 0; i < px.size(); i += 4) {
        px[i] = r;
        px[i + 1] = g;
        px[i + 2] = b;
        px[i + 3] = 255;
    }
    return px;
}

RecorderConfig videoOnly() {
    RecorderConfig cfg;
    cfg.enableAudio = false;
    return cfg;
}

} // namespace

class TestRecordingSession : public QObject {
    Q_OBJECT

private:
    QTemporaryDir dir_;

    static bool gpuAvailable() {
        PlaneConverter converter;
        return converter.init(PixelFormat::Rgba8, PixelFormat::Yuv420p, 16, 16)
                .isOk();
    }

    static bool encoderAvailable(const char* name) {
        return avcodec_find_encoder_by_name(name) != nullptr;
    }

    QString path(const char* name) const {
        return dir_.filePath(name);
    }

private slots:
    void initTestCase() {
        QVERIFY(dir_.isValid());
    }

    void testTickBeforeBegin() {
        RecordingSession session;
        auto px = solidFrame(8, 8, 0, 0, 0);
        RgbaImage image{px.data(), 8, 8, 32};
        QCOMPARE(session.tick(image), Status::Unconfigured);
        QCOMPARE(session.state(), SessionState::Idle);
    }

    void testBeginValidates() {
        RecordingSession session;
        QCOMPARE(session.begin({64, 64}, 0, "x.webm", videoOnly()),
                 Status::CantCreate);
        QCOMPARE(session.begin({64, 64}, 30, "", videoOnly()),
                 Status::CantCreate);
        QCOMPARE(session.state(), SessionState::Idle);
    }

    void testBeginTouchesNothing() {
        RecordingSession session;
        std::vector<SessionState> seen;
        session.stateChanged.connect(
                [&](SessionState s) { seen.push_back(s); });

        QString out = path("never.webm");
        QCOMPARE(session.begin({64, 64}, 30, out.toStdString(), videoOnly()),
                 Status::Ok);
        QCOMPARE(session.state(), SessionState::Configuring);
        QVERIFY(!QFile::exists(out));

        // A second begin while configuring is refused
        QCOMPARE(session.begin({64, 64}, 30, out.toStdString(), videoOnly()),
                 Status::CantCreate);

        QCOMPARE(session.end(), Status::Ok);
        QCOMPARE(session.state(), SessionState::Closed);
        QCOMPARE(session.end(), Status::Ok);
        QCOMPARE(session.state(), SessionState::Closed);
        QVERIFY(!QFile::exists(out));

        QCOMPARE(seen.size(), usize(2));
        QCOMPARE(seen[0], SessionState::Configuring);
        QCOMPARE(seen[1], SessionState::Closed);
    }

    void testCreationFailureIsSticky() {
        RecordingSession session;
        QString out = path("bad.notacontainer");
        QCOMPARE(session.begin({32, 32}, 30, out.toStdString(), videoOnly()),
                 Status::Ok);

        auto px = solidFrame(32, 32, 0, 255, 0);
        RgbaImage image{px.data(), 32, 32, 128};
        QCOMPARE(session.tick(image), Status::CantCreate);
        QCOMPARE(session.state(), SessionState::Failed);
        QCOMPARE(session.tick(image), Status::CantCreate);

        session.end();
        QCOMPARE(session.state(), SessionState::Closed);
        QCOMPARE(session.tick(image), Status::Unconfigured);
    }

    void testStatusMapping() {
        QCOMPARE(statusFor({"", ErrorCode::State}, true), Status::Unconfigured);
        QCOMPARE(statusFor({"", ErrorCode::Device}, false), Status::CantCreate);
        QCOMPARE(statusFor({"", ErrorCode::Codec}, false), Status::CantCreate);
        QCOMPARE(statusFor({"", ErrorCode::Codec}, true), Status::FileCantWrite);
        QCOMPARE(statusFor({"", ErrorCode::Io}, true), Status::FileCantWrite);
    }

    void testVideoOnlyMp4() {
        if (!encoderAvailable("libvpx-vp9"))
            QSKIP("libvpx-vp9 encoder not available");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("out.mp4");
        RecordingSession session;
        QCOMPARE(session.begin({640, 480}, 30, out.toStdString(), videoOnly()),
                 Status::Ok);

        auto px = solidFrame(640, 480, 200, 40, 40);
        RgbaImage image{px.data(), 640, 480, 640 * 4};
        for (int i = 0; i < 10; ++i) {
            QCOMPARE(session.tick(image), Status::Ok);
            QCOMPARE(session.state(), SessionState::Recording);
        }
        QCOMPARE(session.end(), Status::Ok);
        QCOMPARE(session.state(), SessionState::Closed);
        QCOMPARE(session.end(), Status::Ok);
        QCOMPARE(session.stats().framesWritten, i64(10));
        QVERIFY(session.stats().bytesWritten > 0);

        bool readable = false;
        auto streams = inspect(out, readable);
        QVERIFY(readable);
        QCOMPARE(streams.size(), usize(1));
        const auto& video = streams.begin()->second;
        QCOMPARE(video.type, AVMEDIA_TYPE_VIDEO);
        QCOMPARE(video.packets, i64(10));
        QVERIFY(video.monotonic);
        QVERIFY(std::abs((video.end - video.start) - 10.0 / 30.0) < 0.05);
    }

    void testFirstFrameSizeWins() {
        if (!encoderAvailable("libvpx-vp9"))
            QSKIP("libvpx-vp9 encoder not available");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("resized.webm");
        RecordingSession session;
        QCOMPARE(session.begin({1920, 1080}, 25, out.toStdString(), videoOnly()),
                 Status::Ok);

        auto px = solidFrame(96, 64, 10, 10, 10);
        RgbaImage image{px.data(), 96, 64, 96 * 4};
        QCOMPARE(session.tick(image), Status::Ok);
        QCOMPARE(session.settings().video.width, 96u);
        QCOMPARE(session.settings().video.height, 64u);

        // A frame of another size cannot go through the same pipeline
        auto other = solidFrame(48, 32, 10, 10, 10);
        RgbaImage small{other.data(), 48, 32, 48 * 4};
        QCOMPARE(session.tick(small), Status::FileCantWrite);
        QCOMPARE(session.state(), SessionState::Recording);
        QCOMPARE(session.tick(image), Status::Ok);

        QCOMPARE(session.end(), Status::Ok);
        QCOMPARE(session.stats().framesWritten, i64(2));
        QCOMPARE(session.stats().framesFailed, i64(1));
        // The rejected frame never reached the encoder
        QCOMPARE(session.framesSubmitted(), i64(2));
    }

    void testAudioAndVideo() {
        if (!encoderAvailable("libvpx-vp9") || !encoderAvailable("libopus"))
            QSKIP("libvpx-vp9 or libopus encoder not available");
        if (!RecordingSession::containerSupportsAudio("out.mp4"))
            QSKIP("this FFmpeg cannot put Opus in MP4");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("out_audio.mp4");
        RecorderConfig cfg;
        cfg.enableAudio = true;
        RecordingSession session;
        QCOMPARE(session.begin({640, 480}, 30, out.toStdString(), cfg),
                 Status::Ok);
        QCOMPARE(session.audioSampleRate(), 48000u);
        QCOMPARE(session.audioChannels(), 2u);

        auto px = solidFrame(640, 480, 0, 0, 0);
        RgbaImage image{px.data(), 640, 480, 640 * 4};
        // 48000 / 30 samples per channel, stereo
        std::vector<i32> silence(1600 * 2, 0);
        for (int i = 0; i < 10; ++i) {
            QCOMPARE(session.tick(image, std::span<const i32>(silence)),
                     Status::Ok);
        }
        QVERIFY(session.audioEnabled());
        QCOMPARE(session.end(), Status::Ok);

        // 16000 samples: 16 full frames plus one padded
        QCOMPARE(session.stats().audioFramesEncoded, i64(17));
        QCOMPARE(session.stats().audioSamplesEncoded, i64(17 * 960));

        bool readable = false;
        auto streams = inspect(out, readable);
        QVERIFY(readable);
        QCOMPARE(streams.size(), usize(2));

        const StreamSummary* video = nullptr;
        const StreamSummary* audio = nullptr;
        for (const auto& [index, s] : streams) {
            if (s.type == AVMEDIA_TYPE_VIDEO)
                video = &s;
            else if (s.type == AVMEDIA_TYPE_AUDIO)
                audio = &s;
        }
        QVERIFY(video && audio);
        QCOMPARE(video->packets, i64(10));
        QVERIFY(video->monotonic);
        QVERIFY(audio->monotonic);

        f64 videoDuration = video->end - video->start;
        f64 audioDuration = audio->end - audio->start;
        // At most one padded Opus frame (20 ms), plus the encoder's
        // priming samples when the container counts them.
        constexpr f64 kOneFrame = 0.020;
        QVERIFY2(std::abs(audioDuration - videoDuration) <=
                         kOneFrame + audio->delay + 1e-3,
                 qPrintable(QString("audio %1 s, video %2 s")
                                    .arg(audioDuration)
                                    .arg(videoDuration)));
    }

    void testAlphaStream() {
        if (!encoderAvailable("libvpx-vp9"))
            QSKIP("libvpx-vp9 encoder not available");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("alpha.mkv");
        RecorderConfig cfg = videoOnly();
        cfg.alphaChannel = true;
        RecordingSession session;
        QCOMPARE(session.begin({64, 48}, 30, out.toStdString(), cfg),
                 Status::Ok);

        auto px = solidFrame(64, 48, 255, 255, 255);
        RgbaImage image{px.data(), 64, 48, 64 * 4};
        for (int i = 0; i < 5; ++i)
            QCOMPARE(session.tick(image), Status::Ok);
        QCOMPARE(session.end(), Status::Ok);

        bool readable = false;
        auto streams = inspect(out, readable);
        QVERIFY(readable);
        QCOMPARE(streams.size(), usize(2));
        for (const auto& [index, s] : streams) {
            QCOMPARE(s.type, AVMEDIA_TYPE_VIDEO);
            QCOMPARE(s.packets, i64(5));
        }
        // Colour is video range; alpha keeps the full 0..255 scale
        QCOMPARE(streams.at(0).range, AVCOL_RANGE_MPEG);
        QCOMPARE(streams.at(1).range, AVCOL_RANGE_JPEG);
    }

    void testWriteFailureKeepsTimestampsMoving() {
        if (!encoderAvailable("libvpx-vp9"))
            QSKIP("libvpx-vp9 encoder not available");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("capped.mkv");
        RecordingSession session;
        QCOMPARE(session.begin({64, 48}, 30, out.toStdString(), videoOnly()),
                 Status::Ok);

        auto px = solidFrame(64, 48, 30, 60, 90);
        RgbaImage image{px.data(), 64, 48, 64 * 4};
        for (int i = 0; i < 3; ++i)
            QCOMPARE(session.tick(image), Status::Ok);
        QCOMPARE(session.framesSubmitted(), i64(3));

        // The encoder takes frame 3 but its packet is refused by the muxer
        session.setOutputSizeLimit(session.stats().bytesWritten);
        QCOMPARE(session.tick(image), Status::FileCantWrite);
        QCOMPARE(session.state(), SessionState::Recording);
        QCOMPARE(session.framesSubmitted(), i64(4));

        session.setOutputSizeLimit(0);
        QCOMPARE(session.tick(image), Status::Ok);
        QCOMPARE(session.tick(image), Status::Ok);
        QCOMPARE(session.framesSubmitted(), i64(6));
        QCOMPARE(session.end(), Status::Ok);
        QCOMPARE(session.stats().framesWritten, i64(5));
        QCOMPARE(session.stats().framesFailed, i64(1));

        bool readable = false;
        auto streams = inspect(out, readable);
        QVERIFY(readable);
        QCOMPARE(streams.size(), usize(1));
        const auto& video = streams.begin()->second;
        QCOMPARE(video.packets, i64(5));
        QVERIFY(video.monotonic);
        // Frames after the failure keep their own slots: the last one is #5
        QVERIFY2(std::abs(video.last - 5.0 / 30.0) < 0.005,
                 qPrintable(QString("last pts %1 s").arg(video.last)));
    }

    void testSizeLimitFromConfig() {
        RecorderConfig cfg = videoOnly();
        cfg.maxFileSizeMb = 3;
        RecordingSession session;
        QCOMPARE(session.begin({32, 32},
                               30,
                               path("limit.webm").toStdString(),
                               cfg),
                 Status::Ok);
        QCOMPARE(session.settings().maxFileSize, u64(3) * 1024 * 1024);
        session.end();
    }

    void testFailedStartLeavesNoFile() {
        const char* missing = nullptr;
        VideoCodec codec = VideoCodec::VP9;
        if (!encoderAvailable("libaom-av1")) {
            missing = "libaom-av1";
            codec = VideoCodec::AV1;
        } else if (!encoderAvailable("libx264")) {
            missing = "libx264";
            codec = VideoCodec::H264;
        }
        if (!missing)
            QSKIP("every video encoder is installed");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("no_encoder.mkv");
        RecorderConfig cfg = videoOnly();
        cfg.codec = codec;
        RecordingSession session;
        QCOMPARE(session.begin({32, 32}, 30, out.toStdString(), cfg),
                 Status::Ok);

        auto px = solidFrame(32, 32, 0, 0, 0);
        RgbaImage image{px.data(), 32, 32, 128};
        QCOMPARE(session.tick(image), Status::CantCreate);
        QCOMPARE(session.state(), SessionState::Failed);
        QVERIFY2(!QFile::exists(out), missing);
    }

    void testDestructorFinalizes() {
        if (!encoderAvailable("libvpx-vp9"))
            QSKIP("libvpx-vp9 encoder not available");
        if (!gpuAvailable())
            QSKIP("no OpenGL 4.3 compute context");

        QString out = path("abandoned.webm");
        {
            RecordingSession session;
            QCOMPARE(session.begin({32, 32}, 30, out.toStdString(), videoOnly()),
                     Status::Ok);
            auto px = solidFrame(32, 32, 1, 2, 3);
            RgbaImage image{px.data(), 32, 32, 128};
            for (int i = 0; i < 3; ++i)
                QCOMPARE(session.tick(image), Status::Ok);
        }

        bool readable = false;
        auto streams = inspect(out, readable);
        QVERIFY(readable);
        QCOMPARE(streams.begin()->second.packets, i64(3));
    }
};

QTEST_MAIN(TestRecordingSession)
#include "test_RecordingSession.moc"
