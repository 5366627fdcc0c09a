#include <QFile>
#include <QTemporaryDir>
#include <QtTest>
#include <cstring>
#include "recorder/Muxer.hpp"
#include "recorder/VideoEncoder.hpp"

using namespace mw;

namespace {

VideoEncoderSettings smallVideo() {
    VideoEncoderSettings settings;
    settings.width = 32;
    settings.height = 32;
    settings.fps = 30;
    return settings;
}

// Encodes frame number index as flat grey and returns its packets.
PacketList encodeFrame(VideoEncoder& encoder, i64 index) {
    auto frame = encoder.acquireFrame();
    if (!frame)
        return {};
    AVFrame* f = *frame;
    for (int plane = 0; plane < 3; ++plane) {
        int rows = plane == 0 ? f->height : (f->height + 1) / 2;
        std::memset(f->data[plane], 128,
                    static_cast<usize>(f->linesize[plane]) * rows);
    }
    f->pts = encoder.ptsForFrame(index);
    if (!encoder.send(f))
        return {};
    auto packets = encoder.receivePackets();
    if (!packets)
        return {};
    return std::move(*packets);
}

bool playable(const QString& path) {
    AVFormatContext* ctx = nullptr;
    if (avformat_open_input(&ctx, path.toUtf8().constData(), nullptr,
                            nullptr) != 0)
        return false;
    bool ok = avformat_find_stream_info(ctx, nullptr) >= 0;
    avformat_close_input(&ctx);
    return ok;
}

} // namespace

class TestMuxer : public QObject {
    Q_OBJECT

private:
    QTemporaryDir dir_;

    static bool vp9Available() {
        return avcodec_find_encoder_by_name("libvpx-vp9") != nullptr;
    }

    QString path(const char* name) const {
        return dir_.filePath(name);
    }

private slots:
    void initTestCase() {
        QVERIFY(dir_.isValid());
    }

    void testUnknownContainer() {
        Muxer muxer;
        auto result = muxer.open(path("clip.notacontainer").toStdString());
        QVERIFY(result.isErr());
        QVERIFY(result.error().code == ErrorCode::Format);
        QVERIFY(!muxer.isOpen());
    }

    void testUseBeforeOpen() {
        Muxer muxer;
        VideoEncoder encoder;
        QVERIFY(muxer.addStream(encoder).error().code == ErrorCode::State);
        QVERIFY(muxer.writeHeader().error().code == ErrorCode::State);
        QVERIFY(muxer.finish().error().code == ErrorCode::State);
        QVERIFY(!muxer.supportsCodec(AV_CODEC_ID_VP9));
        QVERIFY(!muxer.needsGlobalHeader());
        QCOMPARE(muxer.streamCount(), usize(0));
    }

    void testOpenTwice() {
        QString out = path("twice.webm");
        Muxer muxer;
        QVERIFY(muxer.open(out.toStdString()).isOk());
        QVERIFY(muxer.isOpen());
        QCOMPARE(QString::fromStdString(muxer.path().string()), out);
        QVERIFY(muxer.open(out.toStdString()).error().code == ErrorCode::State);
    }

    void testFileWithoutHeaderIsRemoved() {
        QString out = path("unwritten.mkv");
        {
            Muxer muxer;
            QVERIFY(muxer.open(out.toStdString()).isOk());
            QVERIFY(QFile::exists(out));
        }
        QVERIFY(!QFile::exists(out));
    }

    void testSupportsCodec() {
        Muxer webm;
        QVERIFY(webm.open(path("codecs.webm").toStdString()).isOk());
        QVERIFY(webm.supportsCodec(AV_CODEC_ID_VP9));
        QVERIFY(webm.supportsCodec(AV_CODEC_ID_OPUS));
        QVERIFY(!webm.supportsCodec(AV_CODEC_ID_H264));

        Muxer mp4;
        QVERIFY(mp4.open(path("codecs.mp4").toStdString()).isOk());
        QVERIFY(mp4.supportsCodec(AV_CODEC_ID_H264));
        QVERIFY(mp4.needsGlobalHeader());
    }

    void testStreamsFrozenAfterHeader() {
        if (!vp9Available())
            QSKIP("libvpx-vp9 encoder not available");

        Muxer muxer;
        QVERIFY(muxer.open(path("frozen.webm").toStdString()).isOk());
        QVERIFY(muxer.writeHeader().error().code == ErrorCode::State);

        VideoEncoder unopened;
        QVERIFY(muxer.addStream(unopened).error().code == ErrorCode::State);

        VideoEncoder encoder;
        QVERIFY(encoder.init(smallVideo(), muxer.needsGlobalHeader()).isOk());
        auto stream = muxer.addVideoStream(encoder);
        QVERIFY(stream.isOk());
        QCOMPARE(*stream, 0);
        QCOMPARE(muxer.streamCount(), usize(1));

        QVERIFY(muxer.writeHeader().isOk());
        QVERIFY(muxer.headerWritten());

        VideoEncoder late;
        QVERIFY(late.init(smallVideo(), muxer.needsGlobalHeader()).isOk());
        auto refused = muxer.addStream(late);
        QVERIFY(refused.isErr());
        QVERIFY(refused.error().code == ErrorCode::State);
        QCOMPARE(muxer.streamCount(), usize(1));
        QVERIFY(muxer.writeHeader().error().code == ErrorCode::State);

        QVERIFY(muxer.finish().isOk());
    }

    void testTimestampRegressionRejected() {
        if (!vp9Available())
            QSKIP("libvpx-vp9 encoder not available");

        QString out = path("regress.webm");
        Muxer muxer;
        QVERIFY(muxer.open(out.toStdString()).isOk());
        VideoEncoder encoder;
        QVERIFY(encoder.init(smallVideo(), muxer.needsGlobalHeader()).isOk());
        int stream = *muxer.addVideoStream(encoder);

        PacketList first = encodeFrame(encoder, 0);
        PacketList second = encodeFrame(encoder, 1);
        QCOMPARE(first.size(), usize(1));
        QCOMPARE(second.size(), usize(1));

        // Nothing goes through before the header
        AVPacketPtr copy(av_packet_clone(first.front().get()));
        QVERIFY(muxer.writePacket(stream, copy.get()).error().code ==
                ErrorCode::State);

        QVERIFY(muxer.writeHeader().isOk());
        QVERIFY(muxer.writePacket(stream + 1, second.front().get())
                        .error().code == ErrorCode::State);
        QVERIFY(muxer.writePacket(stream, second.front().get()).isOk());

        auto regressed = muxer.writePacket(stream, first.front().get());
        QVERIFY(regressed.isErr());
        QVERIFY(regressed.error().code == ErrorCode::Codec);
        QCOMPARE(muxer.packetsWritten(), i64(1));

        // Later frames are still accepted
        PacketList third = encodeFrame(encoder, 2);
        QVERIFY(muxer.writePackets(stream, third).isOk());
        QVERIFY(third.empty());
        QCOMPARE(muxer.packetsWritten(), i64(2));

        QVERIFY(muxer.finish().isOk());
        QVERIFY(muxer.trailerWritten());
        QVERIFY(muxer.bytesWritten() > 0);
        QVERIFY(playable(out));
    }

    void testSizeLimit() {
        if (!vp9Available())
            QSKIP("libvpx-vp9 encoder not available");

        Muxer muxer;
        QVERIFY(muxer.open(path("limited.webm").toStdString()).isOk());
        VideoEncoder encoder;
        QVERIFY(encoder.init(smallVideo(), muxer.needsGlobalHeader()).isOk());
        int stream = *muxer.addVideoStream(encoder);
        QVERIFY(muxer.writeHeader().isOk());

        muxer.setSizeLimit(1);
        QCOMPARE(muxer.sizeLimit(), u64(1));
        PacketList packets = encodeFrame(encoder, 0);
        auto refused = muxer.writePackets(stream, packets);
        QVERIFY(refused.isErr());
        QVERIFY(refused.error().code == ErrorCode::Io);
        QCOMPARE(muxer.packetsWritten(), i64(0));
        QCOMPARE(muxer.bytesWritten(), u64(0));

        muxer.setSizeLimit(0);
        PacketList next = encodeFrame(encoder, 1);
        QVERIFY(muxer.writePackets(stream, next).isOk());
        QCOMPARE(muxer.packetsWritten(), i64(1));
        QVERIFY(muxer.finish().isOk());
    }

    void testFinishClosesTheFile() {
        if (!vp9Available())
            QSKIP("libvpx-vp9 encoder not available");

        Muxer muxer;
        QVERIFY(muxer.open(path("closed.mkv").toStdString()).isOk());
        VideoEncoder encoder;
        QVERIFY(encoder.init(smallVideo(), muxer.needsGlobalHeader()).isOk());
        int stream = *muxer.addVideoStream(encoder);
        QVERIFY(muxer.writeHeader().isOk());

        PacketList packets = encodeFrame(encoder, 0);
        QVERIFY(muxer.writePackets(stream, packets).isOk());
        QVERIFY(muxer.finish().isOk());
        QVERIFY(muxer.finish().isOk());

        PacketList late = encodeFrame(encoder, 1);
        QVERIFY(late.empty());
        AVPacketPtr packet(av_packet_alloc());
        QVERIFY(muxer.writePacket(stream, packet.get()).error().code ==
                ErrorCode::State);
    }

    void testDestructorWritesTrailer() {
        if (!vp9Available())
            QSKIP("libvpx-vp9 encoder not available");

        QString out = path("dropped.webm");
        VideoEncoder encoder;
        {
            Muxer muxer;
            QVERIFY(muxer.open(out.toStdString()).isOk());
            QVERIFY(encoder.init(smallVideo(), muxer.needsGlobalHeader())
                            .isOk());
            int stream = *muxer.addVideoStream(encoder);
            QVERIFY(muxer.writeHeader().isOk());
            for (i64 i = 0; i < 3; ++i) {
                PacketList packets = encodeFrame(encoder, i);
                QVERIFY(muxer.writePackets(stream, packets).isOk());
            }
        }
        QVERIFY(QFile::exists(out));
        QVERIFY(playable(out));
    }
};

QTEST_GUILESS_MAIN(TestMuxer)
#include "test_Muxer.moc"
