#include <QtTest>
#include <numeric>
#include "audio/AudioFramer.hpp"

using namespace mw;

class TestAudioFramer : public QObject {
    Q_OBJECT

private:
    static std::vector<f32> ramp(usize count, f32 start) {
        std::vector<f32> v(count);
        std::iota(v.begin(), v.end(), start);
        return v;
    }

private slots:
    void testPopNeedsFullFrame() {
        AudioFramer framer(4, 2);
        framer.push(ramp(6, 0.0f));
        QVERIFY(!framer.popFrame().has_value());
        QCOMPARE(framer.pendingSamples(), usize(6));

        framer.push(ramp(2, 6.0f));
        auto frame = framer.popFrame();
        QVERIFY(frame.has_value());
        QCOMPARE(frame->size(), usize(8));
        QCOMPARE(frame->front(), 0.0f);
        QCOMPARE(frame->back(), 7.0f);
        QCOMPARE(framer.pendingSamples(), usize(0));
    }

    void testFrameCountAndOrder() {
        // Odd block sizes that never line up with the frame size
        AudioFramer framer(960, 2);
        const usize blocks[] = {1600 * 2, 17 * 2, 3000 * 2, 2 * 2, 960 * 2};
        usize total = 0;
        f32 next = 0.0f;
        std::vector<f32> out;
        for (usize n : blocks) {
            framer.push(ramp(n, next));
            next += static_cast<f32>(n);
            total += n;
            while (auto frame = framer.popFrame())
                out.insert(out.end(), frame->begin(), frame->end());
        }

        usize frameSamples = 960 * 2;
        QCOMPARE(framer.framesEmitted(), u64(total / frameSamples));
        QCOMPARE(out.size(), (total / frameSamples) * frameSamples);
        QVERIFY(framer.pendingSamples() < frameSamples);
        for (usize i = 0; i < out.size(); ++i) {
            QCOMPARE(out[i], static_cast<f32>(i));
        }
    }

    void testDrainFinalPads() {
        AudioFramer framer(4, 2);
        framer.push(ramp(3 * 2, 1.0f));
        auto last = framer.drainFinal();
        QVERIFY(last.has_value());
        QCOMPARE(last->size(), usize(8));
        QCOMPARE((*last)[5], 6.0f);
        QCOMPARE((*last)[6], 0.0f);
        QCOMPARE((*last)[7], 0.0f);
        QCOMPARE(framer.framesEmitted(), u64(1));
        QCOMPARE(framer.samplesEmitted(), u64(4));
    }

    void testDrainFinalEmpty() {
        AudioFramer framer(960, 2);
        QVERIFY(!framer.drainFinal().has_value());
        framer.push(ramp(960 * 2, 0.0f));
        QVERIFY(framer.popFrame().has_value());
        QVERIFY(!framer.drainFinal().has_value());
    }
};

QTEST_GUILESS_MAIN(TestAudioFramer)
#include "test_AudioFramer.moc"
