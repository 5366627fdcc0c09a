/**
 * @file MovieWriter.hpp
 * @brief Qt facing adapter that feeds a RecordingSession from host frames.
 *
 * The host hands over QImages and a raw pointer to one frame's worth of
 * interleaved int32 PCM. This class owns the pointer/length contract and
 * the pixel format normalisation; the session only ever sees typed spans.
 */

#pragma once
#include <QImage>
#include <QSize>
#include <QString>
#include "RecordingSession.hpp"

namespace mw {

class MovieWriter {
public:
    static constexpr u32 kSpeakerChannels = 2;

    MovieWriter();
    ~MovieWriter();

    // .webm, .mkv and .mp4, any case.
    static bool handlesFile(const QString& path);

    // 0 when audio is disabled in the configuration.
    u32 audioMixRate() const;
    u32 audioChannels() const {
        return kSpeakerChannels;
    }

    Status writeBegin(const QSize& size, u32 fps, const QString& path);
    // pcm: (audioMixRate() / fps) * audioChannels() int32 samples, or null.
    Status writeFrame(const QImage& frame, const void* pcm);
    void writeEnd();

    RecordingSession& session() {
        return session_;
    }
    const RecordingSession& session() const {
        return session_;
    }

private:
    usize samplesPerFrame() const;

    RecordingSession session_;
    u32 fps_{0};
    u32 mixRate_{0};
};

} // namespace mw
