/**
 * @file RecordingSession.hpp
 * @brief Per-file recording pipeline: RGBA frames and PCM in, container out.
 *
 * A session is driven synchronously by its host, one tick per rendered
 * frame. Nothing heavy happens at begin(): the GPU converter, the encoders
 * and the container header are all created on the first tick, from that
 * frame's real size. Each later tick converts, encodes and muxes the frame
 * (and the audio block delivered with it) before returning.
 *
 * State machine:
 *   Idle -> Configuring -> Recording -> Finalizing -> Closed
 *              \-> Failed (creation error, until the next begin)
 *
 * @section Dependencies
 * - PlaneConverter (Qt OpenGL)
 * - VideoEncoder / AudioEncoder / Muxer (FFmpeg)
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include "EncoderSettings.hpp"
#include "convert/PlaneConverter.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"
#include "util/Types.hpp"

namespace mw {

class AudioEncoder;
class AudioFramer;
class Muxer;
class VideoEncoder;

enum class SessionState { Idle, Configuring, Recording, Finalizing, Closed, Failed };

// What crosses the host boundary. Details go to the log.
enum class Status { Ok, Unconfigured, CantCreate, FileCantWrite };

const char* sessionStateName(SessionState state);
const char* statusName(Status status);
// created: the pipeline was already running when error happened.
Status statusFor(const Error& error, bool created);

struct SessionStats {
    i64 framesWritten{0};
    i64 framesFailed{0};
    i64 audioFramesEncoded{0};
    i64 audioSamplesEncoded{0}; // per channel, padding included
    u64 bytesWritten{0};
    std::chrono::microseconds totalFrameTime{0};
    Duration elapsed{0};

    f64 averageFrameMs() const {
        if (framesWritten == 0)
            return 0.0;
        return static_cast<f64>(totalFrameTime.count()) / 1000.0 /
               static_cast<f64>(framesWritten);
    }
};

class RecordingSession {
public:
    RecordingSession();
    ~RecordingSession();

    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    // Uses the [recording] section of the global config.
    Status begin(Size size, u32 fps, const fs::path& path);
    Status begin(Size size,
                 u32 fps,
                 const fs::path& path,
                 const RecorderConfig& config);

    // audio: interleaved int32 PCM at audioSampleRate(), audioChannels().
    Status tick(const RgbaImage& frame,
                std::optional<std::span<const i32>> audio = std::nullopt);

    // Pads and flushes, writes the trailer, releases everything.
    // No-op when there is nothing to close.
    Status end();

    SessionState state() const {
        return state_;
    }
    bool isRecording() const {
        return state_ == SessionState::Recording;
    }
    const SessionStats& stats() const {
        return stats_;
    }
    const EncoderSettings& settings() const {
        return settings_;
    }
    const fs::path& outputPath() const {
        return settings_.outputPath;
    }
    Size nominalSize() const {
        return nominalSize_;
    }
    // Video frames handed to the encoder so far, including ticks whose
    // packets could not be written.
    i64 framesSubmitted() const {
        return frameIndex_;
    }

    // Caps the packet payload of the file being recorded. Once reached,
    // every tick reports FileCantWrite. 0 lifts the cap; begin() resets it
    // from the config.
    void setOutputSizeLimit(u64 bytes);

    // True when audio is requested (before the first tick) or actually
    // being written (after it).
    bool audioEnabled() const {
        return audioEnabled_;
    }
    u32 audioSampleRate() const {
        return settings_.audio.sampleRate;
    }
    u32 audioChannels() const {
        return settings_.audio.channels;
    }

    // Whether the container picked for path can carry the audio stream.
    static bool containerSupportsAudio(const fs::path& path);

    Signal<SessionState> stateChanged;

private:
    Result<void> createPipeline(Size frameSize);
    Result<void> encodeVideo(const RgbaImage& frame);
    void encodeAudio(std::span<const i32> block);
    void encodeAudioFrame(std::span<const f32> samples);
    void releaseResources();
    void setState(SessionState state);
    void logSummary() const;

    SessionState state_{SessionState::Idle};
    EncoderSettings settings_;
    Size nominalSize_;
    bool audioEnabled_{false};

    // Declaration order is acquisition order; releaseResources() and the
    // destructor tear down in reverse.
    std::unique_ptr<PlaneConverter> converter_;
    std::unique_ptr<Muxer> muxer_;
    std::unique_ptr<VideoEncoder> videoEncoder_;
    std::unique_ptr<VideoEncoder> alphaEncoder_;
    std::unique_ptr<AudioEncoder> audioEncoder_;
    std::unique_ptr<AudioFramer> framer_;

    int videoStream_{-1};
    int alphaStream_{-1};
    int audioStream_{-1};

    i64 frameIndex_{0};
    std::vector<f32> pcmScratch_;
    SessionStats stats_;
    TimePoint startTime_;
};

} // namespace mw
