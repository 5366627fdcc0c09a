#include "RecordingSession.hpp"
#include <array>
#include "AudioEncoder.hpp"
#include "Muxer.hpp"
#include "VideoEncoder.hpp"
#include "audio/AudioFramer.hpp"
#include "audio/PcmConvert.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"

namespace mw {

const char* sessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Idle:
        return "Idle";
    case SessionState::Configuring:
        return "Configuring";
    case SessionState::Recording:
        return "Recording";
    case SessionState::Finalizing:
        return "Finalizing";
    case SessionState::Closed:
        return "Closed";
    case SessionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* statusName(Status status) {
    switch (status) {
    case Status::Ok:
        return "Ok";
    case Status::Unconfigured:
        return "Unconfigured";
    case Status::CantCreate:
        return "CantCreate";
    case Status::FileCantWrite:
        return "FileCantWrite";
    }
    return "Unknown";
}

Status statusFor(const Error& error, bool created) {
    if (error.code == ErrorCode::State)
        return Status::Unconfigured;
    return created ? Status::FileCantWrite : Status::CantCreate;
}

namespace {

// Views over the three planes of a yuv420p AVFrame.
std::array<PlaneView, 3> framePlanes(AVFrame* frame,
                                     const PlaneConverter& converter) {
    std::array<PlaneView, 3> views;
    for (usize i = 0; i < views.size(); ++i) {
        auto stride = static_cast<usize>(frame->linesize[i]);
        views[i].data = frame->data[i];
        views[i].stride = stride;
        views[i].size = stride * converter.planeHeight(i);
    }
    return views;
}

} // namespace

RecordingSession::RecordingSession() = default;

RecordingSession::~RecordingSession() {
    if (state_ == SessionState::Configuring ||
        state_ == SessionState::Recording || state_ == SessionState::Failed) {
        end();
    }
}

Status RecordingSession::begin(Size size, u32 fps, const fs::path& path) {
    return begin(size, fps, path, CONFIG.recorder());
}

Status RecordingSession::begin(Size size,
                               u32 fps,
                               const fs::path& path,
                               const RecorderConfig& config) {
    if (state_ == SessionState::Configuring ||
        state_ == SessionState::Recording ||
        state_ == SessionState::Finalizing) {
        LOG_WARN("begin() while {}, ignoring", sessionStateName(state_));
        return Status::CantCreate;
    }
    if (fps == 0) {
        LOG_ERROR("Cannot record at 0 fps");
        return Status::CantCreate;
    }
    if (path.empty()) {
        LOG_ERROR("No output path given");
        return Status::CantCreate;
    }

    releaseResources();
    settings_ = EncoderSettings::fromConfig(config);
    settings_.outputPath = path;
    settings_.video.fps = fps;
    settings_.video.width = size.width;
    settings_.video.height = size.height;
    nominalSize_ = size;
    audioEnabled_ = settings_.enableAudio;
    frameIndex_ = 0;
    stats_ = SessionStats{};

    LOG_INFO("Recording to {} ({}x{} @ {} fps, {} / {}, audio {}, alpha {})",
             path.string(),
             size.width,
             size.height,
             fps,
             videoCodecName(settings_.video.codec),
             qualityName(settings_.video.quality),
             audioEnabled_ ? "on" : "off",
             settings_.alphaChannel ? "on" : "off");

    setState(SessionState::Configuring);
    return Status::Ok;
}

Status RecordingSession::tick(const RgbaImage& frame,
                              std::optional<std::span<const i32>> audio) {
    switch (state_) {
    case SessionState::Configuring: {
        auto created = createPipeline(Size{frame.width, frame.height});
        if (!created) {
            LOG_ERROR("Could not start recording {}: {} ({})",
                      settings_.outputPath.string(),
                      created.error().message,
                      errorCodeName(created.error().code));
            releaseResources();
            setState(SessionState::Failed);
            return Status::CantCreate;
        }
        break;
    }
    case SessionState::Recording:
        break;
    case SessionState::Failed:
        return Status::CantCreate;
    default:
        LOG_WARN("Frame delivered while {}", sessionStateName(state_));
        return Status::Unconfigured;
    }

    auto start = Clock::now();

    auto video = encodeVideo(frame);
    if (!video) {
        LOG_ERROR("Frame {} not written: {}",
                  stats_.framesWritten + stats_.framesFailed,
                  video.error().message);
        ++stats_.framesFailed;
        return statusFor(video.error(), true);
    }

    if (audioEnabled_ && audio) {
        encodeAudio(*audio);
    }

    ++stats_.framesWritten;
    stats_.totalFrameTime += std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - start);
    stats_.bytesWritten = muxer_->bytesWritten();
    return Status::Ok;
}

Status RecordingSession::end() {
    switch (state_) {
    case SessionState::Recording:
        break;
    case SessionState::Configuring:
    case SessionState::Failed:
        releaseResources();
        setState(SessionState::Closed);
        return Status::Ok;
    default:
        return Status::Ok;
    }

    setState(SessionState::Finalizing);

    if (audioEnabled_ && framer_) {
        if (auto last = framer_->drainFinal(0.0f)) {
            LOG_DEBUG("Padding final audio frame ({} pending samples)",
                      last->size());
            encodeAudioFrame(*last);
        }
    }

    Status status = Status::Ok;
    auto finished = muxer_->finish();
    if (!finished) {
        LOG_ERROR("Finalizing {} failed: {}",
                  settings_.outputPath.string(),
                  finished.error().message);
        status = Status::FileCantWrite;
    }

    if (audioEncoder_) {
        stats_.audioFramesEncoded = audioEncoder_->framesSent();
        stats_.audioSamplesEncoded = audioEncoder_->samplesSent();
    }
    stats_.bytesWritten = muxer_->bytesWritten();
    stats_.elapsed =
            std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
    logSummary();

    releaseResources();
    setState(SessionState::Closed);
    return status;
}

void RecordingSession::setOutputSizeLimit(u64 bytes) {
    settings_.maxFileSize = bytes;
    if (muxer_)
        muxer_->setSizeLimit(bytes);
}

bool RecordingSession::containerSupportsAudio(const fs::path& path) {
    const AVOutputFormat* format =
            av_guess_format(nullptr, path.string().c_str(), nullptr);
    if (!format)
        return false;
    return avformat_query_codec(
                   format, AV_CODEC_ID_OPUS, FF_COMPLIANCE_NORMAL) == 1;
}

Result<void> RecordingSession::createPipeline(Size frameSize) {
    if (frameSize.isEmpty()) {
        return Result<void>::err("First frame has no pixels",
                                 ErrorCode::Format);
    }
    u32 width = frameSize.width;
    u32 height = frameSize.height;
    if (width != nominalSize_.width || height != nominalSize_.height) {
        LOG_DEBUG("Frame size {}x{} overrides nominal {}x{}",
                  width,
                  height,
                  nominalSize_.width,
                  nominalSize_.height);
    }
    settings_.video.width = width;
    settings_.video.height = height;
    if (auto valid = settings_.validate(); !valid) {
        return valid;
    }

    converter_ = std::make_unique<PlaneConverter>();
    auto target = settings_.alphaChannel ? PixelFormat::Yuva420p
                                         : PixelFormat::Yuv420p;
    if (auto result = converter_->init(PixelFormat::Rgba8, target, width, height);
        !result) {
        return result;
    }

    muxer_ = std::make_unique<Muxer>();
    if (auto result = muxer_->open(settings_.outputPath); !result) {
        return result;
    }
    muxer_->setSizeLimit(settings_.maxFileSize);
    bool globalHeader = muxer_->needsGlobalHeader();

    videoEncoder_ = std::make_unique<VideoEncoder>();
    if (auto result = videoEncoder_->init(settings_.video, globalHeader);
        !result) {
        return result;
    }

    if (settings_.alphaChannel) {
        // Alpha is stored as luma and spans the full 0..255 range.
        VideoEncoderSettings alphaSettings = settings_.video;
        alphaSettings.fullRange = true;
        alphaEncoder_ = std::make_unique<VideoEncoder>();
        if (auto result = alphaEncoder_->init(alphaSettings, globalHeader);
            !result) {
            return result;
        }
    }

    if (audioEnabled_ && !muxer_->supportsCodec(AV_CODEC_ID_OPUS)) {
        LOG_WARN("Container of {} cannot hold Opus audio, recording video only",
                 settings_.outputPath.string());
        audioEnabled_ = false;
    }
    if (audioEnabled_) {
        audioEncoder_ = std::make_unique<AudioEncoder>();
        if (auto result = audioEncoder_->init(settings_.audio, globalHeader);
            !result) {
            LOG_WARN("Audio disabled: {}", result.error().message);
            audioEncoder_.reset();
            audioEnabled_ = false;
        } else {
            framer_ = std::make_unique<AudioFramer>(audioEncoder_->frameSize(),
                                                    audioEncoder_->channels());
        }
    }

    auto video = muxer_->addVideoStream(*videoEncoder_);
    if (!video)
        return Result<void>::err(video.error());
    videoStream_ = *video;

    if (alphaEncoder_) {
        auto alpha = muxer_->addVideoStream(*alphaEncoder_);
        if (!alpha)
            return Result<void>::err(alpha.error());
        alphaStream_ = *alpha;
    }

    if (audioEncoder_) {
        auto stream = muxer_->addAudioStream(*audioEncoder_);
        if (!stream)
            return Result<void>::err(stream.error());
        audioStream_ = *stream;
    }

    if (auto result = muxer_->writeHeader(); !result) {
        return result;
    }

    startTime_ = Clock::now();
    setState(SessionState::Recording);
    return Result<void>::ok();
}

Result<void> RecordingSession::encodeVideo(const RgbaImage& frame) {
    auto colour = videoEncoder_->acquireFrame();
    if (!colour)
        return Result<void>::err(colour.error());
    AVFrame* colourFrame = *colour;
    auto planes = framePlanes(colourFrame, *converter_);

    AVFrame* alphaFrame = nullptr;
    std::array<PlaneView, 3> alphaPlanes{};
    if (alphaEncoder_) {
        auto alpha = alphaEncoder_->acquireFrame();
        if (!alpha)
            return Result<void>::err(alpha.error());
        alphaFrame = *alpha;
        alphaPlanes = framePlanes(alphaFrame, *converter_);
    }

    auto converted = converter_->convert(
            frame,
            planes,
            alphaFrame ? std::span<const PlaneView>(alphaPlanes)
                       : std::span<const PlaneView>{});
    if (!converted)
        return converted;

    i64 pts = videoEncoder_->ptsForFrame(frameIndex_);

    colourFrame->pts = pts;
    if (auto sent = videoEncoder_->send(colourFrame); !sent)
        return sent;
    // The codec owns this timestamp now, whatever happens below.
    ++frameIndex_;

    auto packets = videoEncoder_->receivePackets();
    if (!packets)
        return Result<void>::err(packets.error());
    if (auto written = muxer_->writePackets(videoStream_, *packets); !written)
        return written;

    if (alphaEncoder_) {
        alphaFrame->pts = pts;
        if (auto sent = alphaEncoder_->send(alphaFrame); !sent)
            return sent;
        auto alphaPackets = alphaEncoder_->receivePackets();
        if (!alphaPackets)
            return Result<void>::err(alphaPackets.error());
        if (auto written = muxer_->writePackets(alphaStream_, *alphaPackets);
            !written)
            return written;
    }

    return Result<void>::ok();
}

void RecordingSession::encodeAudio(std::span<const i32> block) {
    u32 channels = audioEncoder_->channels();
    if (block.size() % channels != 0) {
        LOG_WARN("Audio block of {} samples is not a multiple of {} channels",
                 block.size(),
                 channels);
        block = block.first(block.size() - block.size() % channels);
    }

    pcm::toFloat(block, pcmScratch_);
    framer_->push(pcmScratch_);
    while (auto frame = framer_->popFrame()) {
        encodeAudioFrame(*frame);
    }
    stats_.audioFramesEncoded = audioEncoder_->framesSent();
    stats_.audioSamplesEncoded = audioEncoder_->samplesSent();
}

void RecordingSession::encodeAudioFrame(std::span<const f32> samples) {
    if (auto sent = audioEncoder_->send(samples); !sent) {
        LOG_WARN("Audio frame skipped: {}", sent.error().message);
        return;
    }
    auto packets = audioEncoder_->receivePackets();
    if (!packets) {
        LOG_WARN("Audio packets lost: {}", packets.error().message);
        return;
    }
    if (auto written = muxer_->writePackets(audioStream_, *packets); !written) {
        LOG_WARN("Audio packet write skipped: {}", written.error().message);
    }
}

void RecordingSession::releaseResources() {
    // Muxer first writes a best-effort trailer if end() never ran.
    framer_.reset();
    if (muxer_ && muxer_->headerWritten() && !muxer_->trailerWritten()) {
        if (auto result = muxer_->finish(); !result) {
            LOG_WARN("Trailer for aborted recording: {}",
                     result.error().message);
        }
    }
    audioEncoder_.reset();
    alphaEncoder_.reset();
    videoEncoder_.reset();
    muxer_.reset();
    converter_.reset();
    videoStream_ = -1;
    alphaStream_ = -1;
    audioStream_ = -1;
    pcmScratch_.clear();
}

void RecordingSession::setState(SessionState state) {
    if (state_ == state)
        return;
    LOG_DEBUG("Recording session: {} -> {}",
              sessionStateName(state_),
              sessionStateName(state));
    state_ = state;
    stateChanged.emitSignal(state);
}

void RecordingSession::logSummary() const {
    LOG_INFO("Recorded {} frames to {}", stats_.framesWritten,
             settings_.outputPath.string());
    LOG_INFO("Average frame time: {:.2f} ms", stats_.averageFrameMs());
    LOG_INFO("Total recording time: {:.2f} s",
             static_cast<f64>(stats_.elapsed.count()) / 1000.0);
    if (stats_.framesFailed > 0) {
        LOG_WARN("{} frames could not be written ({} of them were encoded)",
                 stats_.framesFailed,
                 frameIndex_ - stats_.framesWritten);
    }
    if (audioEnabled_) {
        LOG_DEBUG("Audio: {} frames, {} samples per channel",
                  stats_.audioFramesEncoded,
                  stats_.audioSamplesEncoded);
    }
}

} // namespace mw
