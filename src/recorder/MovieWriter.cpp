#include "MovieWriter.hpp"
#include <span>
#include "FFmpegUtils.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace mw {

MovieWriter::MovieWriter() {
    routeFFmpegLogs(Logger::get()->should_log(spdlog::level::debug));
}

MovieWriter::~MovieWriter() {
    writeEnd();
}

bool MovieWriter::handlesFile(const QString& path) {
    std::string ext = file::extension(fs::path(path.toStdString()));
    return ext == "webm" || ext == "mkv" || ext == "mp4";
}

u32 MovieWriter::audioMixRate() const {
    if (session_.state() == SessionState::Configuring ||
        session_.state() == SessionState::Recording) {
        return mixRate_;
    }
    return CONFIG.recorder().enableAudio ? AudioEncoderSettings::kSampleRate
                                         : 0;
}

Status MovieWriter::writeBegin(const QSize& size, u32 fps, const QString& path) {
    if (!handlesFile(path)) {
        LOG_ERROR("Unsupported output file: {}", path.toStdString());
        return Status::CantCreate;
    }
    if (size.width() <= 0 || size.height() <= 0) {
        LOG_ERROR("Invalid movie size {}x{}", size.width(), size.height());
        return Status::CantCreate;
    }

    Size nominal{static_cast<u32>(size.width()), static_cast<u32>(size.height())};
    Status status = session_.begin(nominal, fps, fs::path(path.toStdString()));
    if (status == Status::Ok) {
        fps_ = fps;
        mixRate_ = session_.audioEnabled() ? session_.audioSampleRate() : 0;
    }
    return status;
}

usize MovieWriter::samplesPerFrame() const {
    if (fps_ == 0)
        return 0;
    return static_cast<usize>(mixRate_ / fps_) * kSpeakerChannels;
}

Status MovieWriter::writeFrame(const QImage& frame, const void* pcm) {
    if (frame.isNull()) {
        LOG_WARN("Null frame from host");
        return Status::FileCantWrite;
    }

    QImage rgba = frame.format() == QImage::Format_RGBA8888
                          ? frame
                          : frame.convertToFormat(QImage::Format_RGBA8888);

    RgbaImage image;
    image.data = rgba.constBits();
    image.width = static_cast<u32>(rgba.width());
    image.height = static_cast<u32>(rgba.height());
    image.stride = static_cast<usize>(rgba.bytesPerLine());

    std::optional<std::span<const i32>> audio;
    usize samples = samplesPerFrame();
    if (pcm && samples > 0) {
        audio = std::span<const i32>(static_cast<const i32*>(pcm), samples);
    }
    return session_.tick(image, audio);
}

void MovieWriter::writeEnd() {
    session_.end();
    fps_ = 0;
    mixRate_ = 0;
}

} // namespace mw
