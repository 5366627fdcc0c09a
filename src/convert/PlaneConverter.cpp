#include "PlaneConverter.hpp"
#include <QGuiApplication>
#include <QOffscreenSurface>
#include <QOpenGLContext>
#include <QSurfaceFormat>
#include <algorithm>
#include <cstring>
#include "core/Logger.hpp"

namespace mw {

namespace {

constexpr int kGlMajor = 4;
constexpr int kGlMinor = 3;

// Bindings: 0 source sampler, 1..3 colour planes, 4 alpha.
const char* kConvertShader = R"(
layout(local_size_x = 16, local_size_y = 16) in;

layout(binding = 0) uniform sampler2D sourceImage;
layout(binding = 1, r8) writeonly uniform image2D lumaPlane;
layout(binding = 2, r8) writeonly uniform image2D cbPlane;
layout(binding = 3, r8) writeonly uniform image2D crPlane;
#if HAS_ALPHA
layout(binding = 4, r8) writeonly uniform image2D alphaPlane;
#endif

vec4 fetch(ivec2 p, ivec2 size) {
    vec2 uv = (vec2(clamp(p, ivec2(0), size - 1)) + 0.5) / vec2(size);
    return textureLod(sourceImage, uv, 0.0);
}

void main() {
    ivec2 size = textureSize(sourceImage, 0);
    ivec2 p = ivec2(gl_GlobalInvocationID.xy);
    if (p.x >= size.x || p.y >= size.y)
        return;

    // BT.601, limited range
    vec4 c = fetch(p, size);
    float y = (16.0 + 65.481 * c.r + 128.553 * c.g + 24.966 * c.b) / 255.0;
    imageStore(lumaPlane, p, vec4(y));
#if HAS_ALPHA
    imageStore(alphaPlane, p, vec4(c.a));
#endif

    if (p.x % CHROMA_DIVISOR != 0 || p.y % CHROMA_DIVISOR != 0)
        return;

    vec3 sum = vec3(0.0);
    for (int dy = 0; dy < CHROMA_DIVISOR; ++dy) {
        for (int dx = 0; dx < CHROMA_DIVISOR; ++dx) {
            sum += fetch(p + ivec2(dx, dy), size).rgb;
        }
    }
    vec3 rgb = sum / float(CHROMA_DIVISOR * CHROMA_DIVISOR);
    float cb = (128.0 - 37.797 * rgb.r - 74.203 * rgb.g + 112.0 * rgb.b) / 255.0;
    float cr = (128.0 + 112.0 * rgb.r - 93.786 * rgb.g - 18.214 * rgb.b) / 255.0;

    ivec2 q = p / CHROMA_DIVISOR;
    imageStore(cbPlane, q, vec4(cb));
    imageStore(crPlane, q, vec4(cr));
}
)";

// Makes a context current for the lifetime of the guard, then restores
// whatever was current before.
class ScopedCurrent {
public:
    ScopedCurrent(QOpenGLContext* ctx, QSurface* surface)
        : ctx_(ctx),
          prevCtx_(QOpenGLContext::currentContext()),
          prevSurface_(prevCtx_ ? prevCtx_->surface() : nullptr) {
        ok_ = ctx_ && ctx_->makeCurrent(surface);
    }

    ~ScopedCurrent() {
        if (prevCtx_ && prevCtx_ != ctx_ && prevSurface_) {
            prevCtx_->makeCurrent(prevSurface_);
        } else if (ok_ && !prevCtx_) {
            ctx_->doneCurrent();
        }
    }

    bool ok() const {
        return ok_;
    }

private:
    QOpenGLContext* ctx_;
    QOpenGLContext* prevCtx_;
    QSurface* prevSurface_;
    bool ok_{false};
};

} // namespace

void copyPlaneRows(std::span<const u8> src,
                   u32 width,
                   u32 height,
                   const PlaneView& dst) {
    if (!dst.data)
        return;

    for (usize row = 0; row < height; ++row) {
        usize srcStart = row * width;
        usize dstStart = row * dst.stride;
        if (srcStart >= src.size() || dstStart >= dst.size)
            break;

        usize copyLen = std::min<usize>(width, src.size() - srcStart);
        copyLen = std::min(copyLen, dst.size - dstStart);
        copyLen = std::min(copyLen, dst.stride);

        if (copyLen > 0)
            std::memcpy(dst.data + dstStart, src.data() + srcStart, copyLen);
    }
}

PlaneConverter::PlaneConverter() = default;

PlaneConverter::~PlaneConverter() {
    destroy();
}

u32 PlaneConverter::planeWidth(usize plane) const {
    if (plane >= layout_.planes.size())
        return 0;
    return subsampledExtent(width_, layout_.planes[plane].divisorX);
}

u32 PlaneConverter::planeHeight(usize plane) const {
    if (plane >= layout_.planes.size())
        return 0;
    return subsampledExtent(height_, layout_.planes[plane].divisorY);
}

Result<void> PlaneConverter::init(PixelFormat source,
                                  PixelFormat target,
                                  u32 width,
                                  u32 height) {
    destroy();

    if (source != PixelFormat::Rgba8) {
        return Result<void>::err(
                std::string("Unsupported conversion source format ") +
                        pixelFormatName(source),
                ErrorCode::Format);
    }

    auto layout = planeLayout(target);
    if (!layout) {
        return Result<void>::err(layout.error());
    }

    if (width == 0 || height == 0) {
        return Result<void>::err("Invalid conversion size",
                                 ErrorCode::Format);
    }

    target_ = target;
    layout_ = std::move(*layout);
    width_ = width;
    height_ = height;

    if (auto result = createContext(); !result) {
        destroy();
        return result;
    }

    auto result = Result<void>::ok();
    {
        ScopedCurrent current(context_.get(), surface_.get());
        if (!current.ok()) {
            result = Result<void>::err(
                    "Failed to make conversion context current",
                    ErrorCode::Device);
        } else {
            result = createPipeline();
            if (result)
                result = createTextures();
            if (!result)
                resources_.releaseAll();
        }
    }
    if (!result) {
        destroy();
        return result;
    }

    LOG_DEBUG("PlaneConverter ready: {}x{} rgba8 -> {} ({} GPU objects)",
              width_,
              height_,
              pixelFormatName(target_),
              resources_.size());
    return Result<void>::ok();
}

void PlaneConverter::destroy() {
    if (context_ && !resources_.empty()) {
        ScopedCurrent current(context_.get(), surface_.get());
        if (current.ok()) {
            resources_.releaseAll();
        } else {
            LOG_WARN("PlaneConverter: context lost, GPU objects go away "
                     "with it");
            resources_.abandonAll();
        }
    }

    program_ = 0;
    scratch_ = 0;
    sampler_ = 0;
    planeTextures_.clear();
    readback_.clear();

    context_.reset();
    surface_.reset();
}

Result<void> PlaneConverter::createContext() {
    if (!qGuiApp) {
        return Result<void>::err(
                "GPU conversion needs a QGuiApplication instance",
                ErrorCode::Device);
    }

    QSurfaceFormat format;
    format.setRenderableType(QSurfaceFormat::OpenGL);
    format.setProfile(QSurfaceFormat::CoreProfile);
    format.setVersion(kGlMajor, kGlMinor);

    surface_ = std::make_unique<QOffscreenSurface>();
    surface_->setFormat(format);
    surface_->create();
    if (!surface_->isValid()) {
        return Result<void>::err("Failed to create offscreen surface",
                                 ErrorCode::Device);
    }

    context_ = std::make_unique<QOpenGLContext>();
    context_->setFormat(format);
    if (!context_->create()) {
        return Result<void>::err(
                "Failed to create OpenGL context; GPU conversion needs "
                "OpenGL 4.3 and does not work headless",
                ErrorCode::Device);
    }

    auto actual = context_->format();
    if (actual.version() < qMakePair(kGlMajor, kGlMinor)) {
        return Result<void>::err(
                "OpenGL " + std::to_string(actual.majorVersion()) + "." +
                        std::to_string(actual.minorVersion()) +
                        " context has no compute shaders (4.3 required)",
                ErrorCode::Device);
    }

    ScopedCurrent current(context_.get(), surface_.get());
    if (!current.ok() || !initializeOpenGLFunctions()) {
        return Result<void>::err(
                "Failed to initialize OpenGL 4.3 functions",
                ErrorCode::Device);
    }
    return Result<void>::ok();
}

Result<GLuint> PlaneConverter::compileShader(const std::string& source) {
    GLuint shader = glCreateShader(GL_COMPUTE_SHADER);
    if (shader == 0)
        return Result<GLuint>::err("glCreateShader failed", ErrorCode::Device);
    resources_.acquire("compute shader",
                       [this, shader] { glDeleteShader(shader); });

    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<usize>(std::max(logLength, 1)), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        return Result<GLuint>::err("Conversion shader failed to compile: " +
                                           log,
                                   ErrorCode::Device);
    }
    return Result<GLuint>::ok(shader);
}

Result<void> PlaneConverter::createPipeline() {
    std::string source = "#version 430 core\n";
    source += "#define HAS_ALPHA " + std::string(layout_.hasAlpha ? "1" : "0") +
              "\n";
    source += "#define CHROMA_DIVISOR " +
              std::to_string(layout_.planes[1].divisorX) + "\n";
    source += kConvertShader;

    auto shader = compileShader(source);
    if (!shader)
        return Result<void>::err(shader.error());

    GLuint program = glCreateProgram();
    if (program == 0)
        return Result<void>::err("glCreateProgram failed", ErrorCode::Device);
    resources_.acquire("compute program",
                       [this, program] { glDeleteProgram(program); });

    glAttachShader(program, *shader);
    glLinkProgram(program);

    GLint status = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<usize>(std::max(logLength, 1)), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        return Result<void>::err("Conversion program failed to link: " + log,
                                 ErrorCode::Device);
    }

    program_ = program;
    return Result<void>::ok();
}

GLuint PlaneConverter::createTexture(const std::string& label,
                                     GLenum internalFormat,
                                     u32 width,
                                     u32 height) {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    if (texture == 0)
        return 0;
    resources_.acquire(label, [this, texture] {
        GLuint t = texture;
        glDeleteTextures(1, &t);
    });

    glBindTexture(GL_TEXTURE_2D, texture);
    glTexStorage2D(GL_TEXTURE_2D,
                   1,
                   internalFormat,
                   static_cast<GLsizei>(width),
                   static_cast<GLsizei>(height));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glBindTexture(GL_TEXTURE_2D, 0);
    return texture;
}

Result<void> PlaneConverter::createTextures() {
    scratch_ = createTexture("scratch texture", GL_RGBA8, width_, height_);
    if (scratch_ == 0)
        return Result<void>::err("Failed to create scratch texture",
                                 ErrorCode::Device);

    for (usize i = 0; i < layout_.planes.size(); ++i) {
        GLuint texture = createTexture(
                std::string(layout_.planes[i].name) + " plane texture",
                GL_R8,
                planeWidth(i),
                planeHeight(i));
        if (texture == 0) {
            return Result<void>::err(std::string("Failed to create ") +
                                             layout_.planes[i].name +
                                             " plane texture",
                                     ErrorCode::Device);
        }
        planeTextures_.push_back(texture);
    }

    GLuint sampler = 0;
    glGenSamplers(1, &sampler);
    if (sampler == 0)
        return Result<void>::err("Failed to create sampler", ErrorCode::Device);
    resources_.acquire("sampler", [this, sampler] {
        GLuint s = sampler;
        glDeleteSamplers(1, &s);
    });
    glSamplerParameteri(sampler, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glSamplerParameteri(sampler, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glSamplerParameteri(sampler, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glSamplerParameteri(sampler, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    sampler_ = sampler;

    GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        return Result<void>::err("GL error while creating conversion "
                                 "resources: " +
                                         std::to_string(error),
                                 ErrorCode::Device);
    }
    return Result<void>::ok();
}

Result<void> PlaneConverter::convert(const RgbaImage& image,
                                     std::span<const PlaneView> planes,
                                     std::span<const PlaneView> alphaPlanes) {
    if (!isValid()) {
        return Result<void>::err("PlaneConverter used before init()",
                                 ErrorCode::State);
    }
    if (!image.data || image.width != width_ || image.height != height_ ||
        image.stride < static_cast<usize>(width_) * 4 || image.stride % 4 != 0) {
        return Result<void>::err(
                "Source image " + std::to_string(image.width) + "x" +
                        std::to_string(image.height) +
                        " does not match converter " +
                        std::to_string(width_) + "x" + std::to_string(height_),
                ErrorCode::Format);
    }
    if (planes.size() < layout_.colorPlaneCount()) {
        return Result<void>::err("Not enough destination planes",
                                 ErrorCode::Format);
    }
    if (!alphaPlanes.empty() && !layout_.hasAlpha) {
        return Result<void>::err("Alpha requested from a format without alpha",
                                 ErrorCode::Format);
    }

    ScopedCurrent current(context_.get(), surface_.get());
    if (!current.ok()) {
        return Result<void>::err("Failed to make conversion context current",
                                 ErrorCode::Device);
    }

    dispatch(image);

    for (usize i = 0; i < layout_.colorPlaneCount(); ++i) {
        readPlane(i, planes[i]);
    }

    if (layout_.hasAlpha && !alphaPlanes.empty()) {
        readPlane(layout_.planes.size() - 1, alphaPlanes[0]);
        for (usize i = 1; i < alphaPlanes.size(); ++i) {
            const auto& plane = alphaPlanes[i];
            if (plane.data)
                std::memset(plane.data, kNeutralChroma, plane.size);
        }
    }

    GLenum error = glGetError();
    if (error != GL_NO_ERROR) {
        return Result<void>::err("GL error during conversion: " +
                                         std::to_string(error),
                                 ErrorCode::Device);
    }
    return Result<void>::ok();
}

void PlaneConverter::dispatch(const RgbaImage& image) {
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, scratch_);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, static_cast<GLint>(image.stride / 4));
    glTexSubImage2D(GL_TEXTURE_2D,
                    0,
                    0,
                    0,
                    static_cast<GLsizei>(width_),
                    static_cast<GLsizei>(height_),
                    GL_RGBA,
                    GL_UNSIGNED_BYTE,
                    image.data);
    glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);

    glUseProgram(program_);
    glBindSampler(0, sampler_);
    for (usize i = 0; i < planeTextures_.size(); ++i) {
        glBindImageTexture(static_cast<GLuint>(i + 1),
                           planeTextures_[i],
                           0,
                           GL_FALSE,
                           0,
                           GL_WRITE_ONLY,
                           GL_R8);
    }

    glDispatchCompute((width_ + kWorkGroupSize - 1) / kWorkGroupSize,
                      (height_ + kWorkGroupSize - 1) / kWorkGroupSize,
                      1);
    glMemoryBarrier(GL_TEXTURE_UPDATE_BARRIER_BIT);

    // Readback follows immediately
    glFinish();

    glBindSampler(0, 0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
}

void PlaneConverter::readPlane(usize plane, const PlaneView& dst) {
    u32 w = planeWidth(plane);
    u32 h = planeHeight(plane);
    readback_.resize(static_cast<usize>(w) * h);

    glBindTexture(GL_TEXTURE_2D, planeTextures_[plane]);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glGetTexImage(GL_TEXTURE_2D, 0, GL_RED, GL_UNSIGNED_BYTE, readback_.data());
    glBindTexture(GL_TEXTURE_2D, 0);

    copyPlaneRows(readback_, w, h, dst);
}

} // namespace mw
