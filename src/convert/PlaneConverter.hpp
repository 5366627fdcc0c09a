/**
 * @file PlaneConverter.hpp
 * @brief GPU conversion of RGBA frames into planar YUV(A) buffers.
 *
 * PlaneConverter owns a private OpenGL 4.3 core context (on an offscreen
 * surface) and a compute pipeline that splits one RGBA8 image into
 * single-channel R8 plane textures: full size luma, subsampled chroma and
 * an optional full size alpha plane. Planes are read back row by row into
 * caller supplied strided buffers.
 *
 * The converter restores whatever context was current on the calling
 * thread after each call, so it can be driven from inside a host's render
 * loop. It must be created and used on the GUI thread.
 *
 * @section Dependencies
 * - Qt OpenGL (QOpenGLContext, QOffscreenSurface, QOpenGLFunctions_4_3_Core)
 *
 * @section Patterns
 * - RAII: every GL object is tracked by a GpuResourceList.
 */

#pragma once
#include <QOpenGLFunctions_4_3_Core>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include "GpuResourceList.hpp"
#include "PixelFormat.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

class QOffscreenSurface;
class QOpenGLContext;

namespace mw {

// Packed RGBA8 input, rows top to bottom.
struct RgbaImage {
    const u8* data{nullptr};
    u32 width{0};
    u32 height{0};
    usize stride{0}; // bytes per row, >= width * 4
};

// Destination of one plane. stride may be larger than the plane width.
struct PlaneView {
    u8* data{nullptr};
    usize stride{0};
    usize size{0}; // total bytes addressable through data
};

// Copies a tightly packed width x height plane into dst, one row at a
// time. Each row copy is clamped to what is left in both buffers.
void copyPlaneRows(std::span<const u8> src,
                   u32 width,
                   u32 height,
                   const PlaneView& dst);

class PlaneConverter : protected QOpenGLFunctions_4_3_Core {
public:
    static constexpr u32 kWorkGroupSize = 16;
    static constexpr u8 kNeutralChroma = 128;

    PlaneConverter();
    ~PlaneConverter();

    PlaneConverter(const PlaneConverter&) = delete;
    PlaneConverter& operator=(const PlaneConverter&) = delete;

    Result<void> init(PixelFormat source,
                      PixelFormat target,
                      u32 width,
                      u32 height);
    void destroy();

    // planes receives the colour planes (Y, Cb, Cr). When the target has
    // alpha and alphaPlanes is not empty, alphaPlanes[0] receives the alpha
    // plane and the remaining alpha frame planes are set to neutral chroma.
    Result<void> convert(const RgbaImage& image,
                         std::span<const PlaneView> planes,
                         std::span<const PlaneView> alphaPlanes = {});

    bool isValid() const {
        return context_ != nullptr && program_ != 0;
    }
    u32 width() const {
        return width_;
    }
    u32 height() const {
        return height_;
    }
    bool hasAlpha() const {
        return layout_.hasAlpha;
    }
    const PlaneLayout& layout() const {
        return layout_;
    }
    usize planeCount() const {
        return layout_.planes.size();
    }
    u32 planeWidth(usize plane) const;
    u32 planeHeight(usize plane) const;

private:
    Result<void> createContext();
    Result<void> createPipeline();
    Result<void> createTextures();
    Result<GLuint> compileShader(const std::string& source);
    GLuint createTexture(const std::string& label,
                         GLenum internalFormat,
                         u32 width,
                         u32 height);
    void dispatch(const RgbaImage& image);
    void readPlane(usize plane, const PlaneView& dst);

    PixelFormat target_{PixelFormat::Yuv420p};
    PlaneLayout layout_;
    u32 width_{0};
    u32 height_{0};

    std::unique_ptr<QOffscreenSurface> surface_;
    std::unique_ptr<QOpenGLContext> context_;

    GpuResourceList resources_;
    GLuint program_{0};
    GLuint scratch_{0};
    GLuint sampler_{0};
    std::vector<GLuint> planeTextures_;

    std::vector<u8> readback_;
};

} // namespace mw
