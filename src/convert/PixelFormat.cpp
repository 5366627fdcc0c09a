#include "PixelFormat.hpp"

namespace mw {

const char* pixelFormatName(PixelFormat format) {
    switch (format) {
    case PixelFormat::Rgba8:
        return "rgba8";
    case PixelFormat::Yuv420p:
        return "yuv420p";
    case PixelFormat::Yuva420p:
        return "yuva420p";
    case PixelFormat::Yuv444p:
        return "yuv444p";
    case PixelFormat::Nv12:
        return "nv12";
    }
    return "unknown";
}

Result<PlaneLayout> planeLayout(PixelFormat format) {
    PlaneLayout layout;
    switch (format) {
    case PixelFormat::Yuva420p:
        layout.hasAlpha = true;
        [[fallthrough]];
    case PixelFormat::Yuv420p:
        layout.planes.push_back({"Y", 1, 1});
        layout.planes.push_back({"Cb", 2, 2});
        layout.planes.push_back({"Cr", 2, 2});
        if (layout.hasAlpha)
            layout.planes.push_back({"A", 1, 1});
        return Result<PlaneLayout>::ok(std::move(layout));
    default:
        break;
    }
    return Result<PlaneLayout>::err(
            std::string("No plane layout for target format ") +
                    pixelFormatName(format),
            ErrorCode::Format);
}

} // namespace mw
