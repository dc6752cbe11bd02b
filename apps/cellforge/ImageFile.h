#pragma once

#include "cellforge/tex/PixelBuffer.h"

#include <string>
#include <string_view>

namespace cellforge::app {

enum class ImageFormat {
  Png, // RGBA8, values clamped to [0,1]
  Hdr  // Radiance RGBE, floats kept as-is (alpha dropped)
};

// Format from the file extension (".hdr" -> Hdr, anything else -> Png).
ImageFormat formatFromPath(std::string_view path);

// Returns true if `format` keeps values outside [0,1].
bool isFloatFormat(ImageFormat format);

// Writes `img` in the format picked by formatFromPath(path).
// Returns false and optionally writes a human-readable error message to outErr.
bool writeImage(const std::string& path, const tex::PixelBuffer& img, std::string* outErr = nullptr);

bool writePng(const std::string& path, const tex::PixelBuffer& img, std::string* outErr = nullptr);
bool writeHdr(const std::string& path, const tex::PixelBuffer& img, std::string* outErr = nullptr);

// Loads any 8-bit image stb_image understands (PNG, JPEG, TGA, BMP, ...) as RGBA.
bool readImage(const std::string& path, tex::PixelBuffer& out, std::string* outErr = nullptr);

} // namespace cellforge::app
