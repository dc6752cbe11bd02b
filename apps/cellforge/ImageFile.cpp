#include "ImageFile.h"

#include <cctype>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_HDR
#include <stb_image.h>

namespace cellforge::app {

ImageFormat formatFromPath(std::string_view path) {
  const auto dot = path.find_last_of('.');
  if (dot == std::string_view::npos) return ImageFormat::Png;

  std::string ext;
  for (char c : path.substr(dot + 1)) ext.push_back((char)std::tolower((unsigned char)c));
  return ext == "hdr" ? ImageFormat::Hdr : ImageFormat::Png;
}

bool isFloatFormat(ImageFormat format) {
  return format == ImageFormat::Hdr;
}

static bool checkWritable(const std::string& path, const tex::PixelBuffer& img, std::string* outErr) {
  if (img.empty() || !img.consistent()) {
    if (outErr) *outErr = "Invalid image size.";
    return false;
  }
  if (path.empty()) {
    if (outErr) *outErr = "Empty output path.";
    return false;
  }
  return true;
}

bool writePng(const std::string& path, const tex::PixelBuffer& img, std::string* outErr) {
  if (!checkWritable(path, img, outErr)) return false;

  const std::vector<core::u8> rgba = tex::toRGBA8(img);
  const int w = (int)img.width;
  const int h = (int)img.height;
  if (!stbi_write_png(path.c_str(), w, h, 4, rgba.data(), w * 4)) {
    if (outErr) *outErr = "Failed to write PNG: " + path;
    return false;
  }
  return true;
}

bool writeHdr(const std::string& path, const tex::PixelBuffer& img, std::string* outErr) {
  if (!checkWritable(path, img, outErr)) return false;

  const std::vector<float> rgb = tex::toRGBF32NonNegative(img);

  if (!stbi_write_hdr(path.c_str(), (int)img.width, (int)img.height, 3, rgb.data())) {
    if (outErr) *outErr = "Failed to write HDR: " + path;
    return false;
  }
  return true;
}

bool writeImage(const std::string& path, const tex::PixelBuffer& img, std::string* outErr) {
  switch (formatFromPath(path)) {
    case ImageFormat::Hdr: return writeHdr(path, img, outErr);
    case ImageFormat::Png: return writePng(path, img, outErr);
  }
  return writePng(path, img, outErr);
}

bool readImage(const std::string& path, tex::PixelBuffer& out, std::string* outErr) {
  int w = 0;
  int h = 0;
  int comp = 0;
  unsigned char* data = stbi_load(path.c_str(), &w, &h, &comp, 4);
  if (!data) {
    const char* why = stbi_failure_reason();
    if (outErr) *outErr = "Failed to read image " + path + ": " + (why ? why : "unknown error");
    return false;
  }
  if (w <= 0 || h <= 0) {
    stbi_image_free(data);
    if (outErr) *outErr = "Empty image: " + path;
    return false;
  }

  out = tex::fromRGBA8(data, (core::u32)w, (core::u32)h);
  stbi_image_free(data);
  return true;
}

} // namespace cellforge::app
