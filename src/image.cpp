#include "image.h"

#include <algorithm>
#include <cmath>

namespace {
float Clamp01(float t) {
  return std::min(1.0f, std::max(0.0f, t));
}

PixelRect Intersect(const PixelRect& a, const PixelRect& b) {
  PixelRect out;
  out.x0 = std::max(a.x0, b.x0);
  out.y0 = std::max(a.y0, b.y0);
  out.x1 = std::min(a.x1, b.x1);
  out.y1 = std::min(a.y1, b.y1);
  return out;
}

size_t Offset(const Image& image, int x, int y) {
  return (static_cast<size_t>(y) * static_cast<size_t>(image.width) + static_cast<size_t>(x)) *
         static_cast<size_t>(image.channels);
}
}  // namespace

RGBColor ColorRamp(float t) {
  const float clamped = Clamp01(t);
  const float red = clamped;
  const float blue = 1.0f - clamped;
  const float green = 0.2f + 0.6f * (1.0f - std::abs(clamped - 0.5f) * 2.0f);
  return {red, green, blue};
}

Image MakeImage(int width, int height, int channels) {
  Image image;
  image.width = std::max(0, width);
  image.height = std::max(0, height);
  image.channels = std::max(1, channels);
  image.pixels.assign(static_cast<size_t>(image.width) * static_cast<size_t>(image.height) *
                          static_cast<size_t>(image.channels),
                      0.0f);
  return image;
}

Image MakeSolidImage(int width, int height, const RGBColor& color, int channels) {
  Image image = MakeImage(width, height, channels);
  FillRect(&image, {0, 0, image.width, image.height}, color, 1.0f);
  return image;
}

bool SameShape(const Image& a, const Image& b) {
  return a.width == b.width && a.height == b.height && a.channels == b.channels;
}

bool IsWellFormed(const Image& image) {
  if (image.width <= 0 || image.height <= 0 || image.channels <= 0) {
    return false;
  }
  return image.pixels.size() == static_cast<size_t>(image.width) *
                                    static_cast<size_t>(image.height) *
                                    static_cast<size_t>(image.channels);
}

void FillRect(Image* image, const PixelRect& rect, const RGBColor& color, float alpha,
              const PixelRect* clip) {
  if (!image || image->empty()) {
    return;
  }
  PixelRect area = Intersect(rect, {0, 0, image->width, image->height});
  if (clip) {
    area = Intersect(area, *clip);
  }
  const float a = Clamp01(alpha);
  const float rgb[3] = {color.r, color.g, color.b};
  const int colored = std::min(3, image->channels);
  for (int y = area.y0; y < area.y1; ++y) {
    for (int x = area.x0; x < area.x1; ++x) {
      float* px = &image->pixels[Offset(*image, x, y)];
      for (int c = 0; c < colored; ++c) {
        px[c] = px[c] * (1.0f - a) + rgb[c] * a;
      }
    }
  }
}

void BlitImage(Image* dst, const Image& src, int x, int y) {
  if (!dst || dst->empty() || src.empty()) {
    return;
  }
  const PixelRect area =
      Intersect({x, y, x + src.width, y + src.height}, {0, 0, dst->width, dst->height});
  const int channels = std::min(dst->channels, src.channels);
  for (int py = area.y0; py < area.y1; ++py) {
    for (int px = area.x0; px < area.x1; ++px) {
      const float* in = &src.pixels[Offset(src, px - x, py - y)];
      float* out = &dst->pixels[Offset(*dst, px, py)];
      std::copy(in, in + channels, out);
    }
  }
}

void SetPixel(Image* image, int x, int y, const RGBColor& color) {
  if (!image || x < 0 || y < 0 || x >= image->width || y >= image->height) {
    return;
  }
  float* px = &image->pixels[Offset(*image, x, y)];
  const float rgb[3] = {color.r, color.g, color.b};
  for (int c = 0; c < std::min(3, image->channels); ++c) {
    px[c] = rgb[c];
  }
}

RGBColor PixelColor(const Image& image, int x, int y) {
  if (x < 0 || y < 0 || x >= image.width || y >= image.height || image.pixels.empty()) {
    return {0.0f, 0.0f, 0.0f};
  }
  const float* px = &image.pixels[Offset(image, x, y)];
  if (image.channels < 3) {
    return {px[0], px[0], px[0]};
  }
  return {px[0], px[1], px[2]};
}
