// Float raster type and the few drawing primitives the grid compositor needs.
#ifndef IMAGE_H
#define IMAGE_H

#include <vector>

struct RGBColor {
  float r;
  float g;
  float b;
};

// Row-major, interleaved channels, values in [0, 1].
struct Image {
  int width = 0;
  int height = 0;
  int channels = 3;
  std::vector<float> pixels;

  bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

// Inclusive-exclusive pixel rectangle used to clip drawing.
struct PixelRect {
  int x0 = 0;
  int y0 = 0;
  int x1 = 0;
  int y1 = 0;
};

RGBColor ColorRamp(float t);

Image MakeImage(int width, int height, int channels = 3);
Image MakeSolidImage(int width, int height, const RGBColor& color, int channels = 3);

bool SameShape(const Image& a, const Image& b);
bool IsWellFormed(const Image& image);

// Alpha-blend a solid rectangle over the image, clipped to the image and clip.
void FillRect(Image* image, const PixelRect& rect, const RGBColor& color, float alpha,
              const PixelRect* clip = nullptr);

// Copy src with its top-left corner at (x, y). Channels beyond the source are
// left untouched; pixels outside the destination are dropped.
void BlitImage(Image* dst, const Image& src, int x, int y);

void SetPixel(Image* image, int x, int y, const RGBColor& color);
RGBColor PixelColor(const Image& image, int x, int y);

#endif  // IMAGE_H
