// Embedded fixed-width bitmap font for grid labels. Characters outside
// printable ASCII render as '?'.
#ifndef BITMAP_FONT_H
#define BITMAP_FONT_H

#include <string>

#include "image.h"

constexpr int kGlyphSize = 8;

// Integer pixel scale that approximates a requested font size.
int GlyphScaleForFontSize(int font_size);

int MeasureTextWidth(const std::string& text, int scale);
int MeasureTextHeight(int scale);

bool GlyphPixelSet(char ch, int col, int row);

void DrawText(Image* image, const std::string& text, int x, int y, int scale,
              const RGBColor& color, const PixelRect* clip = nullptr);

#endif  // BITMAP_FONT_H
