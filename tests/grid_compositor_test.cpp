#include "axis_labels.h"
#include "batch_store.h"
#include "bitmap_font.h"
#include "grid_compositor.h"
#include "log_service.h"

#include <cmath>
#include <functional>
#include <memory>
#include <utility>
#include <iostream>
#include <string>
#include <vector>

namespace {
bool SameColor(const RGBColor& a, const RGBColor& b) {
  return std::abs(a.r - b.r) < 1e-5f && std::abs(a.g - b.g) < 1e-5f &&
         std::abs(a.b - b.b) < 1e-5f;
}

GridConfiguration MakeConfig(const std::string& batch_id, int nx, int ny, int nz) {
  GridConfiguration config;
  config.batch_id = batch_id;
  config.axes.x.type = AxisType::Sampler;
  for (int i = 0; i < nx; ++i) {
    config.axes.x.values.push_back(std::string("sampler_") + std::to_string(i));
  }
  config.axes.x.labels = GenerateAxisLabels(config.axes.x.values, AxisType::Sampler, "S: ");
  if (ny > 0) {
    config.axes.y.type = AxisType::Steps;
    for (int i = 0; i < ny; ++i) {
      config.axes.y.values.push_back(int64_t{10 * (i + 1)});
    }
    config.axes.y.labels = GenerateAxisLabels(config.axes.y.values, AxisType::Steps, "Steps: ");
  }
  if (nz > 0) {
    config.axes.z.type = AxisType::Seed;
    for (int i = 0; i < nz; ++i) {
      config.axes.z.values.push_back(int64_t{i});
    }
    config.axes.z.labels = GenerateAxisLabels(config.axes.z.values, AxisType::Seed, "Seed: ");
  }
  config.dimensions = CalculateGridDimensions(config.axes.x.EffectiveCount(),
                                              config.axes.y.EffectiveCount(),
                                              config.axes.z.EffectiveCount());
  return config;
}

// Forwards to an in-memory store and records how entries are accessed.
class CountingStore : public AccumulationStore {
 public:
  bool Find(const std::string& batch_id, ImageAccumulation* out) const override {
    ++copies;
    return inner_.Find(batch_id, out);
  }
  void Put(const std::string& batch_id, ImageAccumulation value) override {
    ++puts;
    inner_.Put(batch_id, std::move(value));
  }
  bool Visit(const std::string& batch_id,
             const std::function<void(const ImageAccumulation&)>& fn) const override {
    return inner_.Visit(batch_id, fn);
  }
  bool Modify(const std::string& batch_id,
              const std::function<void(ImageAccumulation*)>& fn) override {
    return inner_.Modify(batch_id, fn);
  }
  bool Take(const std::string& batch_id, ImageAccumulation* out) override {
    ++takes;
    return inner_.Take(batch_id, out);
  }
  bool Erase(const std::string& batch_id) override { return inner_.Erase(batch_id); }
  bool Contains(const std::string& batch_id) const override { return inner_.Contains(batch_id); }
  size_t Size() const override { return inner_.Size(); }
  void Clear() override { inner_.Clear(); }

  mutable int copies = 0;
  int puts = 0;
  int takes = 0;

 private:
  InMemoryBatchStore<ImageAccumulation> inner_;
};

const RGBColor kColors[] = {
    {1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, {1.0f, 1.0f, 0.0f},
    {0.0f, 1.0f, 1.0f}, {1.0f, 0.0f, 1.0f}, {0.5f, 0.5f, 0.5f}, {1.0f, 1.0f, 1.0f},
};
}  // namespace

int main() {
  LogService log;
  GridImageCompositor compositor(nullptr, &log);
  CompositorOptions plain;
  plain.include_labels = false;
  plain.grid_gap = 2;

  // Gating: placeholder until the last image, then exactly one emission.
  {
    const GridConfiguration config = MakeConfig("gate", 2, 2, 0);
    for (int i = 0; i < 3; ++i) {
      const CombineResult partial =
          compositor.CombineImages(MakeSolidImage(10, 6, kColors[i]), config, plain);
      const std::string expected_info = "Grid progress: " + std::to_string(i + 1) + "/4 images";
      if (!partial.ok || partial.complete || partial.info != expected_info) {
        std::cerr << "unexpected partial result: " << partial.info << "\n";
        return 1;
      }
      if (partial.pages.size() != 1 || partial.pages[0].width != 64 ||
          partial.pages[0].height != 64 || !SameColor(PixelColor(partial.pages[0], 5, 5),
                                                      {0.0f, 0.0f, 0.0f})) {
        std::cerr << "placeholder must be a 64x64 black image\n";
        return 1;
      }
      if (compositor.BufferedCount("gate") != i + 1) {
        std::cerr << "buffer count mismatch\n";
        return 1;
      }
    }
    const CombineResult done =
        compositor.CombineImages(MakeSolidImage(10, 6, kColors[3]), config, plain);
    if (!done.ok || !done.complete || done.pages.size() != 1) {
      std::cerr << "grid did not complete on the last image\n";
      return 1;
    }
    if (compositor.HasBuffer("gate")) {
      std::cerr << "buffer must be freed after composition\n";
      return 1;
    }
    const Image& page = done.pages[0];
    if (page.width != 2 * 10 + 2 || page.height != 2 * 6 + 2) {
      std::cerr << "unexpected canvas " << page.width << "x" << page.height << "\n";
      return 1;
    }
    // Image i lands at (i % cols, i / cols).
    const int samples[4][2] = {{3, 3}, {15, 3}, {3, 10}, {15, 10}};
    for (int i = 0; i < 4; ++i) {
      if (!SameColor(PixelColor(page, samples[i][0], samples[i][1]), kColors[i])) {
        std::cerr << "cell " << i << " has the wrong colour\n";
        return 1;
      }
    }
    // Gap keeps the background colour.
    if (!SameColor(PixelColor(page, 10, 3), {32.0f / 255.0f, 32.0f / 255.0f, 32.0f / 255.0f})) {
      std::cerr << "gap must show the background\n";
      return 1;
    }
    if (done.info != "Grid: 2x2 | X: sampler (2 values) | Y: steps (2 values) | Total images: 4") {
      std::cerr << "unexpected info: " << done.info << "\n";
      return 1;
    }
    // A finished batch starts over from an empty buffer.
    const CombineResult again =
        compositor.CombineImages(MakeSolidImage(10, 6, kColors[0]), config, plain);
    if (again.complete || again.received != 1) {
      std::cerr << "buffer must restart empty after emission\n";
      return 1;
    }
    compositor.DiscardBatch("gate");
    if (compositor.HasBuffer("gate")) {
      std::cerr << "DiscardBatch must drop the buffer\n";
      return 1;
    }
  }

  // Multi-image delivery and Z pages with labels.
  {
    const GridConfiguration config = MakeConfig("pages", 2, 1, 2);
    CompositorOptions options;
    options.font_size = 16;
    options.grid_gap = 4;
    options.label_height = 24;
    std::vector<Image> batch;
    for (int i = 0; i < 4; ++i) {
      batch.push_back(MakeSolidImage(32, 32, kColors[i]));
    }
    const CombineResult done = compositor.CombineImages(batch, config, options);
    if (!done.ok || !done.complete || done.pages.size() != 2) {
      std::cerr << "expected two pages from one batch delivery\n";
      return 1;
    }
    const GridLayout layout = ComputeGridLayout(config, 32, 32, options);
    const std::vector<std::string> y_labels = DisplayLabels(config.axes.y, 30);
    const int expected_row_label =
        MeasureTextWidth(y_labels[0], GlyphScaleForFontSize(16)) + 2 * 3 + 2 * 5;
    if (layout.row_label_width != expected_row_label || layout.header_height != 24 ||
        layout.z_label_height != 24) {
      std::cerr << "unexpected label geometry\n";
      return 1;
    }
    for (const auto& page : done.pages) {
      if (page.width != 2 * 32 + 4 + layout.row_label_width ||
          page.height != 32 + 24 + 24) {
        std::cerr << "unexpected labeled canvas " << page.width << "x" << page.height << "\n";
        return 1;
      }
    }
    // Page 1 holds images 2 and 3.
    const int cx = layout.CellX(1) + 16;
    const int cy = layout.CellY(0) + 16;
    if (!SameColor(PixelColor(done.pages[1], cx, cy), kColors[3]) ||
        !SameColor(PixelColor(done.pages[0], cx, cy), kColors[1])) {
      std::cerr << "pages hold the wrong images\n";
      return 1;
    }
    // Some label pixels are drawn in the header band.
    bool white = false;
    for (int y = layout.z_label_height; y < layout.z_label_height + layout.header_height; ++y) {
      for (int x = layout.CellX(0); x < layout.CellX(0) + 32; ++x) {
        white = white || SameColor(PixelColor(done.pages[0], x, y), {1.0f, 1.0f, 1.0f});
      }
    }
    if (!white) {
      std::cerr << "X label text missing\n";
      return 1;
    }
  }

  // Glyph table.
  {
    int lit = 0;
    for (int row = 0; row < kGlyphSize; ++row) {
      for (int col = 0; col < kGlyphSize; ++col) {
        lit += GlyphPixelSet('A', col, row) ? 1 : 0;
        if (GlyphPixelSet(' ', col, row)) {
          std::cerr << "space glyph must be blank\n";
          return 1;
        }
      }
    }
    if (lit == 0 || GlyphPixelSet('A', kGlyphSize, 0)) {
      std::cerr << "unexpected glyph bits\n";
      return 1;
    }
    if (MeasureTextWidth("abc", 2) != 48 || MeasureTextHeight(3) != 24 ||
        GlyphScaleForFontSize(20) != 2 || GlyphScaleForFontSize(4) != 1) {
      std::cerr << "unexpected text metrics\n";
      return 1;
    }
  }

  // Single page: no Z band.
  {
    const GridConfiguration config = MakeConfig("single", 2, 2, 0);
    const GridLayout layout = ComputeGridLayout(config, 16, 16, CompositorOptions());
    if (layout.z_label_height != 0 || layout.pages != 1) {
      std::cerr << "single page must not reserve a title band\n";
      return 1;
    }
  }

  // Truncation of long labels.
  {
    AxisSpec axis;
    axis.type = AxisType::Prompt;
    axis.labels = {std::string(50, 'a')};
    const std::vector<std::string> shown = DisplayLabels(axis, 12);
    if (shown[0] != "aaaaaaaaa...") {
      std::cerr << "labels must be truncated to max_label_length\n";
      return 1;
    }
  }

  // Mismatched images are rejected and leave the buffer as it was.
  {
    const GridConfiguration config = MakeConfig("mismatch", 2, 1, 0);
    compositor.CombineImages(MakeSolidImage(8, 8, kColors[0]), config, plain);
    const CombineResult bad =
        compositor.CombineImages(MakeSolidImage(9, 8, kColors[1]), config, plain);
    if (bad.ok || bad.error.empty() || compositor.BufferedCount("mismatch") != 1) {
      std::cerr << "mismatched image must be rejected\n";
      return 1;
    }
    const CombineResult channels =
        compositor.CombineImages(MakeSolidImage(8, 8, kColors[1], 4), config, plain);
    if (channels.ok) {
      std::cerr << "channel mismatch must be rejected\n";
      return 1;
    }
    const CombineResult good =
        compositor.CombineImages(MakeSolidImage(8, 8, kColors[1]), config, plain);
    if (!good.ok || !good.complete) {
      std::cerr << "batch must still complete after a rejected image\n";
      return 1;
    }
  }

  // Extra images beyond the expected count are dropped.
  {
    const GridConfiguration config = MakeConfig("extra", 2, 1, 0);
    std::vector<Image> three(3, MakeSolidImage(4, 4, kColors[2]));
    const CombineResult done = compositor.CombineImages(three, config, plain);
    if (!done.complete || done.received != 2) {
      std::cerr << "extra images must be dropped\n";
      return 1;
    }
  }

  // Buffered images are appended in place, never copied back out per call.
  {
    auto store = std::make_shared<CountingStore>();
    GridImageCompositor counted(store);
    const GridConfiguration config = MakeConfig("in-place", 4, 4, 1);
    CombineResult last;
    for (int i = 0; i < 16; ++i) {
      last = counted.CombineImages(MakeSolidImage(6, 6, kColors[i % 8]), config, plain);
      if (counted.BufferedCount("in-place") != (i + 1) % 16) {
        std::cerr << "buffer count mismatch at image " << i << "\n";
        return 1;
      }
    }
    if (!last.complete || store->copies != 0 || store->puts != 1 || store->takes != 1) {
      std::cerr << "accumulation copied: copies=" << store->copies << " puts=" << store->puts
                << " takes=" << store->takes << "\n";
      return 1;
    }
    if (!SameColor(PixelColor(last.pages[0], 3 * 8 + 3, 3 * 8 + 3), kColors[15 % 8])) {
      std::cerr << "last image landed in the wrong cell\n";
      return 1;
    }
  }

  // Invalid configuration.
  {
    GridConfiguration broken = MakeConfig("broken", 2, 2, 0);
    broken.dimensions.total_images = 5;
    const CombineResult result =
        compositor.CombineImages(MakeSolidImage(4, 4, kColors[0]), broken, plain);
    if (result.ok || compositor.HasBuffer("broken")) {
      std::cerr << "invalid configuration must be rejected\n";
      return 1;
    }
  }

  std::cout << "grid compositor test passed\n";
  return 0;
}
