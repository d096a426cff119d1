#ifndef GRID_COMPOSITOR_H
#define GRID_COMPOSITOR_H

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "batch_store.h"
#include "grid_config.h"
#include "image.h"

class LogService;

struct CompositorOptions {
  int font_size = 20;
  int grid_gap = 10;
  int label_height = 30;
  int max_label_length = 30;
  bool include_labels = true;
};

// Pixel geometry of every page of one grid.
struct GridLayout {
  int cell_width = 0;
  int cell_height = 0;
  int cols = 1;
  int rows = 1;
  int pages = 1;
  int gap = 0;
  int glyph_scale = 1;
  int header_height = 0;    // X label band
  int z_label_height = 0;   // page title band, only with more than one page
  int row_label_width = 0;  // Y label column
  int canvas_width = 0;
  int canvas_height = 0;

  // Top-left corner of cell (col, row) on its page.
  int CellX(int col) const { return row_label_width + col * (cell_width + gap); }
  int CellY(int row) const { return z_label_height + header_height + row * (cell_height + gap); }
};

// Label text as drawn: the configured labels (or generated ones when the
// record carries none), truncated to max_label_length.
std::vector<std::string> DisplayLabels(const AxisSpec& axis, int max_label_length);

GridLayout ComputeGridLayout(const GridConfiguration& config,
                             int cell_width,
                             int cell_height,
                             const CompositorOptions& options);

// One page per Z value. Image i of page z sits at (i % cols, i / cols); missing
// images leave the background visible. All images must share one shape.
std::vector<Image> ComposeGridPages(const GridConfiguration& config,
                                    const std::vector<Image>& images,
                                    const CompositorOptions& options);

// "Grid: 2x2 | X: sampler (2 values) | Y: cfg_scale (2 values) | Total images: 4"
std::string BuildGridInfo(const GridConfiguration& config);

struct CombineResult {
  bool ok = true;
  std::string error;
  bool complete = false;
  std::vector<Image> pages;  // placeholder while incomplete
  std::string info;
  int received = 0;
  int expected = 0;
};

struct ImageAccumulation {
  GridConfiguration config;
  std::vector<Image> images;
};

using AccumulationStore = BatchStore<ImageAccumulation>;

// Collects images of a batch across ticks and emits the labeled pages exactly
// once, when the last expected image arrives. The configuration seen with the
// first image of a batch is the one used for layout.
class GridImageCompositor {
 public:
  explicit GridImageCompositor(std::shared_ptr<AccumulationStore> store = nullptr,
                               LogService* log = nullptr);

  CombineResult CombineImages(const Image& image,
                              const GridConfiguration& grid_data,
                              const CompositorOptions& options = CompositorOptions());
  CombineResult CombineImages(const std::vector<Image>& images,
                              const GridConfiguration& grid_data,
                              const CompositorOptions& options = CompositorOptions());

  int BufferedCount(const std::string& batch_id) const;
  bool HasBuffer(const std::string& batch_id) const;
  void DiscardBatch(const std::string& batch_id);

 private:
  std::shared_ptr<AccumulationStore> store_;
  LogService* log_ = nullptr;
  std::mutex mutex_;
};

#endif  // GRID_COMPOSITOR_H
