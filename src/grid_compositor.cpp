#include "grid_compositor.h"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "axis_labels.h"
#include "bitmap_font.h"
#include "log_service.h"
#include "string_utils.h"

namespace {

constexpr const char* kLogCategory = "compositor";

constexpr RGBColor kBackground = {32.0f / 255.0f, 32.0f / 255.0f, 32.0f / 255.0f};
constexpr RGBColor kLabelBox = {0.0f, 0.0f, 0.0f};
constexpr RGBColor kLabelText = {1.0f, 1.0f, 1.0f};
constexpr float kLabelBoxAlpha = 180.0f / 255.0f;
constexpr int kLabelPadding = 3;
constexpr int kRowLabelMargin = 5;
constexpr int kPlaceholderSize = 64;

enum class LabelAlign { Center, Right };

// Background box plus text, everything clipped to the label's region.
void DrawLabel(Image* canvas, const std::string& text, const PixelRect& region, int scale,
               LabelAlign align) {
  if (text.empty()) {
    return;
  }
  const int text_w = MeasureTextWidth(text, scale);
  const int text_h = MeasureTextHeight(scale);
  const int region_w = region.x1 - region.x0;
  const int region_h = region.y1 - region.y0;

  int text_x = region.x0 + (region_w - text_w) / 2;
  if (align == LabelAlign::Right) {
    text_x = region.x1 - kRowLabelMargin - kLabelPadding - text_w;
  }
  const int text_y = region.y0 + (region_h - text_h) / 2;

  const PixelRect box = {text_x - kLabelPadding, text_y - kLabelPadding,
                         text_x + text_w + kLabelPadding, text_y + text_h + kLabelPadding};
  FillRect(canvas, box, kLabelBox, kLabelBoxAlpha, &region);
  DrawText(canvas, text, text_x, text_y, scale, kLabelText, &region);
}

std::string LabelAt(const std::vector<std::string>& labels, int index) {
  if (index < 0 || index >= static_cast<int>(labels.size())) {
    return std::string();
  }
  return labels[static_cast<size_t>(index)];
}

}  // namespace

std::vector<std::string> DisplayLabels(const AxisSpec& axis, int max_label_length) {
  std::vector<std::string> labels = axis.labels;
  if (labels.empty() && axis.IsConfigured()) {
    labels = GenerateAxisLabels(axis.values, axis.type, axis.label_prefix);
  }
  const size_t limit = static_cast<size_t>(std::max(4, max_label_length));
  for (auto& label : labels) {
    if (label.size() > limit) {
      label = xyz::TruncateWithEllipsis(label, limit);
    }
  }
  return labels;
}

GridLayout ComputeGridLayout(const GridConfiguration& config,
                             int cell_width,
                             int cell_height,
                             const CompositorOptions& options) {
  GridLayout layout;
  layout.cell_width = std::max(0, cell_width);
  layout.cell_height = std::max(0, cell_height);
  layout.cols = std::max(1, config.dimensions.cols);
  layout.rows = std::max(1, config.dimensions.rows);
  layout.pages = std::max(1, config.dimensions.grids_count);
  layout.gap = std::max(0, options.grid_gap);
  layout.glyph_scale = GlyphScaleForFontSize(options.font_size);

  if (options.include_labels) {
    const int band = std::max(0, options.label_height);
    layout.header_height = band;
    layout.z_label_height = layout.pages > 1 ? band : 0;

    int widest = 0;
    for (const auto& label : DisplayLabels(config.axes.y, options.max_label_length)) {
      widest = std::max(widest, MeasureTextWidth(label, layout.glyph_scale));
    }
    if (widest > 0) {
      layout.row_label_width = widest + 2 * kLabelPadding + 2 * kRowLabelMargin;
    }
  }

  layout.canvas_width = layout.cols * layout.cell_width + (layout.cols - 1) * layout.gap +
                        layout.row_label_width;
  layout.canvas_height = layout.rows * layout.cell_height + (layout.rows - 1) * layout.gap +
                         layout.header_height + layout.z_label_height;
  return layout;
}

std::vector<Image> ComposeGridPages(const GridConfiguration& config,
                                    const std::vector<Image>& images,
                                    const CompositorOptions& options) {
  std::vector<Image> pages;
  if (images.empty()) {
    return pages;
  }
  const Image& first = images.front();
  const GridLayout layout = ComputeGridLayout(config, first.width, first.height, options);
  const int per_page = layout.cols * layout.rows;

  const std::vector<std::string> x_labels =
      DisplayLabels(config.axes.x, options.max_label_length);
  const std::vector<std::string> y_labels =
      DisplayLabels(config.axes.y, options.max_label_length);
  const std::vector<std::string> z_labels =
      DisplayLabels(config.axes.z, options.max_label_length);

  pages.reserve(static_cast<size_t>(layout.pages));
  for (int z = 0; z < layout.pages; ++z) {
    Image canvas = MakeSolidImage(layout.canvas_width, layout.canvas_height, kBackground,
                                  first.channels);

    if (options.include_labels) {
      if (layout.z_label_height > 0) {
        DrawLabel(&canvas, LabelAt(z_labels, z), {0, 0, layout.canvas_width, layout.z_label_height},
                  layout.glyph_scale, LabelAlign::Center);
      }
      if (layout.header_height > 0) {
        for (int col = 0; col < layout.cols; ++col) {
          const int x = layout.CellX(col);
          const PixelRect region = {x, layout.z_label_height, x + layout.cell_width,
                                    layout.z_label_height + layout.header_height};
          DrawLabel(&canvas, LabelAt(x_labels, col), region, layout.glyph_scale,
                    LabelAlign::Center);
        }
      }
      if (layout.row_label_width > 0) {
        for (int row = 0; row < layout.rows; ++row) {
          const int y = layout.CellY(row);
          const PixelRect region = {0, y, layout.row_label_width, y + layout.cell_height};
          DrawLabel(&canvas, LabelAt(y_labels, row), region, layout.glyph_scale,
                    LabelAlign::Right);
        }
      }
    }

    for (int i = 0; i < per_page; ++i) {
      const size_t index = static_cast<size_t>(z) * static_cast<size_t>(per_page) +
                           static_cast<size_t>(i);
      if (index >= images.size()) {
        break;
      }
      BlitImage(&canvas, images[index], layout.CellX(i % layout.cols),
                layout.CellY(i / layout.cols));
    }
    pages.push_back(std::move(canvas));
  }
  return pages;
}

std::string BuildGridInfo(const GridConfiguration& config) {
  const GridDimensions& dims = config.dimensions;
  std::string info = "Grid: " + std::to_string(dims.cols) + "x" + std::to_string(dims.rows);
  const std::pair<const char*, const AxisSpec*> axes[] = {
      {"X", &config.axes.x}, {"Y", &config.axes.y}, {"Z", &config.axes.z}};
  for (const auto& axis : axes) {
    if (!axis.second->IsConfigured() || axis.second->values.empty()) {
      continue;
    }
    info += " | " + std::string(axis.first) + ": " + AxisTypeToken(axis.second->type) + " (" +
            std::to_string(axis.second->values.size()) + " values)";
  }
  info += " | Total images: " + std::to_string(dims.total_images);
  return info;
}

GridImageCompositor::GridImageCompositor(std::shared_ptr<AccumulationStore> store,
                                         LogService* log)
    : store_(store ? std::move(store) : std::make_shared<InMemoryBatchStore<ImageAccumulation>>()),
      log_(log) {}

CombineResult GridImageCompositor::CombineImages(const Image& image,
                                                 const GridConfiguration& grid_data,
                                                 const CompositorOptions& options) {
  return CombineImages(std::vector<Image>{image}, grid_data, options);
}

CombineResult GridImageCompositor::CombineImages(const std::vector<Image>& images,
                                                 const GridConfiguration& grid_data,
                                                 const CompositorOptions& options) {
  CombineResult result;
  std::string error;
  const auto fail = [&](const std::string& message) {
    result.ok = false;
    result.error = message;
    if (log_) {
      log_->Error(kLogCategory, message);
    }
    return result;
  };

  for (const auto& image : images) {
    if (!IsWellFormed(image)) {
      return fail("batch " + grid_data.batch_id + ": image buffer does not match its shape");
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string& batch_id = grid_data.batch_id;
  // Buffered images are read in place; only their count and shape leave the
  // store.
  int expected = 0;
  int buffered = 0;
  Image reference;
  const bool known = store_->Visit(batch_id, [&](const ImageAccumulation& accumulation) {
    expected = accumulation.config.dimensions.total_images;
    buffered = static_cast<int>(accumulation.images.size());
    if (!accumulation.images.empty()) {
      reference.width = accumulation.images.front().width;
      reference.height = accumulation.images.front().height;
      reference.channels = accumulation.images.front().channels;
    }
  });
  if (!known) {
    if (!ValidateGridConfiguration(grid_data, &error)) {
      return fail("invalid grid configuration: " + error);
    }
    expected = grid_data.dimensions.total_images;
  }
  if (buffered == 0 && !images.empty()) {
    reference.width = images.front().width;
    reference.height = images.front().height;
    reference.channels = images.front().channels;
  }
  for (const auto& image : images) {
    if (!SameShape(reference, image)) {
      return fail("batch " + batch_id + ": image " + std::to_string(image.width) + "x" +
                  std::to_string(image.height) + "x" + std::to_string(image.channels) +
                  " does not match " + std::to_string(reference.width) + "x" +
                  std::to_string(reference.height) + "x" + std::to_string(reference.channels));
    }
  }

  const size_t accepted =
      std::min(images.size(), static_cast<size_t>(std::max(0, expected - buffered)));
  if (accepted < images.size() && log_) {
    log_->Warning(kLogCategory, "batch " + batch_id + ": dropping " +
                                    std::to_string(images.size() - accepted) +
                                    " image(s) beyond the expected " + std::to_string(expected));
  }
  if (known) {
    store_->Modify(batch_id, [&](ImageAccumulation* accumulation) {
      accumulation->images.insert(accumulation->images.end(), images.begin(),
                                  images.begin() + static_cast<std::ptrdiff_t>(accepted));
    });
  } else {
    ImageAccumulation accumulation;
    accumulation.config = grid_data;
    accumulation.images.assign(images.begin(),
                               images.begin() + static_cast<std::ptrdiff_t>(accepted));
    store_->Put(batch_id, std::move(accumulation));
  }

  result.received = buffered + static_cast<int>(accepted);
  result.expected = expected;

  if (result.received < expected) {
    result.pages.push_back(MakeImage(kPlaceholderSize, kPlaceholderSize, 3));
    result.info = "Grid progress: " + std::to_string(result.received) + "/" +
                  std::to_string(expected) + " images";
    if (log_) {
      log_->Info(kLogCategory, "batch " + batch_id + " " + result.info);
    }
    return result;
  }

  ImageAccumulation accumulation;
  if (!store_->Take(batch_id, &accumulation)) {
    return fail("batch " + batch_id + ": buffer disappeared before composition");
  }
  const GridConfiguration& config = accumulation.config;
  result.complete = true;
  result.pages = ComposeGridPages(config, accumulation.images, options);
  result.info = BuildGridInfo(config);
  if (log_) {
    log_->Info(kLogCategory, "batch " + config.batch_id + " composed " +
                                 std::to_string(result.pages.size()) + " page(s)");
  }
  return result;
}

int GridImageCompositor::BufferedCount(const std::string& batch_id) const {
  int count = 0;
  store_->Visit(batch_id, [&count](const ImageAccumulation& accumulation) {
    count = static_cast<int>(accumulation.images.size());
  });
  return count;
}

bool GridImageCompositor::HasBuffer(const std::string& batch_id) const {
  return store_->Contains(batch_id);
}

void GridImageCompositor::DiscardBatch(const std::string& batch_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (store_->Erase(batch_id) && log_) {
    log_->Info(kLogCategory, "discarded buffer of batch " + batch_id);
  }
}
