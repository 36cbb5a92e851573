#include "client/virtualized_view.hpp"
#include "store/store_error.hpp"
#include <algorithm>
#include <cmath>

namespace docpipe {
namespace client {

VirtualizedView::VirtualizedView(ViewportConfig config)
  : config_(config)
  , source_(nullptr)
  , scroll_top_(0.0) {
  if (config_.line_height <= 0.0) {
    throw store::InvalidArgumentError("line height must be positive");
  }
  if (config_.viewport_height <= 0.0) {
    throw store::InvalidArgumentError("viewport height must be positive");
  }
}


//==============================================
// SOURCE
//==============================================

void VirtualizedView::set_source(const std::string* source) {
  source_ = source;
  index_.reset();
  scroll_top_ = 0.0;
  refresh();
}

void VirtualizedView::refresh() {
  if (source_) {
    index_.update(*source_);
  }
}


//==============================================
// SCROLLING
//==============================================

double VirtualizedView::max_scroll() {
  const double total = static_cast<double>(line_count()) * config_.line_height;
  return std::max(0.0, total - config_.viewport_height);
}

void VirtualizedView::set_scroll(double scroll_top) {
  scroll_top_ = std::clamp(scroll_top, 0.0, max_scroll());
}

void VirtualizedView::scroll_lines(long lines) {
  set_scroll(scroll_top_ + static_cast<double>(lines) * config_.line_height);
}

void VirtualizedView::scroll_to_end() {
  set_scroll(max_scroll());
}


//==============================================
// RENDERING
//==============================================

std::size_t VirtualizedView::line_count() {
  refresh();
  if (!source_ || source_->empty()) {
    return 0;
  }
  return index_.line_count();
}

RenderWindow VirtualizedView::window() {
  RenderWindow result;
  const std::size_t lines = line_count();
  result.total_height = static_cast<double>(lines) * config_.line_height;
  if (lines == 0) {
    return result;
  }

  const auto first_visible = static_cast<std::size_t>(std::floor(scroll_top_ / config_.line_height));
  const auto visible = static_cast<std::size_t>(std::ceil(config_.viewport_height / config_.line_height));

  result.start_line = first_visible > config_.buffer_lines ? first_visible - config_.buffer_lines : 0;
  result.start_line = std::min(result.start_line, lines);
  result.end_line = std::min(lines, result.start_line + visible + 2 * config_.buffer_lines);
  result.offset_y = static_cast<double>(result.start_line) * config_.line_height;
  return result;
}

std::vector<std::string_view> VirtualizedView::visible_lines() {
  std::vector<std::string_view> lines;
  const RenderWindow win = window();
  lines.reserve(win.end_line - win.start_line);
  for (std::size_t i = win.start_line; i < win.end_line; ++i) {
    lines.push_back(index_.line(*source_, i));
  }
  return lines;
}

void VirtualizedView::render(std::ostream& out) {
  for (std::string_view line : visible_lines()) {
    if (line.empty()) {
      out << ' ';
    } else {
      out << line;
    }
    out << '\n';
  }
}

ScrollMetrics VirtualizedView::scroll_metrics() {
  ScrollMetrics metrics;
  metrics.scroll_top = scroll_top_;
  metrics.client_height = config_.viewport_height;
  metrics.scroll_height = static_cast<double>(line_count()) * config_.line_height;
  return metrics;
}

} // namespace client
} // namespace docpipe
