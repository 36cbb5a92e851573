#ifndef DOCPIPE_CLIENT_VIRTUALIZED_VIEW_HPP
#define DOCPIPE_CLIENT_VIRTUALIZED_VIEW_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "client/line_index.hpp"

namespace docpipe {
namespace client {

struct ViewportConfig {
  double line_height{20.0};
  double viewport_height{400.0};
  std::size_t buffer_lines{10};
};

// Lines [start_line, end_line) are materialised, drawn offset_y from the top of a
// total_height tall surface
struct RenderWindow {
  std::size_t start_line{0};
  std::size_t end_line{0};
  double offset_y{0.0};
  double total_height{0.0};
};

struct ScrollMetrics {
  double scroll_top{0.0};
  double client_height{0.0};
  double scroll_height{0.0};
};

/**
 * Renders only the lines around the scroll position of a text buffer.
 *
 * The view does not own the buffer; it re-indexes the appended tail whenever it is
 * queried, so a buffer that keeps growing costs only what was added. A buffer that is
 * replaced by different text of equal or greater length must be announced with set_source.
 */
class VirtualizedView {
public:
  explicit VirtualizedView(ViewportConfig config = ViewportConfig());

  // ---- SOURCE ----
  void set_source(const std::string* source);
  void clear_source() { set_source(nullptr); }
  bool has_source() const { return source_ != nullptr; }

  // ---- SCROLLING ----
  // Clamped to [0, max_scroll]
  void set_scroll(double scroll_top);
  void scroll_lines(long lines);
  void scroll_to_top() { set_scroll(0.0); }
  void scroll_to_end();
  double scroll_top() const { return scroll_top_; }
  double max_scroll();

  // ---- RENDERING ----
  std::size_t line_count();
  RenderWindow window();
  std::vector<std::string_view> visible_lines();
  // Writes the window's lines, one per output line; an empty line is written as a space
  void render(std::ostream& out);
  ScrollMetrics scroll_metrics();

  const ViewportConfig& config() const { return config_; }

private:
  ViewportConfig config_;
  const std::string* source_;
  LineIndex index_;
  double scroll_top_;

  void refresh();
};

} // namespace client
} // namespace docpipe

#endif // DOCPIPE_CLIENT_VIRTUALIZED_VIEW_HPP
