#ifndef DOCPIPE_CLIENT_LINE_INDEX_HPP
#define DOCPIPE_CLIENT_LINE_INDEX_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docpipe {
namespace client {

// Line start offsets of a buffer that only grows at its end.
// A buffer with N newlines has N + 1 lines; the last one may be empty.
class LineIndex {
public:
  LineIndex();

  // Indexes whatever was appended since the last call. Starts over if the buffer shrank.
  void update(const std::string& text);
  // Forgets everything; the next update scans from the beginning
  void reset();

  std::size_t line_count() const { return starts_.size(); }
  std::size_t indexed_bytes() const { return scanned_; }

  // Line `i` of `text` without its newline. `text` must be the indexed buffer.
  std::string_view line(const std::string& text, std::size_t i) const;

private:
  std::vector<std::size_t> starts_;
  std::size_t scanned_;
};

} // namespace client
} // namespace docpipe

#endif // DOCPIPE_CLIENT_LINE_INDEX_HPP
