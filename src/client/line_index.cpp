#include "client/line_index.hpp"
#include <stdexcept>

namespace docpipe {
namespace client {

LineIndex::LineIndex()
  : starts_{0}
  , scanned_(0) {}

void LineIndex::reset() {
  starts_.assign(1, 0);
  scanned_ = 0;
}

void LineIndex::update(const std::string& text) {
  if (text.size() < scanned_) {
    reset();
  }

  std::size_t pos = text.find('\n', scanned_);
  while (pos != std::string::npos) {
    starts_.push_back(pos + 1);
    pos = text.find('\n', pos + 1);
  }
  scanned_ = text.size();
}

std::string_view LineIndex::line(const std::string& text, std::size_t i) const {
  if (i >= starts_.size()) {
    throw std::out_of_range("Line " + std::to_string(i) + " beyond " + std::to_string(starts_.size()) + " lines");
  }

  const std::size_t begin = starts_[i];
  const std::size_t end = (i + 1 < starts_.size()) ? starts_[i + 1] - 1 : scanned_;
  if (end > text.size() || begin > end) {
    throw std::out_of_range("Line index does not match the buffer");
  }
  return std::string_view(text).substr(begin, end - begin);
}

} // namespace client
} // namespace docpipe
