#ifndef DOCPIPE_CLIENT_BASE64_SESSION_HPP
#define DOCPIPE_CLIENT_BASE64_SESSION_HPP

#include <string>
#include "transform/transform_pipeline.hpp"

namespace docpipe {
namespace client {

constexpr const char* INVALID_BASE64_MESSAGE = "Invalid Base64 string";

struct Base64View {
  std::string plain;
  std::string encoded;
  std::string error;
};

// Two-sided base64 editor. Only the side edited last is stored; the other side is
// derived from it on every view.
class Base64Session {
public:
  enum class Side { PLAIN, ENCODED };

  explicit Base64Session(const transform::TransformPipeline& pipeline);

  void set_plain(const std::string& text);
  void set_encoded(const std::string& text);
  void clear();

  Base64View view() const;

  Side edited_side() const { return side_; }
  const std::string& edited_text() const { return text_; }

private:
  const transform::TransformPipeline& pipeline_;
  Side side_;
  std::string text_;
};

} // namespace client
} // namespace docpipe

#endif // DOCPIPE_CLIENT_BASE64_SESSION_HPP
