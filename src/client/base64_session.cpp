#include "client/base64_session.hpp"
#include "transform/builtin_transforms.hpp"
#include <boost/log/trivial.hpp>

namespace docpipe {
namespace client {

Base64Session::Base64Session(const transform::TransformPipeline& pipeline)
  : pipeline_(pipeline)
  , side_(Side::PLAIN) {}

void Base64Session::set_plain(const std::string& text) {
  side_ = Side::PLAIN;
  text_ = text;
}

void Base64Session::set_encoded(const std::string& text) {
  side_ = Side::ENCODED;
  text_ = text;
}

void Base64Session::clear() {
  side_ = Side::PLAIN;
  text_.clear();
}

Base64View Base64Session::view() const {
  Base64View result;
  if (side_ == Side::PLAIN) {
    result.plain = text_;
    if (!text_.empty()) {
      result.encoded = pipeline_.transform_text(transform::ENCODE_TRANSFORM, text_);
    }
    return result;
  }

  result.encoded = text_;
  if (text_.empty()) {
    return result;
  }
  try {
    result.plain = pipeline_.transform_text(transform::DECODE_TRANSFORM, text_);
  } catch (const transform::TransformError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Base64 session: " << e.what();
    result.error = INVALID_BASE64_MESSAGE;
  }
  return result;
}

} // namespace client
} // namespace docpipe
