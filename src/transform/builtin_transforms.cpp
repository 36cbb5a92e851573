#include "transform/builtin_transforms.hpp"
#include "store/chunk_addressing.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <vector>

namespace docpipe {
namespace transform {

using json = nlohmann::json;

namespace {

//==============================================
// TEXT HELPERS
//==============================================

std::string trim(const std::string& text) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(text.begin(), text.end(), is_space);
  auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string indent(int depth) {
  return std::string(static_cast<std::size_t>(std::max(depth, 0)) * 2, ' ');
}

bool is_valid_utf8(const std::string& text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    if (c < 0x80) {
      extra = 0;
    } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
    } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
      extra = 3;
    } else {
      return false;
    }
    if (extra > 0 && i + extra >= text.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    i += extra + 1;
  }
  return true;
}

// Parses JSON, turning the parser's failure into a ParseError that points at the offending column
json parse_json(const std::string& text) {
  try {
    return json::parse(text);
  } catch (const json::parse_error& e) {
    std::size_t pos = e.byte > 0 ? e.byte - 1 : 0;
    pos = std::min(pos, text.size());

    const std::size_t line_start = (pos == 0) ? 0 : [&]() {
      const std::size_t nl = text.rfind('\n', pos - 1);
      return nl == std::string::npos ? 0 : nl + 1;
    }();
    const std::size_t line_end = std::min(text.find('\n', line_start), text.size());
    const std::size_t line = static_cast<std::size_t>(
      std::count(text.begin(), text.begin() + line_start, '\n')) + 1;
    const std::size_t column = pos - line_start + 1;

    std::ostringstream message;
    message << "Parse error on line " << line << " column " << column << ":\n"
            << text.substr(line_start, line_end - line_start) << "\n"
            << std::string(column - 1, '-') << "^\n"
            << e.what();
    throw ParseError(message.str());
  }
}

std::string dump_pretty(const json& value) {
  return value.dump(2, ' ', false, json::error_handler_t::replace);
}


//==============================================
// JSON SUMMARY SUPPORT
//==============================================

struct JsonStats {
  std::size_t objects{0};
  std::size_t arrays{0};
  std::size_t primitives{0};
  std::size_t max_depth{0};
  std::size_t total_keys{0};
};

const char* value_type(const json& value) {
  switch (value.type()) {
    case json::value_t::object:  return "Object";
    case json::value_t::array:   return "Array";
    case json::value_t::string:  return "String";
    case json::value_t::boolean: return "Boolean";
    case json::value_t::null:    return "null";
    default:                     return "Number";
  }
}

// First 47 characters plus an ellipsis once a string exceeds 50 characters
std::string preview(const std::string& text) {
  if (store::character_count(text) <= 50) {
    return text;
  }
  const auto boundaries = store::character_boundaries(text, 47);
  return text.substr(0, boundaries[1]) + "...";
}

void summarize_value(const json& value, const std::string& key, std::size_t depth, std::ostringstream& out) {
  const std::string pad = indent(static_cast<int>(depth));

  if (value.is_object()) {
    if (depth == 0) {
      out << pad << "\xF0\x9F\x93\x81 " << key << " (Object with " << value.size() << " keys)\n";
    } else {
      out << pad << "\xF0\x9F\x93\x81 " << key << ": Object (" << value.size() << " keys)\n";
    }
    for (const auto& item : value.items()) {
      summarize_value(item.value(), item.key(), depth + 1, out);
    }
  } else if (value.is_array()) {
    out << pad << "\xF0\x9F\x93\x8B " << key << ": Array (" << value.size() << " items)\n";
    if (value.empty()) {
      return;
    }

    std::set<std::string> types;
    for (const auto& item : value) {
      types.insert(value_type(item));
    }
    if (types.size() == 1) {
      out << pad << "   \xE2\x94\x94\xE2\x94\x80 All items are: " << *types.begin() << "\n";
    } else {
      out << pad << "   \xE2\x94\x94\xE2\x94\x80 Mixed types: ";
      bool first = true;
      for (const auto& type : types) {
        out << (first ? "" : ", ") << type;
        first = false;
      }
      out << "\n";
    }

    if (value.front().is_object()) {
      out << pad << "   \xE2\x94\x94\xE2\x94\x80 First item structure:\n";
      summarize_value(value.front(), "item", depth + 2, out);
    }
  } else if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    out << pad << "\xF0\x9F\x93\x9D " << key << ": String (" << store::character_count(text)
        << " chars) - \"" << preview(text) << "\"\n";
  } else if (value.is_number()) {
    out << pad << "\xF0\x9F\x94\xA2 " << key << ": Number - " << value.dump() << "\n";
  } else if (value.is_boolean()) {
    out << pad << "\xE2\x9C\x85 " << key << ": Boolean - " << (value.get<bool>() ? "true" : "false") << "\n";
  } else {
    out << pad << "\xE2\x9D\x8C " << key << ": null\n";
  }
}

void collect_stats(const json& value, std::size_t depth, JsonStats& stats) {
  stats.max_depth = std::max(stats.max_depth, depth);

  if (value.is_object()) {
    stats.objects++;
    stats.total_keys += value.size();
    for (const auto& item : value.items()) {
      collect_stats(item.value(), depth + 1, stats);
    }
  } else if (value.is_array()) {
    stats.arrays++;
    for (const auto& item : value) {
      collect_stats(item, depth + 1, stats);
    }
  } else {
    stats.primitives++;
  }
}


//==============================================
// BASE64 SUPPORT
//==============================================

bool is_base64_char(unsigned char c) {
  return std::isalnum(c) || c == '+' || c == '/';
}

// Strict standard alphabet, padded to a multiple of four, '=' only at the end
void validate_base64(const std::string& text) {
  if (text.size() % 4 != 0) {
    throw DecodeError("Invalid base64 encoding: length " + std::to_string(text.size()) +
                      " is not a multiple of 4");
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '=') {
      padding++;
      continue;
    }
    if (padding > 0 || !is_base64_char(c)) {
      throw DecodeError("Invalid base64 encoding: invalid byte at offset " + std::to_string(i));
    }
  }
  if (padding > 2) {
    throw DecodeError("Invalid base64 encoding: invalid padding");
  }
}

std::string decode_base64_bytes(const std::string& text) {
  validate_base64(text);
  if (text.empty()) {
    return std::string();
  }

  std::vector<unsigned char> output(text.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(output.data(),
                                      reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (decoded < 0) {
    throw DecodeError("Invalid base64 encoding");
  }

  // EVP_DecodeBlock counts padding as zero bytes
  const std::size_t padding = static_cast<std::size_t>(std::count(text.end() - 2, text.end(), '='));
  return std::string(reinterpret_cast<const char*>(output.data()), static_cast<std::size_t>(decoded) - padding);
}

json decode_jwt_part(const std::string& encoded) {
  std::string standard = encoded;
  std::replace(standard.begin(), standard.end(), '-', '+');
  std::replace(standard.begin(), standard.end(), '_', '/');
  while (standard.size() % 4 != 0) {
    standard.push_back('=');
  }

  const std::string decoded = decode_base64_bytes(standard);
  if (!is_valid_utf8(decoded)) {
    throw DecodeError("Invalid UTF-8 in JWT part");
  }

  try {
    return json::parse(decoded);
  } catch (const json::parse_error& e) {
    throw DecodeError(std::string("Invalid JSON in JWT part: ") + e.what());
  }
}

} // namespace


//==============================================
// REGISTRATION
//==============================================

void register_builtin_transforms(TransformCatalog& catalog) {
  catalog.add(JSON_TRANSFORM, format_json);
  catalog.add(XML_TRANSFORM, format_xml);
  catalog.add(JWT_TRANSFORM, decode_jwt);
  catalog.add(JSON_SUMMARY_TRANSFORM, summarize_json);
  catalog.add(ENCODE_TRANSFORM, encode_base64);
  catalog.add(DECODE_TRANSFORM, decode_base64);
  BOOST_LOG_TRIVIAL(info) << "Transform catalog: Registered built-in transforms";
}


//==============================================
// JSON
//==============================================

std::string format_json(const std::string& text) {
  return dump_pretty(parse_json(text));
}

std::string summarize_json(const std::string& text) {
  const std::string trimmed = trim(text);
  if (trimmed.empty()) {
    throw ParseError("Empty JSON input");
  }

  const json value = parse_json(trimmed);

  std::ostringstream out;
  out << "JSON Structure Summary:\n";
  out << "======================\n\n";
  summarize_value(value, "root", 0, out);

  JsonStats stats;
  collect_stats(value, 0, stats);
  out << "\n\nStatistics:\n";
  out << "-----------\n";
  out << "Total objects: " << stats.objects << "\n";
  out << "Total arrays: " << stats.arrays << "\n";
  out << "Total primitive values: " << stats.primitives << "\n";
  out << "Maximum depth: " << stats.max_depth << "\n";
  out << "Total keys: " << stats.total_keys << "\n";
  return out.str();
}


//==============================================
// XML
//==============================================

std::string format_xml(const std::string& text) {
  const std::string xml = trim(text);
  if (xml.empty()) {
    throw FormatError("Empty XML input");
  }
  if (xml.front() != '<' || xml.back() != '>') {
    throw FormatError("Invalid XML: Must start with '<' and end with '>'");
  }

  std::string formatted;
  formatted.reserve(xml.size() + xml.size() / 4);
  int depth = 0;
  bool last_was_text = false;
  std::size_t i = 0;

  while (i < xml.size()) {
    const unsigned char c = static_cast<unsigned char>(xml[i]);

    if (c == '<') {
      const std::size_t tag_end = xml.find('>', i);
      if (tag_end == std::string::npos) {
        throw FormatError("Invalid XML: Unclosed tag found");
      }

      const std::string tag = xml.substr(i + 1, tag_end - i - 1);
      const bool is_closing = !tag.empty() && tag.front() == '/';
      // Declarations, processing instructions and comments never open an element
      const bool is_self_closing = !tag.empty() &&
        (tag.back() == '/' || tag.front() == '?' || tag.front() == '!');

      if (is_closing) {
        depth--;
        if (!last_was_text) {
          formatted.push_back('\n');
          formatted += indent(depth);
        }
      } else {
        if (!formatted.empty()) {
          formatted.push_back('\n');
        }
        formatted += indent(depth);
        if (!is_self_closing) {
          depth++;
        }
      }
      last_was_text = false;

      formatted.append(xml, i, tag_end - i + 1);
      i = tag_end + 1;
    } else if (!std::isspace(c)) {
      const std::size_t text_start = i;
      while (i < xml.size() && xml[i] != '<') {
        i++;
      }
      const std::string content = trim(xml.substr(text_start, i - text_start));
      if (!content.empty()) {
        formatted += content;
        last_was_text = true;
      }
    } else {
      i++;
    }
  }

  if (depth != 0) {
    throw FormatError("Invalid XML: Unbalanced tags detected");
  }
  return formatted;
}


//==============================================
// TOKENS
//==============================================

std::string decode_jwt(const std::string& token) {
  const std::string trimmed = trim(token);
  if (trimmed.empty()) {
    throw DecodeError("Empty JWT token");
  }

  std::vector<std::string> parts;
  std::stringstream ss(trimmed);
  std::string part;
  while (std::getline(ss, part, '.')) {
    parts.push_back(part);
  }
  if (trimmed.back() == '.') {
    parts.emplace_back();
  }
  if (parts.size() != 3) {
    throw DecodeError("Invalid JWT format. Expected 3 parts separated by dots.");
  }

  json result = json::object();
  try {
    result["header"] = decode_jwt_part(parts[0]);
  } catch (const DecodeError& e) {
    throw DecodeError(std::string("Failed to decode JWT header: ") + e.what());
  }
  try {
    result["payload"] = decode_jwt_part(parts[1]);
  } catch (const DecodeError& e) {
    throw DecodeError(std::string("Failed to decode JWT payload: ") + e.what());
  }

  // The signature cannot be verified without the secret
  result["signature"] = "Signature (base64): " + parts[2];
  result["token_parts"] = {
    {"header", parts[0]},
    {"payload", parts[1]},
    {"signature", parts[2]}
  };
  return dump_pretty(result);
}

std::string encode_base64(const std::string& text) {
  if (text.empty()) {
    return std::string();
  }

  std::vector<unsigned char> output(4 * ((text.size() + 2) / 3) + 1);
  const int written = EVP_EncodeBlock(output.data(),
                                      reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  return std::string(reinterpret_cast<const char*>(output.data()), static_cast<std::size_t>(written));
}

std::string decode_base64(const std::string& text) {
  const std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return std::string();
  }

  std::string decoded = decode_base64_bytes(trimmed);
  if (!is_valid_utf8(decoded)) {
    throw DecodeError("Invalid UTF-8 in decoded data");
  }
  return decoded;
}

} // namespace transform
} // namespace docpipe
