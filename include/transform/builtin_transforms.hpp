#ifndef DOCPIPE_TRANSFORM_BUILTIN_TRANSFORMS_HPP
#define DOCPIPE_TRANSFORM_BUILTIN_TRANSFORMS_HPP

#include <string>
#include "transform/transform_catalog.hpp"
#include "transform/transform_error.hpp"

namespace docpipe {
namespace transform {

// Catalog names of the built-in transforms
inline constexpr const char* JSON_TRANSFORM = "json";
inline constexpr const char* XML_TRANSFORM = "xml";
inline constexpr const char* JWT_TRANSFORM = "jwt";
inline constexpr const char* JSON_SUMMARY_TRANSFORM = "json-summary";
inline constexpr const char* ENCODE_TRANSFORM = "encode";
inline constexpr const char* DECODE_TRANSFORM = "decode";

// Registers every transform below under its catalog name
void register_builtin_transforms(TransformCatalog& catalog);

// ---- JSON ----
// Pretty-prints with two-space indentation. Throws ParseError with line, column and a marker.
std::string format_json(const std::string& text);
// Structure tree plus statistics. Throws ParseError.
std::string summarize_json(const std::string& text);

// ---- XML ----
// Depth-based reindentation, text kept inline with its tags. Throws FormatError.
std::string format_xml(const std::string& text);

// ---- TOKENS ----
// Decodes header and payload of a JSON Web Token. Throws DecodeError.
std::string decode_jwt(const std::string& token);
// Standard base64 with padding
std::string encode_base64(const std::string& text);
// Standard base64 of the trimmed input; output must be valid UTF-8. Throws DecodeError.
std::string decode_base64(const std::string& text);

} // namespace transform
} // namespace docpipe

#endif // DOCPIPE_TRANSFORM_BUILTIN_TRANSFORMS_HPP
