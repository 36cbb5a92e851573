#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace docpipe {
namespace transform {

// Pure, deterministic text transformation. Signals rejection by throwing TransformError.
using TransformFn = std::function<std::string(const std::string&)>;

// Name -> transformation mapping supplied to the pipeline. Not thread-safe for
// registration; register everything before sharing the catalog.
class TransformCatalog {
public:
  // ---- REGISTRATION ----
  // Adds or replaces a transform. Throws InvalidArgumentError for an empty name or empty function.
  void add(const std::string& name, TransformFn fn);


  // ---- LOOKUP ----
  // Throws InvalidArgumentError for an empty or unknown name
  const TransformFn& find(const std::string& name) const;
  bool contains(const std::string& name) const;
  // Registered names in lexical order
  std::vector<std::string> names() const;

private:
  std::map<std::string, TransformFn> transforms_;
};

} // namespace transform
} // namespace docpipe
