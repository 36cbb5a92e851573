#include "transform/transform_catalog.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace docpipe {
namespace transform {

void TransformCatalog::add(const std::string& name, TransformFn fn) {
  if (name.empty()) {
    throw store::InvalidArgumentError("transform name must not be empty");
  }
  if (!fn) {
    throw store::InvalidArgumentError("transform '" + name + "' has no function");
  }

  transforms_[name] = std::move(fn);
  BOOST_LOG_TRIVIAL(debug) << "Transform catalog: Registered transform: " << name;
}

const TransformFn& TransformCatalog::find(const std::string& name) const {
  if (name.empty()) {
    throw store::InvalidArgumentError("transform name must not be empty");
  }

  auto it = transforms_.find(name);
  if (it == transforms_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Transform catalog: Unknown transform: " << name;
    throw store::InvalidArgumentError("unknown transform: " + name);
  }
  return it->second;
}

bool TransformCatalog::contains(const std::string& name) const {
  return transforms_.count(name) > 0;
}

std::vector<std::string> TransformCatalog::names() const {
  std::vector<std::string> result;
  result.reserve(transforms_.size());
  for (const auto& [name, fn] : transforms_) {
    result.push_back(name);
  }
  return result;
}

} // namespace transform
} // namespace docpipe
