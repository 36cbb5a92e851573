#ifndef DOCPIPE_TRANSFORM_PIPELINE_HPP
#define DOCPIPE_TRANSFORM_PIPELINE_HPP

#include <optional>
#include <string>
#include "store/content_store.hpp"
#include "transform/transform_catalog.hpp"
#include "transform/transform_error.hpp"

namespace docpipe {
namespace transform {

class TransformPipeline {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransformPipeline(store::ContentStore& store, const TransformCatalog& catalog);


  // ---- TRANSFORMATION ----
  // Reads the whole source entry, applies the named transform and stores the result as a
  // derived entry under target_id (or a fresh id). Either the derived entry is written
  // whole or the store is left untouched.
  // Throws InvalidArgumentError, NotFoundError or the transform's TransformError.
  store::EntryInfo format(const std::string& source_id, const std::string& transform_name,
                          std::size_t chunk_size,
                          const std::optional<std::string>& target_id = std::nullopt);

  // Applies a transform to in-memory text without touching the store
  std::string transform_text(const std::string& transform_name, const std::string& text) const;


  // ---- GETTERS ----
  const TransformCatalog& catalog() const { return catalog_; }

private:
  // ---- PARAMETERS ----
  store::ContentStore& store_;
  const TransformCatalog& catalog_;


  // Runs fn, normalising foreign exceptions to TransformError
  static std::string apply(const std::string& name, const TransformFn& fn, const std::string& text);
};

} // namespace transform
} // namespace docpipe

#endif // DOCPIPE_TRANSFORM_PIPELINE_HPP
