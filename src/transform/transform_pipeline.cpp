#include "transform/transform_pipeline.hpp"
#include <boost/log/trivial.hpp>
#include <memory>
#include <utility>

namespace docpipe {
namespace transform {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransformPipeline::TransformPipeline(store::ContentStore& store, const TransformCatalog& catalog)
  : store_(store)
  , catalog_(catalog) {
  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: Initialized with " << catalog_.names().size() << " transforms";
}


//==============================================
// TRANSFORMATION
//==============================================

store::EntryInfo TransformPipeline::format(const std::string& source_id, const std::string& transform_name,
                                           std::size_t chunk_size,
                                           const std::optional<std::string>& target_id) {
  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: Applying '" << transform_name << "' to " << source_id;

  // Validate everything the caller controls before touching the source
  if (chunk_size == 0) {
    throw store::InvalidArgumentError("chunk size must be greater than zero");
  }
  const TransformFn& fn = catalog_.find(transform_name);
  if (target_id && target_id->empty()) {
    throw store::InvalidArgumentError("entry id must not be empty");
  }

  // Single full read; transforms need the whole document
  store::ContentEntryPtr source = store_.get_content(source_id);

  std::string result = apply(transform_name, fn, source->text());

  store::EntryInfo info;
  info.id = target_id ? *target_id : store_.next_id(store::ContentKind::DERIVED);
  info.kind = store::ContentKind::DERIVED;
  info.chunk_size = chunk_size;
  info.digest = store::ContentStore::digest(result);
  info.source_id = source_id;
  info.transform = transform_name;

  auto entry = store::ContentEntry::create(std::move(info), std::make_shared<const std::string>(std::move(result)));
  store::EntryInfo stored = store_.put_entry(std::move(entry));

  BOOST_LOG_TRIVIAL(info) << "Transform pipeline: Wrote derived entry " << stored.id
                          << " (" << stored.length << " characters) from " << source_id;
  return stored;
}

std::string TransformPipeline::transform_text(const std::string& transform_name, const std::string& text) const {
  BOOST_LOG_TRIVIAL(debug) << "Transform pipeline: Applying '" << transform_name << "' to "
                           << text.size() << " bytes of text";
  return apply(transform_name, catalog_.find(transform_name), text);
}

std::string TransformPipeline::apply(const std::string& name, const TransformFn& fn, const std::string& text) {
  try {
    return fn(text);
  } catch (const TransformError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Transform pipeline: '" << name << "' rejected its input: " << e.what();
    throw;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Transform pipeline: '" << name << "' failed: " << e.what();
    throw TransformError(name + ": " + e.what());
  }
}

} // namespace transform
} // namespace docpipe
