#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>

#include "config/config.pb.h"
#include "internal/cache/handle.hpp"

namespace chadoxml::cache {
class ObjectCache;
}

namespace chadoxml::xml {

struct WriterOptions {
  bool indent             = true;
  bool require_registered = true;
  bool release_after_emit = false;

  static WriterOptions FromConfig(const chadoxml::runtime::config::SerializerConfig& cfg);
};

struct WriteStats {
  std::uint64_t bodies     = 0; // <type id=...> elements
  std::uint64_t references = 0; // <type ref=.../> elements
  std::uint64_t back_edges = 0; // references to an element still open
};

/*
  Serializes the graph reachable from a root handle as ChadoXML.

  The first occurrence of an entity is written in full as
  <type id="TypeName_n">; later occurrences become <type ref="TypeName_n"/>.
  Macro ids come from one document-wide counter, so they do not depend on
  entity identifiers. Output order follows schema order and is therefore
  deterministic. A handle reached only through a back-edge is never
  materialized.
*/
class ChadoXmlWriter {
 public:
  ChadoXmlWriter(cache::ObjectCache& cache, WriterOptions options);

  WriteStats Write(cache::Handle* root, std::ostream& out);

  // Writes to a temporary sibling and renames on success; a failed write
  // leaves no file at path.
  WriteStats WriteToFile(cache::Handle* root, const std::filesystem::path& path);

 private:
  cache::ObjectCache& cache_;
  WriterOptions       options_;
};

} // namespace chadoxml::xml
