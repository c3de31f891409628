#include "chadoxml_writer.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

#include "internal/cache/entity_codec.hpp"
#include "internal/cache/object_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/xml/xml_text_writer.hpp"

namespace chadoxml::xml {

namespace {

using cache::Handle;

class Emitter final : public cache::EntityVisitor {
 public:
  Emitter(cache::ObjectCache& cache, XmlTextWriter& writer, const WriterOptions& options)
      : cache_(cache), writer_(writer), options_(options) {
  }

  void Emit(Handle* handle) {
    const std::string element(model::ElementName(handle->Type()));

    auto it = macros_.find(handle);
    if (it != macros_.end()) {
      writer_.StartElement(element);
      writer_.Attribute("ref", it->second);
      writer_.EndElement();
      ++stats_.references;
      if (open_.count(handle) > 0) ++stats_.back_edges;
      return;
    }

    if (options_.require_registered && !handle->IsRegistered()) {
      throw util::CacheConsistencyError("reachable entity was never registered: " + handle->Key());
    }

    std::string macro = std::string(model::ToString(handle->Type())) + "_" + std::to_string(++counter_);
    writer_.StartElement(element);
    writer_.Attribute("id", macro);
    macros_.emplace(handle, std::move(macro));
    open_.insert(handle);

    const auto& entity = cache_.MaterializeAny(handle);
    cache_.Codecs().Get(handle->Type()).Describe(entity, *this);

    writer_.EndElement();
    open_.erase(handle);
    ++stats_.bodies;

    if (options_.release_after_emit) {
      cache_.Compress(handle);
    }
  }

  void Scalar(std::string_view name, std::string_view value) override {
    writer_.Element(std::string(name), std::string(value));
  }

  void Reference(std::string_view name, Handle* target) override {
    writer_.StartElement(std::string(name));
    Emit(target);
    writer_.EndElement();
  }

  void Child(Handle* target) override {
    Emit(target);
  }

  void BeginGroup(std::string_view name) override {
    writer_.StartElement(std::string(name));
  }

  void EndGroup() override {
    writer_.EndElement();
  }

  const WriteStats& Stats() const {
    return stats_;
  }

 private:
  cache::ObjectCache&  cache_;
  XmlTextWriter&       writer_;
  const WriterOptions& options_;

  std::unordered_map<const Handle*, std::string> macros_;
  std::unordered_set<const Handle*>              open_;
  std::uint64_t                                  counter_ = 0;
  WriteStats                                     stats_;
};

} // namespace

WriterOptions WriterOptions::FromConfig(const chadoxml::runtime::config::SerializerConfig& cfg) {
  WriterOptions options;
  options.indent             = !cfg.has_indent() || cfg.indent();
  options.require_registered = !cfg.has_require_registered() || cfg.require_registered();
  options.release_after_emit = cfg.release_after_emit();
  return options;
}

ChadoXmlWriter::ChadoXmlWriter(cache::ObjectCache& cache, WriterOptions options)
    : cache_(cache), options_(options) {
}

WriteStats ChadoXmlWriter::Write(cache::Handle* root, std::ostream& out) {
  if (root == nullptr) {
    throw util::SerializationError("no root entity to write");
  }

  XmlTextWriter writer(out, options_.indent);
  Emitter       emitter(cache_, writer, options_);

  writer.StartDocument();
  writer.StartElement("chadoxml");
  emitter.Emit(root);
  writer.EndElement();
  writer.EndDocument();

  const auto& stats = emitter.Stats();
  observability::LogDebug("ChadoXML written",
                          {observability::UintField("bodies", stats.bodies),
                           observability::UintField("references", stats.references),
                           observability::UintField("back_edges", stats.back_edges)});
  return stats;
}

WriteStats ChadoXmlWriter::WriteToFile(cache::Handle* root, const std::filesystem::path& path) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";

  std::error_code ec;
  try {
    WriteStats stats;
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) {
        throw util::SerializationError("cannot open " + tmp.string() + " for writing");
      }
      stats = Write(root, out);
      out.close();
      if (out.fail()) {
        throw util::SerializationError("failed to close " + tmp.string());
      }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
      throw util::SerializationError("cannot rename " + tmp.string() + " to " + path.string() + ": " + ec.message());
    }
    return stats;
  } catch (const std::exception&) {
    std::filesystem::remove(tmp, ec);
    throw;
  }
}

} // namespace chadoxml::xml
