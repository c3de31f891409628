#include "term_source_stage.hpp"

#include <string>
#include <unordered_set>

#include "internal/cache/graph_walk.hpp"
#include "internal/cache/object_cache.hpp"
#include "internal/model/entities.hpp"
#include "internal/observability/logging.hpp"

namespace chadoxml::pipeline {

using cache::Handle;
using model::EntityType;
using namespace chadoxml::observability;

bool TermSourceStage::Run(PipelineContext& ctx) {
  auto& cache = ctx.cache;

  const std::unordered_set<const Handle*> declared(ctx.document.term_sources.begin(),
                                                   ctx.document.term_sources.end());

  bool ok = true;
  for (Handle* handle : cache::CollectReachable(cache, ctx.document.experiment)) {
    switch (handle->Type()) {
      case EntityType::kDbXref: {
        const auto& xref = cache.Materialize<model::DBXref>(handle);
        if (xref.db == nullptr || declared.count(xref.db) == 0) {
          LogError("DBXref refers to an undeclared term source",
                   {StringField("term_source", xref.db ? xref.db->Id() : std::string()),
                    StringField("accession", xref.accession)});
          ok = false;
        }
        break;
      }

      case EntityType::kCvTerm: {
        auto& term = cache.Materialize<model::CVTerm>(handle);
        if (term.dbxref != nullptr) break;

        const std::string cv = term.cv ? cache.Materialize<model::CV>(term.cv).name : std::string();
        Handle*           db = cache.Find(EntityType::kDb, cv);
        if (db == nullptr || declared.count(db) == 0) {
          LogError("No term source for controlled vocabulary",
                   {StringField("cv", cv), StringField("term", term.name)});
          ok = false;
          break;
        }

        const std::string id   = cv + ":" + term.name;
        Handle*           xref = cache.Find(EntityType::kDbXref, id);
        if (xref == nullptr || !xref->IsRegistered()) {
          model::DBXref resolved;
          resolved.accession = term.name;
          resolved.db        = db;
          xref               = cache.Put(id, std::move(resolved));
        }
        term.dbxref = xref;
        LogDebug("Attached DBXref", {StringField("cv", cv), StringField("term", term.name)});
        break;
      }

      default:
        break;
    }
  }

  return ok;
}

} // namespace chadoxml::pipeline
