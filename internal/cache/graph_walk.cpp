#include "graph_walk.hpp"

#include <queue>
#include <string_view>
#include <unordered_set>

#include "internal/cache/entity_codec.hpp"
#include "internal/cache/object_cache.hpp"

namespace chadoxml::cache {

namespace {

// Collects outgoing edges of one entity; scalars are ignored.
class EdgeCollector final : public EntityVisitor {
 public:
  explicit EdgeCollector(std::vector<Handle*>& out) : out_(out) {
  }

  void Scalar(std::string_view, std::string_view) override {
  }

  void Reference(std::string_view, Handle* target) override {
    out_.push_back(target);
  }

  void Child(Handle* target) override {
    out_.push_back(target);
  }

  void BeginGroup(std::string_view) override {
  }

  void EndGroup() override {
  }

 private:
  std::vector<Handle*>& out_;
};

} // namespace

std::vector<Handle*> CollectReachable(ObjectCache& cache, Handle* root) {
  std::vector<Handle*> order;
  if (root == nullptr) return order;

  std::queue<Handle*>         q;
  std::unordered_set<Handle*> visited;

  q.push(root);
  visited.insert(root);

  std::vector<Handle*> edges;
  EdgeCollector        collector(edges);

  while (!q.empty()) {
    Handle* node = q.front();
    q.pop();
    order.push_back(node);

    edges.clear();
    const auto& entity = cache.MaterializeAny(node);
    cache.Codecs().Get(node->Type()).Describe(entity, collector);

    for (Handle* next : edges) {
      if (visited.insert(next).second) {
        q.push(next);
      }
    }
  }

  return order;
}

} // namespace chadoxml::cache
