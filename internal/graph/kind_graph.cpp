#include "kind_graph.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace gencore::graph {

using gencore::core::ThrowIfDbError;
using gencore::observability::StringField;

namespace {

using Adjacency = std::unordered_map<std::string, std::vector<const db::model::EdgeRecord*>>;

// Outgoing edges per kind, each list in insertion order.
Adjacency BuildAdjacency(const std::vector<db::model::EdgeRecord>& edges) {
  Adjacency adjacency;
  for (const auto& edge : edges) {
    adjacency[edge.from_kind].push_back(&edge);
  }
  return adjacency;
}

bool Reachable(const Adjacency& adjacency, const std::string& from, const std::string& target) {
  std::deque<std::string>         queue{from};
  std::unordered_set<std::string> visited{from};

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();
    if (current == target) {
      return true;
    }

    auto it = adjacency.find(current);
    if (it == adjacency.end()) continue;
    for (const auto* edge : it->second) {
      if (visited.insert(edge->to_kind).second) {
        queue.push_back(edge->to_kind);
      }
    }
  }
  return false;
}

} // namespace

KindGraph::KindGraph(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

DefineResult KindGraph::Define(const std::string& name, const std::string& category) {
  if (name.empty()) {
    return {Outcome::Invalid, name, "kind name must not be empty"};
  }

  auto tx = repository_->Begin();
  if (repository_->GetKind(*tx, name)) {
    return {Outcome::Exists, name, {}};
  }

  db::model::KindRecord record;
  record.name          = name;
  record.category      = category;
  record.created_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->InsertKind(*tx, record), "define kind " + name);
  tx->Commit();

  GENCORE_LOG_INFO("kind defined", {StringField("kind", name), StringField("category", category)});
  return {Outcome::Ok, name, {}};
}

ConnectResult KindGraph::Connect(const std::string& from, const std::string& to, const std::string& relation,
                                 const std::optional<std::string>& transform) {
  if (from == to) {
    return {Outcome::Invalid, "Self-loop on kind '" + from + "' is not allowed"};
  }

  // Existence checks, cycle check and insert share one transaction.
  auto tx = repository_->Begin();

  if (!repository_->GetKind(*tx, from)) {
    return {Outcome::Invalid, "Kind '" + from + "' not defined"};
  }
  if (!repository_->GetKind(*tx, to)) {
    return {Outcome::Invalid, "Kind '" + to + "' not defined"};
  }

  const auto edges     = repository_->ListEdges(*tx);
  const auto adjacency = BuildAdjacency(edges);
  if (Reachable(adjacency, to, from)) {
    GENCORE_LOG_WARN("edge rejected", {StringField("from", from), StringField("to", to), StringField("reason", "cycle")});
    return {Outcome::Invalid, "Edge '" + from + "' -> '" + to + "' would create a cycle"};
  }

  db::model::EdgeRecord record;
  record.from_kind     = from;
  record.to_kind       = to;
  record.relation      = relation;
  record.transform     = transform;
  record.created_at_ms = util::NowMillis();
  ThrowIfDbError(repository_->UpsertEdge(*tx, record), "connect " + from + " -> " + to);
  tx->Commit();

  return {Outcome::Ok, {}};
}

RouteResult KindGraph::Route(const std::string& from, const std::string& to) {
  auto       tx        = repository_->BeginRead();
  const auto edges     = repository_->ListEdges(*tx);
  const auto adjacency = BuildAdjacency(edges);

  // parent edge by which each kind was first reached
  std::unordered_map<std::string, const db::model::EdgeRecord*> parent;
  std::unordered_set<std::string>                               visited{from};
  std::deque<std::string>                                       queue{from};

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();

    if (current == to) {
      std::vector<Hop> path;
      for (auto node = to; node != from;) {
        const auto* edge = parent.at(node);
        path.push_back({edge->to_kind, edge->relation, edge->transform});
        node = edge->from_kind;
      }
      std::reverse(path.begin(), path.end());
      return {Outcome::Ok, std::move(path), {}};
    }

    auto it = adjacency.find(current);
    if (it == adjacency.end()) continue;
    for (const auto* edge : it->second) {
      if (visited.insert(edge->to_kind).second) {
        parent[edge->to_kind] = edge;
        queue.push_back(edge->to_kind);
      }
    }
  }

  return {Outcome::Unreachable, {}, "No path from '" + from + "' to '" + to + "'"};
}

ValidateResult KindGraph::Validate(const std::string& from, const std::string& to) {
  auto tx = repository_->BeginRead();

  if (!repository_->GetKind(*tx, from)) {
    return {Outcome::Invalid, "Kind '" + from + "' not defined"};
  }
  if (!repository_->GetKind(*tx, to)) {
    return {Outcome::Invalid, "Kind '" + to + "' not defined"};
  }

  const auto outgoing = repository_->ListEdgesFrom(*tx, from);
  const bool adjacent = std::any_of(outgoing.begin(), outgoing.end(), [&](const db::model::EdgeRecord& edge) { return edge.to_kind == to; });
  if (!adjacent) {
    return {Outcome::Invalid, "No direct transform from '" + from + "' to '" + to + "'"};
  }
  return {Outcome::Ok, {}};
}

DependentsResult KindGraph::Dependents(const std::string& kind) {
  auto       tx        = repository_->BeginRead();
  const auto edges     = repository_->ListEdges(*tx);
  const auto adjacency = BuildAdjacency(edges);

  DependentsResult                result;
  std::unordered_set<std::string> visited{kind};
  std::deque<std::string>         queue{kind};

  while (!queue.empty()) {
    auto current = std::move(queue.front());
    queue.pop_front();

    auto it = adjacency.find(current);
    if (it == adjacency.end()) continue;
    for (const auto* edge : it->second) {
      if (visited.insert(edge->to_kind).second) {
        result.downstream.push_back(edge->to_kind);
        queue.push_back(edge->to_kind);
      }
    }
  }
  return result;
}

std::vector<TransformRef> KindGraph::Producers(const std::string& kind) {
  auto                      tx = repository_->BeginRead();
  std::vector<TransformRef> out;
  for (auto& edge : repository_->ListEdgesTo(*tx, kind)) {
    out.push_back({std::move(edge.from_kind), std::move(edge.transform)});
  }
  return out;
}

std::vector<TransformRef> KindGraph::Consumers(const std::string& kind) {
  auto                      tx = repository_->BeginRead();
  std::vector<TransformRef> out;
  for (auto& edge : repository_->ListEdgesFrom(*tx, kind)) {
    out.push_back({std::move(edge.to_kind), std::move(edge.transform)});
  }
  return out;
}

GraphDump KindGraph::Graph() {
  auto tx = repository_->BeginRead();
  return {repository_->ListKinds(*tx), repository_->ListEdges(*tx)};
}

std::optional<db::model::KindRecord> KindGraph::Kind(const std::string& name) {
  auto tx = repository_->BeginRead();
  return repository_->GetKind(*tx, name);
}

} // namespace gencore::graph
