#include <cassert>
#include <deque>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/graph/kind_graph.hpp"

namespace {

using gencore::core::Outcome;
using gencore::graph::KindGraph;

std::shared_ptr<KindGraph> NewGraph() {
  return std::make_shared<KindGraph>(std::make_shared<gencore::db::memory::MemoryRepository>());
}

// Independent BFS distance over the dumped graph.
int Distance(KindGraph& graph, const std::string& from, const std::string& to) {
  auto                       dump = graph.Graph();
  std::map<std::string, int> dist{{from, 0}};
  std::deque<std::string>    queue{from};
  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop_front();
    if (current == to) return dist[current];
    for (const auto& edge : dump.edges) {
      if (edge.from_kind == current && !dist.contains(edge.to_kind)) {
        dist[edge.to_kind] = dist[current] + 1;
        queue.push_back(edge.to_kind);
      }
    }
  }
  return -1;
}

bool HasCycle(KindGraph& graph) {
  auto dump = graph.Graph();
  for (const auto& kind : dump.kinds) {
    std::unordered_set<std::string> seen;
    std::deque<std::string>         queue;
    for (const auto& edge : dump.edges) {
      if (edge.from_kind == kind.name) queue.push_back(edge.to_kind);
    }
    while (!queue.empty()) {
      auto current = queue.front();
      queue.pop_front();
      if (current == kind.name) return true;
      if (!seen.insert(current).second) continue;
      for (const auto& edge : dump.edges) {
        if (edge.from_kind == current) queue.push_back(edge.to_kind);
      }
    }
  }
  return false;
}

void TestDefineTwiceReportsExists() {
  auto graph = NewGraph();

  auto first = graph->Define("K", "model");
  assert(first.outcome == Outcome::Ok);
  assert(first.kind == "K");

  auto second = graph->Define("K", "artifact");
  assert(second.outcome == Outcome::Exists);

  auto dump = graph->Graph();
  assert(dump.kinds.size() == 1);
  assert(dump.kinds[0].category == "model");
  assert(graph->Kind("K")->category == "model");
  assert(!graph->Kind("missing").has_value());
}

void TestDefineEmptyNameIsInvalid() {
  auto graph = NewGraph();
  assert(graph->Define("", "model").outcome == Outcome::Invalid);
  assert(graph->Graph().kinds.empty());
}

void TestSelfLoopRejected() {
  auto graph = NewGraph();
  graph->Define("A", "model");

  auto result = graph->Connect("A", "A", "x");
  assert(result.outcome == Outcome::Invalid);
  assert(graph->Graph().edges.empty());
}

void TestUndefinedKindRejected() {
  auto graph = NewGraph();
  graph->Define("A", "model");

  auto missing_to = graph->Connect("A", "Ghost", "x");
  assert(missing_to.outcome == Outcome::Invalid);
  assert(missing_to.message.find("Ghost") != std::string::npos);

  auto missing_from = graph->Connect("Ghost", "A", "x");
  assert(missing_from.outcome == Outcome::Invalid);
  assert(missing_from.message.find("Ghost") != std::string::npos);
  assert(graph->Graph().edges.empty());
}

void TestCycleRejected() {
  auto graph = NewGraph();
  graph->Define("A", "model");
  graph->Define("B", "model");
  graph->Define("C", "model");
  assert(graph->Connect("A", "B", "x").outcome == Outcome::Ok);
  assert(graph->Connect("B", "C", "x").outcome == Outcome::Ok);

  auto result = graph->Connect("C", "A", "x");
  assert(result.outcome == Outcome::Invalid);
  assert(result.message.find("cycle") != std::string::npos);
  assert(graph->Graph().edges.size() == 2);
  assert(!HasCycle(*graph));
}

void TestConnectSequencesStayAcyclic() {
  auto                           graph = NewGraph();
  const std::vector<std::string> kinds = {"K0", "K1", "K2", "K3", "K4", "K5"};
  for (const auto& kind : kinds) graph->Define(kind, "model");

  // deterministic pseudo-random pairs, including back edges and self-loops
  unsigned seed = 7;
  for (int i = 0; i < 80; ++i) {
    seed         = seed * 1103515245u + 12345u;
    const auto a = kinds[(seed >> 8) % kinds.size()];
    seed         = seed * 1103515245u + 12345u;
    const auto b = kinds[(seed >> 8) % kinds.size()];
    graph->Connect(a, b, "rel");
  }

  assert(!HasCycle(*graph));
  for (const auto& edge : graph->Graph().edges) {
    assert(edge.from_kind != edge.to_kind);
  }
}

void TestReconnectReplacesTransform() {
  auto graph = NewGraph();
  graph->Define("A", "model");
  graph->Define("B", "model");
  assert(graph->Connect("A", "B", "renders_to", std::string("Old")).outcome == Outcome::Ok);
  assert(graph->Connect("A", "B", "renders_to", std::string("New")).outcome == Outcome::Ok);

  auto dump = graph->Graph();
  assert(dump.edges.size() == 1);
  assert(dump.edges[0].transform == std::optional<std::string>("New"));
}

void TestRouteEndToEnd() {
  auto graph = NewGraph();
  graph->Define("A", "model");
  graph->Define("B", "model");
  graph->Define("C", "artifact");
  graph->Connect("A", "B", "normalizes_to", std::string("Schema"));
  graph->Connect("B", "C", "renders_to", std::string("Emit"));

  auto route = graph->Route("A", "C");
  assert(route.outcome == Outcome::Ok);
  assert(route.path.size() == 2);
  assert(route.path[0].kind == "B");
  assert(route.path[0].relation == "normalizes_to");
  assert(route.path[0].transform == std::optional<std::string>("Schema"));
  assert(route.path[1].kind == "C");
  assert(route.path[1].transform == std::optional<std::string>("Emit"));

  auto self = graph->Route("A", "A");
  assert(self.outcome == Outcome::Ok);
  assert(self.path.empty());

  auto back = graph->Route("C", "A");
  assert(back.outcome == Outcome::Unreachable);
  assert(!back.message.empty());
}

void TestRouteIsShortestAndDeterministic() {
  auto graph = NewGraph();
  for (const auto* kind : {"S", "L1", "L2", "M1", "M2", "T"}) graph->Define(kind, "model");

  // long way first, then two equally short ways
  graph->Connect("S", "L1", "x");
  graph->Connect("L1", "L2", "x");
  graph->Connect("L2", "T", "x");
  graph->Connect("S", "M1", "x");
  graph->Connect("S", "M2", "x");
  graph->Connect("M2", "T", "x");
  graph->Connect("M1", "T", "x");

  auto route = graph->Route("S", "T");
  assert(route.outcome == Outcome::Ok);
  assert(static_cast<int>(route.path.size()) == Distance(*graph, "S", "T"));
  assert(route.path.size() == 2);
  // M1 is expanded first because S -> M1 was inserted first
  assert(route.path[0].kind == "M1");

  for (int i = 0; i < 5; ++i) {
    auto again = graph->Route("S", "T");
    assert(again.path.size() == route.path.size());
    assert(again.path[0].kind == route.path[0].kind);
  }
}

void TestValidateDirectAdjacencyOnly() {
  auto graph = NewGraph();
  graph->Define("A", "model");
  graph->Define("B", "model");
  graph->Define("C", "model");
  graph->Connect("A", "B", "x");
  graph->Connect("B", "C", "x");

  assert(graph->Validate("A", "B").outcome == Outcome::Ok);

  auto transitive = graph->Validate("A", "C");
  assert(transitive.outcome == Outcome::Invalid);
  assert(transitive.message.find("not defined") == std::string::npos);

  auto undefined = graph->Validate("A", "Ghost");
  assert(undefined.outcome == Outcome::Invalid);
  assert(undefined.message.find("not defined") != std::string::npos);
}

void TestDependentsProducersConsumers() {
  auto graph = NewGraph();
  for (const auto* kind : {"Src", "Ast", "Manifest", "Ts", "Rust"}) graph->Define(kind, "model");
  graph->Connect("Src", "Ast", "parses_to", std::string("Parser"));
  graph->Connect("Ast", "Manifest", "normalizes_to", std::string("SchemaGen"));
  graph->Connect("Manifest", "Ts", "renders_to", std::string("TsGen"));
  graph->Connect("Manifest", "Rust", "renders_to");

  auto deps = graph->Dependents("Src");
  assert(deps.outcome == Outcome::Ok);
  assert((deps.downstream == std::vector<std::string>{"Ast", "Manifest", "Ts", "Rust"}));

  assert(graph->Dependents("Rust").downstream.empty());
  assert(graph->Dependents("Unknown").downstream.empty());

  auto consumers = graph->Consumers("Manifest");
  assert(consumers.size() == 2);
  assert(consumers[0].kind == "Ts");
  assert(consumers[0].transform == std::optional<std::string>("TsGen"));
  assert(consumers[1].kind == "Rust");
  assert(!consumers[1].transform.has_value());

  auto producers = graph->Producers("Manifest");
  assert(producers.size() == 1);
  assert(producers[0].kind == "Ast");
  assert(producers[0].transform == std::optional<std::string>("SchemaGen"));
  assert(graph->Producers("Src").empty());
}

} // namespace

int main() {
  TestDefineTwiceReportsExists();
  TestDefineEmptyNameIsInvalid();
  TestSelfLoopRejected();
  TestUndefinedKindRejected();
  TestCycleRejected();
  TestConnectSequencesStayAcyclic();
  TestReconnectReplacesTransform();
  TestRouteEndToEnd();
  TestRouteIsShortestAndDeterministic();
  TestValidateDirectAdjacencyOnly();
  TestDependentsProducersConsumers();

  std::cout << "gencore_unit_kind_graph: pass\n";
  return 0;
}
