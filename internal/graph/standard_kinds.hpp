#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "kind_graph.hpp"

namespace gencore::graph {

struct KindSpec {
  std::string name;
  std::string category;
};

struct EdgeSpec {
  std::string                from;
  std::string                to;
  std::string                relation;
  std::optional<std::string> transform;
};

struct Taxonomy {
  std::vector<KindSpec> kinds;
  std::vector<EdgeSpec> edges;
};

struct BootstrapStats {
  std::size_t defined  = 0;
  std::size_t existing = 0;
  std::size_t edges    = 0;
};

// Source, model and artifact kinds of the stock generation pipeline.
const Taxonomy& StandardTaxonomy();

/*
  Defines every kind, then connects every edge, in declaration order.
  Re-running against a populated graph is a no-op. An edge rejected by
  the graph (undefined kind, cycle) throws util::InvalidArgument.
*/
BootstrapStats Bootstrap(KindGraph& graph, const Taxonomy& taxonomy);

} // namespace gencore::graph
