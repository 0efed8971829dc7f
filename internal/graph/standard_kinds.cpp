#include "standard_kinds.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace gencore::graph {

using gencore::observability::IntField;

namespace {

Taxonomy BuildStandardTaxonomy() {
  Taxonomy t;

  t.kinds = {
      // source
      {"ConceptDSL", "source"},
      {"SyncDSL", "source"},
      {"InterfaceManifest", "source"},
      {"DeployManifest", "source"},

      // model
      {"ConceptAST", "model"},
      {"ConceptManifest", "model"},
      {"SyncAST", "model"},
      {"CompiledSync", "model"},
      {"Projection", "model"},
      {"DeployPlan", "model"},

      // framework targets
      {"TypeScriptFiles", "artifact"},
      {"RustFiles", "artifact"},
      {"SwiftFiles", "artifact"},
      {"SolidityFiles", "artifact"},

      // interface targets
      {"RestRoutes", "artifact"},
      {"GraphqlSchema", "artifact"},
      {"GrpcServices", "artifact"},
      {"CliCommands", "artifact"},
      {"McpTools", "artifact"},
      {"OpenApiDoc", "artifact"},
      {"AsyncApiDoc", "artifact"},
      {"TsSdkPackage", "artifact"},
      {"PySdkPackage", "artifact"},

      // deploy targets
      {"TerraformModule", "artifact"},
      {"PulumiProgram", "artifact"},
      {"ArgoApp", "artifact"},
  };

  t.edges = {
      {"ConceptDSL", "ConceptAST", "parses_to", "SpecParser"},
      {"ConceptAST", "ConceptManifest", "normalizes_to", "SchemaGen"},
      {"SyncDSL", "SyncAST", "parses_to", "SyncParser"},
      {"SyncAST", "CompiledSync", "normalizes_to", "SyncCompiler"},

      {"ConceptManifest", "TypeScriptFiles", "renders_to", "TypeScriptGen"},
      {"ConceptManifest", "RustFiles", "renders_to", "RustGen"},
      {"ConceptManifest", "SwiftFiles", "renders_to", "SwiftGen"},
      {"ConceptManifest", "SolidityFiles", "renders_to", "SolidityGen"},

      {"ConceptManifest", "Projection", "normalizes_to", "Projection"},

      {"Projection", "RestRoutes", "renders_to", "RestTarget"},
      {"Projection", "GraphqlSchema", "renders_to", "GraphqlTarget"},
      {"Projection", "GrpcServices", "renders_to", "GrpcTarget"},
      {"Projection", "CliCommands", "renders_to", "CliTarget"},
      {"Projection", "McpTools", "renders_to", "McpTarget"},
      {"Projection", "OpenApiDoc", "renders_to", "OpenApiTarget"},
      {"Projection", "AsyncApiDoc", "renders_to", "AsyncApiTarget"},
      {"Projection", "TsSdkPackage", "renders_to", "TsSdkTarget"},
      {"Projection", "PySdkPackage", "renders_to", "PySdkTarget"},

      {"DeployManifest", "DeployPlan", "normalizes_to", "DeployPlan"},
      {"DeployPlan", "TerraformModule", "renders_to", "TfProvider"},
      {"DeployPlan", "PulumiProgram", "renders_to", "PulumiProvider"},
      {"DeployPlan", "ArgoApp", "renders_to", "ArgoProvider"},
  };

  return t;
}

} // namespace

const Taxonomy& StandardTaxonomy() {
  static const Taxonomy taxonomy = BuildStandardTaxonomy();
  return taxonomy;
}

BootstrapStats Bootstrap(KindGraph& graph, const Taxonomy& taxonomy) {
  BootstrapStats stats;

  for (const auto& kind : taxonomy.kinds) {
    auto result = graph.Define(kind.name, kind.category);
    switch (result.outcome) {
      case Outcome::Ok:
        ++stats.defined;
        break;
      case Outcome::Exists:
        ++stats.existing;
        break;
      default:
        throw util::InvalidArgument("taxonomy kind '" + kind.name + "': " + result.message);
    }
  }

  for (const auto& edge : taxonomy.edges) {
    auto result = graph.Connect(edge.from, edge.to, edge.relation, edge.transform);
    if (result.outcome != Outcome::Ok) {
      throw util::InvalidArgument("taxonomy edge " + edge.from + " -> " + edge.to + ": " + result.message);
    }
    ++stats.edges;
  }

  GENCORE_LOG_INFO("taxonomy bootstrapped",
                   {IntField("defined", static_cast<int64_t>(stats.defined)), IntField("existing", static_cast<int64_t>(stats.existing)),
                    IntField("edges", static_cast<int64_t>(stats.edges))});
  return stats;
}

} // namespace gencore::graph
