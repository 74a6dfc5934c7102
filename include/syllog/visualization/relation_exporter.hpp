#pragma once
#include "../logic/query.hpp"
#include "../logic/relation.hpp"
#include "graphviz.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace syllog::visualization {

    class RelationGraphExporter {
      public:
        // One node per relation, labelled "{from} -> {to}".
        //   solid edge  a -> b : a cascades into b (b.from ⊆ a.to)
        //   dashed edge a -> b : a matches b       (a.from ⊆ b.from)
        // Relations satisfying the query for all objects are filled green,
        // for some objects yellow.
        static std::string toDot(const std::vector<logic::Relation> &relations,
                                 const std::string &graphName = "Relations", const logic::Query &query = {}) {
            Graph graph;
            graph.name = graphName;

            for (std::size_t i = 0; i < relations.size(); ++i) {
                GraphNode node;
                node.id = nodeId(i);
                node.label = logic::to_string(relations[i]);

                if (relations[i].satisfies(query, true)) {
                    node.style = "filled";
                    node.fillcolor = "palegreen";
                } else if (relations[i].satisfies(query, false)) {
                    node.style = "filled";
                    node.fillcolor = "lightyellow";
                }

                graph.nodes.push_back(node);
            }

            for (std::size_t a = 0; a < relations.size(); ++a) {
                for (std::size_t b = 0; b < relations.size(); ++b) {
                    if (a == b)
                        continue;

                    if (relations[a].cascades(relations[b])) {
                        GraphEdge edge;
                        edge.from = nodeId(a);
                        edge.to = nodeId(b);
                        edge.label = "cascades";
                        graph.edges.push_back(edge);
                    }
                    if (relations[a].matches(relations[b])) {
                        GraphEdge edge;
                        edge.from = nodeId(a);
                        edge.to = nodeId(b);
                        edge.label = "matches";
                        edge.style = "dashed";
                        edge.color = "gray";
                        graph.edges.push_back(edge);
                    }
                }
            }

            return GraphvizExporter::toDot(graph);
        }

      private:
        static std::string nodeId(std::size_t index) { return "r" + std::to_string(index); }
    };

} // namespace syllog::visualization
