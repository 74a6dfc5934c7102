#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "syllog/logic/saturation.hpp"
#include "syllog/visualization/graphviz.hpp"
#include "syllog/visualization/relation_exporter.hpp"
#include <string>
#include <vector>

using namespace syllog;
using namespace syllog::visualization;

TEST_CASE("Visualization - graph export") {
    Graph graph;
    graph.name = "Test";

    GraphNode a;
    a.id = "a";
    a.label = "first";
    GraphNode b;
    b.id = "b";
    b.label = "say \"hi\"";
    b.style = "filled";
    b.fillcolor = "red";
    graph.nodes = {a, b};

    GraphEdge edge;
    edge.from = "a";
    edge.to = "b";
    edge.style = "dashed";
    graph.edges.push_back(edge);

    std::string dot = GraphvizExporter::toDot(graph);

    CHECK(dot.find("digraph Test {") == 0);
    CHECK(dot.find("rankdir=LR;") != std::string::npos);
    CHECK(dot.find("a [label=\"first\",shape=box];") != std::string::npos);
    CHECK(dot.find("b [label=\"say \\\"hi\\\"\",shape=box,style=filled,fillcolor=red];") != std::string::npos);
    CHECK(dot.find("a -> b [style=dashed];") != std::string::npos);
    CHECK(dot.back() == '\n');
}

TEST_CASE("Visualization - identifier escaping") {
    CHECK(GraphvizExporter::escapeId("r0") == "r0");
    CHECK(GraphvizExporter::escapeId("two words") == "\"two words\"");
    CHECK(GraphvizExporter::escapeId("0r") == "\"0r\"");
    CHECK(GraphvizExporter::escapeId("") == "\"\"");
}

TEST_CASE("Visualization - relation graph") {
    logic::Saturation engine({
        logic::Relation({"PIGS"}, {"WINGS"}),
        logic::Relation({"WINGS"}, {"FLY"}),
        logic::Relation({"HOOVES"}, {"PIGS", "FLY"}),
    });
    engine.saturate();

    std::string dot = RelationGraphExporter::toDot(engine.relations(), "Pigs");

    CHECK(dot.find("digraph Pigs") != std::string::npos);
    CHECK(dot.find("r0 [label=\"{PIGS} -> {FLY, WINGS}\"") != std::string::npos);
    CHECK(dot.find("r0 -> r1 [label=\"cascades\"];") != std::string::npos);
    CHECK(dot.find("r1 -> r0") == std::string::npos);

    SUBCASE("query hits are highlighted") {
        CHECK(dot.find("{PIGS} -> {FLY, WINGS}\",shape=box,style=filled,fillcolor=palegreen") != std::string::npos);
        CHECK(dot.find("{HOOVES} -> {FLY, PIGS, WINGS}\",shape=box,style=filled,fillcolor=lightyellow") !=
              std::string::npos);
        CHECK(dot.find("{WINGS} -> {FLY}\",shape=box];") != std::string::npos);
    }

    SUBCASE("premise subsets are dashed") {
        std::vector<logic::Relation> relations = {
            logic::Relation({"A"}, {"X"}),
            logic::Relation({"A", "B"}, {"Y"}),
        };
        std::string matches = RelationGraphExporter::toDot(relations);
        CHECK(matches.find("r0 -> r1 [label=\"matches\",style=dashed,color=gray];") != std::string::npos);
        CHECK(matches.find("r1 -> r0") == std::string::npos);
    }
}
