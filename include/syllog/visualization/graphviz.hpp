#pragma once
#include <cctype>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace syllog::visualization {

    struct GraphNode {
        std::string id;
        std::string label;
        std::string shape = "box";
        std::string style = "";
        std::string fillcolor = "";
    };

    struct GraphEdge {
        std::string from;
        std::string to;
        std::string label = "";
        std::string style = "";
        std::string color = "black";
    };

    struct Graph {
        std::string name;
        std::string rankdir = "LR"; // TB = top-to-bottom, LR = left-to-right
        std::vector<GraphNode> nodes;
        std::vector<GraphEdge> edges;
    };

    // Graphviz DOT exporter
    class GraphvizExporter {
      public:
        static std::string toDot(const Graph &graph) {
            std::ostringstream oss;

            oss << "digraph " << escapeId(graph.name) << " {\n";
            oss << "  rankdir=" << graph.rankdir << ";\n";

            for (const auto &node : graph.nodes) {
                exportNode(oss, node);
            }

            for (const auto &edge : graph.edges) {
                exportEdge(oss, edge);
            }

            oss << "}\n";
            return oss.str();
        }

        static std::string escapeId(const std::string &str) {
            bool needsQuotes = str.empty() || std::isdigit(static_cast<unsigned char>(str.front()));
            for (char c : str) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                    needsQuotes = true;
                    break;
                }
            }

            if (needsQuotes) {
                return "\"" + escapeString(str) + "\"";
            }
            return str;
        }

        static std::string escapeValue(const std::string &str) { return "\"" + escapeString(str) + "\""; }

      private:
        static void exportNode(std::ostringstream &oss, const GraphNode &node) {
            std::vector<std::string> attrs;
            attrs.push_back("label=" + escapeValue(node.label));
            attrs.push_back("shape=" + node.shape);

            if (!node.style.empty()) {
                attrs.push_back("style=" + node.style);
            }
            if (!node.fillcolor.empty()) {
                attrs.push_back("fillcolor=" + node.fillcolor);
            }

            oss << "  " << escapeId(node.id) << " [";
            writeAttributes(oss, attrs);
            oss << "];\n";
        }

        static void exportEdge(std::ostringstream &oss, const GraphEdge &edge) {
            oss << "  " << escapeId(edge.from) << " -> " << escapeId(edge.to);

            std::vector<std::string> attrs;
            if (!edge.label.empty()) {
                attrs.push_back("label=" + escapeValue(edge.label));
            }
            if (!edge.style.empty()) {
                attrs.push_back("style=" + edge.style);
            }
            if (edge.color != "black") {
                attrs.push_back("color=" + edge.color);
            }

            if (!attrs.empty()) {
                oss << " [";
                writeAttributes(oss, attrs);
                oss << "]";
            }

            oss << ";\n";
        }

        static void writeAttributes(std::ostringstream &oss, const std::vector<std::string> &attrs) {
            for (std::size_t i = 0; i < attrs.size(); ++i) {
                if (i > 0)
                    oss << ",";
                oss << attrs[i];
            }
        }

        static std::string escapeString(const std::string &str) {
            std::string result;
            result.reserve(str.size());
            for (char c : str) {
                if (c == '"' || c == '\\') {
                    result += '\\';
                }
                result += c;
            }
            return result;
        }
    };

} // namespace syllog::visualization
