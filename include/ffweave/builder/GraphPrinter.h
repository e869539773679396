// include/ffweave/builder/GraphPrinter.h
#pragma once

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>

#include "ffweave/builder/Graph.h"
#include "ffweave/builder/Node.h"

namespace ffweave {

/// Display options for GraphPrinter (also available as GraphPrinter::Options).
struct GraphPrinterOptions {
  bool show_index = true;
  bool show_kind = true;
  bool show_user_label = true;
  bool show_edge_labels = true;

  std::size_t max_user_label_chars = 120;

  bool dot_rankdir_lr = true;
  std::string dot_graph_name = "ffweave";

  bool mermaid_lr = true;
  std::string mermaid_id_prefix = "n";
};

/**
 * @brief Human-readable views of a frozen Graph.
 *
 * Meant for debugging a filter graph before it becomes -filter_complex text:
 * - Text list in topological order, one line per node plus its edges
 * - DOT (Graphviz)
 * - Mermaid flowchart
 *
 * Edge labels are the stream labels FilterComplex assigned ("0:v", "vout1").
 */
class GraphPrinter final {
public:
  using Options = GraphPrinterOptions;

  /// One line per node in topological order, followed by its outgoing edges.
  static std::string to_text(const Graph& g, const Options& opt = {}) {
    std::ostringstream oss;
    bool first = true;
    for (Graph::NodeId id : g.topo_order()) {
      if (!first) oss << "\n";
      first = false;
      oss << node_label_(g.node(id), id, opt, " ");
      for (const auto& e : g.edges()) {
        if (e.from != id) continue;
        oss << "\n    -> " << e.to;
        if (opt.show_edge_labels && !e.label.empty()) oss << " [" << e.label << "]";
      }
    }
    return oss.str();
  }

  static std::string to_dot(const Graph& g, const Options& opt = {}) {
    std::ostringstream oss;
    oss << "digraph " << dot_id_(opt.dot_graph_name) << " {\n";
    if (opt.dot_rankdir_lr) oss << "  rankdir=LR;\n";
    oss << "  node [shape=box];\n";

    for (Graph::NodeId id = 0; id < g.node_count(); ++id) {
      oss << "  n" << id << " [label=\"" << escape_(node_label_(g.node(id), id, opt, "\n"), true)
          << "\"];\n";
    }
    for (const auto& e : g.edges()) {
      oss << "  n" << e.from << " -> n" << e.to;
      if (opt.show_edge_labels && !e.label.empty()) {
        oss << " [label=\"" << escape_(e.label, true) << "\"]";
      }
      oss << ";\n";
    }
    oss << "}\n";
    return oss.str();
  }

  static std::string to_mermaid(const Graph& g, const Options& opt = {}) {
    std::ostringstream oss;
    oss << "flowchart " << (opt.mermaid_lr ? "LR" : "TD") << "\n";

    for (Graph::NodeId id = 0; id < g.node_count(); ++id) {
      oss << "  " << opt.mermaid_id_prefix << id << "[\""
          << escape_(node_label_(g.node(id), id, opt, "<br/>"), false) << "\"]\n";
    }
    for (const auto& e : g.edges()) {
      oss << "  " << opt.mermaid_id_prefix << e.from << " -->";
      if (opt.show_edge_labels && !e.label.empty()) oss << "|" << escape_(e.label, false) << "|";
      oss << " " << opt.mermaid_id_prefix << e.to << "\n";
    }
    return oss.str();
  }

private:
  static std::string node_label_(const std::shared_ptr<Node>& n,
                                 Graph::NodeId id,
                                 const Options& opt,
                                 const char* sep) {
    std::string out;
    if (opt.show_index) out += std::to_string(id);
    if (opt.show_kind) {
      if (!out.empty()) out += ": ";
      out += n->kind();
    }
    if (opt.show_user_label) {
      const std::string ul = n->user_label();
      if (!ul.empty()) {
        if (!out.empty()) out += sep;
        out += truncate_(ul, opt.max_user_label_chars);
      }
    }
    return out;
  }

  static std::string truncate_(const std::string& s, std::size_t max_chars) {
    if (s.size() <= max_chars) return s;
    if (max_chars < 3) return s.substr(0, max_chars);
    return s.substr(0, max_chars - 3) + "...";
  }

  // Quotes and backslashes; DOT also needs newlines as \n.
  static std::string escape_(const std::string& s, bool dot) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
      switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += dot ? "\\\"" : "#quot;"; break;
        case '\n': out += dot ? "\\n" : " "; break;
        case '\r': break;
        default: out += c; break;
      }
    }
    return out;
  }

  static std::string dot_id_(const std::string& s) {
    if (s.empty()) return "ffweave";
    for (char c : s) {
      const bool ok = (c == '_' || (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') ||
                       (c >= 'a' && c <= 'z'));
      if (!ok) return "\"" + escape_(s, true) + "\"";
    }
    return s;
  }
};

} // namespace ffweave
