/**
 * @file filter_graph.hpp
 * @brief Typed filter graph (DAG of filter nodes with named pads)
 *
 * @details The builder assembles a FilterGraph node by node; the textual
 *          ffmpeg filtergraph syntax only exists after serialize(). Each node
 *          declares the pads it reads and the pads it produces:
 *
 *          - A pad must be produced by an earlier node (or be a declared
 *            graph input such as "0:v") before a node may read it
 *
 *          - Intermediate pads are read exactly once
 *
 *          - Declared graph inputs may be read any number of times
 *
 *          - Every produced pad is either read later or marked as an output
 */

#ifndef REEL_CUTTER_FILTER_GRAPH_HPP
#define REEL_CUTTER_FILTER_GRAPH_HPP

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace reel_cutter {

/// Ordered filter options; an empty key emits a positional value
using FilterArgs = std::vector<std::pair<std::string, std::string>>;

/**
 * @struct FilterNode
 * @brief One filter instance with its options and pads.
 */
struct FilterNode {
  std::string filter;               //< ffmpeg filter name
  FilterArgs args;                  //< Unescaped option values
  std::vector<std::string> inputs;  //< Pad labels read, in order
  std::vector<std::string> outputs; //< Pad labels produced, in order

  bool operator==(const FilterNode &other) const {
    return filter == other.filter && args == other.args &&
           inputs == other.inputs && outputs == other.outputs;
  }
};

/**
 * @class FilterGraph
 * @brief Append-only DAG that rejects forward references on insertion.
 */
class FilterGraph {
public:
  /// Declare an external pad (e.g. "0:v") that nodes may read repeatedly
  void declare_input(const std::string &label);

  /**
   * @brief Append a node.
   * @throws std::logic_error if an input is unknown or already consumed, or
   *         an output label is already taken
   */
  void add(FilterNode node);

  /// Mark a pad as a final graph output (mapped by the engine)
  void mark_output(const std::string &label);

  /**
   * @brief Check the whole graph.
   * @throws std::logic_error naming the first dangling pad or unknown output
   */
  void validate() const;

  /// Number of nodes using the given filter
  int count(const std::string &filter) const;

  const std::vector<FilterNode> &nodes() const { return nodes_; }
  const std::vector<std::string> &outputs() const { return outputs_; }

  /**
   * @brief Emit ffmpeg filtergraph text, one node per line.
   * @note Values are escaped at option level, then the node description at
   *       graph level.
   */
  std::string serialize() const;

  bool operator==(const FilterGraph &other) const {
    return nodes_ == other.nodes_ && outputs_ == other.outputs_ &&
           inputs_ == other.inputs_;
  }

private:
  std::set<std::string> inputs_;     //< Declared external pads
  std::set<std::string> produced_;   //< Every label produced so far
  std::set<std::string> available_;  //< Produced and not yet consumed
  std::vector<FilterNode> nodes_;
  std::vector<std::string> outputs_;
};

// **---- Escaping ----**

/// Escape an option value: backslash, single quote and colon
std::string escape_option_value(const std::string &value);

/// Escape a filter description: backslash, quote, brackets, comma, semicolon
std::string escape_graph_text(const std::string &text);

} // namespace reel_cutter

#endif // REEL_CUTTER_FILTER_GRAPH_HPP
