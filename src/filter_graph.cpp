/**
 * @file filter_graph.cpp
 * @brief Filter graph bookkeeping and serialization
 */

#include "reel_cutter/filter_graph.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

namespace reel_cutter {

// **---- Escaping ----**

namespace {

std::string escape_chars(const std::string &text, const char *special) {
  std::string out;
  out.reserve(text.size() + 8);
  for (char c : text) {
    for (const char *p = special; *p; ++p) {
      if (c == *p) {
        out += '\\';
        break;
      }
    }
    out += c;
  }
  return out;
}

} // anonymous namespace

std::string escape_option_value(const std::string &value) {
  return escape_chars(value, "\\':");
}

std::string escape_graph_text(const std::string &text) {
  return escape_chars(text, "\\'[],;");
}

// **---- FilterGraph ----**

void FilterGraph::declare_input(const std::string &label) {
  inputs_.insert(label);
}

void FilterGraph::add(FilterNode node) {
  for (const auto &in : node.inputs) {
    if (inputs_.count(in))
      continue;
    if (!produced_.count(in)) {
      throw std::logic_error(fmt::format(
          "filter '{}' reads pad [{}] before it is produced", node.filter, in));
    }
    if (!available_.count(in)) {
      throw std::logic_error(fmt::format(
          "filter '{}' reads pad [{}] which is already consumed", node.filter,
          in));
    }
  }

  for (const auto &out : node.outputs) {
    if (produced_.count(out) || inputs_.count(out)) {
      throw std::logic_error(
          fmt::format("pad [{}] produced twice (by '{}')", out, node.filter));
    }
  }

  for (const auto &in : node.inputs)
    available_.erase(in);
  for (const auto &out : node.outputs) {
    produced_.insert(out);
    available_.insert(out);
  }
  nodes_.push_back(std::move(node));
}

void FilterGraph::mark_output(const std::string &label) {
  outputs_.push_back(label);
}

void FilterGraph::validate() const {
  for (const auto &out : outputs_) {
    if (!available_.count(out)) {
      throw std::logic_error(
          fmt::format("graph output [{}] is not an unconsumed pad", out));
    }
  }
  for (const auto &label : available_) {
    if (std::find(outputs_.begin(), outputs_.end(), label) == outputs_.end()) {
      throw std::logic_error(fmt::format("pad [{}] is never consumed", label));
    }
  }
}

int FilterGraph::count(const std::string &filter) const {
  return static_cast<int>(
      std::count_if(nodes_.begin(), nodes_.end(),
                    [&](const FilterNode &n) { return n.filter == filter; }));
}

std::string FilterGraph::serialize() const {
  std::string out;
  out.reserve(nodes_.size() * 64);

  for (size_t i = 0; i < nodes_.size(); ++i) {
    const auto &node = nodes_[i];
    if (i > 0)
      out += ";\n";

    for (const auto &in : node.inputs)
      out += fmt::format("[{}]", in);

    std::string desc = node.filter;
    for (size_t a = 0; a < node.args.size(); ++a) {
      desc += (a == 0) ? '=' : ':';
      const auto &kv = node.args[a];
      if (!kv.first.empty()) {
        desc += kv.first;
        desc += '=';
      }
      desc += escape_option_value(kv.second);
    }
    out += escape_graph_text(desc);

    for (const auto &o : node.outputs)
      out += fmt::format("[{}]", o);
  }
  return out;
}

} // namespace reel_cutter
