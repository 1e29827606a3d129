#include "gitsync/errors.hpp"
#include "gitsync/modules.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using gitsync::Module;
using gitsync::ModuleGraph;

static Module module(const std::string &path, std::vector<std::string> children) {
  Module m;
  m.path = path;
  m.working_tree_root = "/work/" + path;
  m.baseline_commit_id = std::string(40, 'a');
  m.children = std::move(children);
  return m;
}

static bool nested_in(const std::string &child, const std::string &parent) {
  return parent.empty() ? !child.empty() : child.starts_with(parent + "/");
}

int main() {
  try {
    const auto order =
        gitsync::children_first({"", "lib", "z", "lib/deps/x", "lib/deps", "app", "lib/other"});
    if (order.size() != 7 || order.back() != "") {
      std::cerr << "root must come last\n";
      return 1;
    }
    for (std::size_t i = 0; i < order.size(); ++i) {
      for (std::size_t j = i + 1; j < order.size(); ++j) {
        if (nested_in(order[j], order[i])) {
          std::cerr << order[j] << " comes after its ancestor " << order[i] << "\n";
          return 1;
        }
      }
    }
    if (order.front() != "lib/deps/x") {
      std::cerr << "deepest module should be first\n";
      return 1;
    }

    const ModuleGraph graph{{module("", {"lib", "app"}), module("lib", {"lib/deps"}),
                             module("lib/deps", {}), module("app", {})}};
    const auto &o = graph.order();
    const auto pos = [&](const std::string &p) {
      return std::ranges::find(o, p) - o.begin();
    };
    if (pos("lib/deps") > pos("lib") || pos("lib") > pos("") || pos("app") > pos("")) {
      std::cerr << "graph order is not children first\n";
      return 1;
    }
    if (graph.root().children.size() != 2 || graph.at("lib").children.at(0) != "lib/deps" ||
        graph.at("lib/deps").parent != "lib" || graph.at("app").parent != "") {
      std::cerr << "graph lost child links\n";
      return 1;
    }

    // Two modules on one path is a configuration error.
    bool threw = false;
    try {
      ModuleGraph dup{{module("", {"a"}), module("a", {}), module("a", {})}};
    } catch (const gitsync::SyncError &e) {
      threw = e.stage() == gitsync::Stage::Discovery;
    }
    if (!threw) {
      std::cerr << "duplicate module path accepted\n";
      return 1;
    }

    threw = false;
    try {
      ModuleGraph stray{{module("", {"a"}), module("a", {"b"}), module("b", {})}};
    } catch (const gitsync::SyncError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "child outside its parent accepted\n";
      return 1;
    }

    std::cout << "module order OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
