#include "process_tree.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace {

using ChildMap = std::unordered_map<int, std::vector<const ProcessRecord*>>;

void descend(const ProcessRecord* node, int depth, const ChildMap& children,
             std::unordered_set<int>& visited, std::vector<TreeLine>& out) {
    if (!visited.insert(node->pid).second) return;
    out.push_back({depth, node});

    auto it = children.find(node->pid);
    if (it == children.end()) return;
    for (const auto* child : it->second) {
        descend(child, depth + 1, children, visited, out);
    }
}

} // namespace

std::vector<TreeLine> build_process_tree(const std::vector<ProcessRecord>& processes) {
    std::unordered_set<int> present;
    for (const auto& p : processes) present.insert(p.pid);

    std::vector<const ProcessRecord*> roots;
    ChildMap children;
    for (const auto& p : processes) {
        if (p.ppid != p.pid && present.contains(p.ppid)) {
            children[p.ppid].push_back(&p);
        } else {
            roots.push_back(&p);
        }
    }

    auto by_pid = [](const ProcessRecord* a, const ProcessRecord* b) { return a->pid < b->pid; };
    std::ranges::sort(roots, by_pid);
    for (auto& [_, list] : children) std::ranges::sort(list, by_pid);

    std::vector<TreeLine> lines;
    std::unordered_set<int> visited;
    for (const auto* root : roots) {
        descend(root, 0, children, visited, lines);
    }

    // Parent cycles have no root; list what is left at the top level.
    std::vector<const ProcessRecord*> rest;
    for (const auto& p : processes) {
        if (!visited.contains(p.pid)) rest.push_back(&p);
    }
    std::ranges::sort(rest, by_pid);
    for (const auto* p : rest) {
        descend(p, 0, children, visited, lines);
    }

    return lines;
}
