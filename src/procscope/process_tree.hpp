#pragma once

#include "process_record.hpp"

#include <vector>

struct TreeLine {
    int depth = 0;
    const ProcessRecord* process = nullptr;
};

// Arrange processes by parent pid, depth-first, children in pid order.
// A process whose parent is not in the list is a root. The returned lines
// point into `processes`.
std::vector<TreeLine> build_process_tree(const std::vector<ProcessRecord>& processes);
