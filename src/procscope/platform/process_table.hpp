#pragma once

#include "process_record.hpp"

#include <expected>
#include <string>
#include <vector>

struct QueryError {
    std::string message;
};

class ProcessTable {
public:
    virtual ~ProcessTable() = default;
    virtual std::expected<std::vector<ProcessRecord>, QueryError> snapshot() const = 0;
};
