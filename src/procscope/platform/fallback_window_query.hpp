#pragma once

#include "platform/window_query.hpp"

#include <memory>
#include <string>
#include <vector>

// Tries each backend in order; the first that answers wins.
class FallbackWindowQuery : public WindowQuery {
public:
    FallbackWindowQuery() = default;
    explicit FallbackWindowQuery(std::vector<std::unique_ptr<WindowQuery>> backends);

    void add(std::unique_ptr<WindowQuery> backend);
    bool empty() const { return backends_.empty(); }

    // Name of the backend that answered the last list_windows(), or "none".
    std::string name() const override { return answered_; }
    std::optional<std::vector<WindowInfo>> list_windows() override;

private:
    std::vector<std::unique_ptr<WindowQuery>> backends_;
    std::string answered_ = "none";
};
