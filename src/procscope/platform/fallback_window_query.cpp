#include "platform/fallback_window_query.hpp"

FallbackWindowQuery::FallbackWindowQuery(std::vector<std::unique_ptr<WindowQuery>> backends)
    : backends_(std::move(backends)) {}

void FallbackWindowQuery::add(std::unique_ptr<WindowQuery> backend) {
    backends_.push_back(std::move(backend));
}

std::optional<std::vector<WindowInfo>> FallbackWindowQuery::list_windows() {
    answered_ = "none";
    for (auto& backend : backends_) {
        auto windows = backend->list_windows();
        if (windows) {
            answered_ = backend->name();
            return windows;
        }
    }
    return std::nullopt;
}
