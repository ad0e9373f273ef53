#include <healthstream/core/metrics/collector.hpp>
#include <healthstream/core/metrics/statistics.hpp>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <utility>

namespace HealthStream {

Collector::Collector(std::chrono::seconds window, TimeSource now)
    : window_(window.count() > 0 ? window : WindowKey::DEFAULT_WINDOW),
      now_(now ? std::move(now) : TimeSource(&WindowKey::systemNow)) {}

bool Collector::isValidName(std::string_view name) {
    return std::any_of(name.begin(), name.end(),
                       [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
}

void Collector::incr(std::string_view component, std::string_view name) {
    append(component, name, 1.0);
}

void Collector::append(std::string_view component, std::string_view name, double value) {
    if (!isValidName(name)) {
        return;
    }

    // Key and strings are built outside the critical section
    std::string key = WindowKey::fromTime(now_(), window_);
    std::string comp = component.empty() ? std::string(GLOBAL_COMPONENT) : std::string(component);
    std::string metric(name);

    std::unique_lock<std::shared_mutex> lock(mtx_);
    table_[comp][key][metric].push_back(value);
}

CollectionSnapshot Collector::snapshot() const {
    std::string key = currentWindowKey();

    CollectionSnapshot snap;
    std::shared_lock<std::shared_mutex> lock(mtx_);
    for (const auto& [component, windows] : table_) {
        auto wit = windows.find(key);
        if (wit == windows.end()) continue;

        for (const auto& [metric, values] : wit->second) {
            if (values.empty()) continue;
            snap[component][metric] = Statistics::summarize(values);
        }
    }
    return snap;
}

CollectionTable Collector::moveWindows(MoveMode mode) {
    std::string key = currentWindowKey();

    CollectionTable moved;
    std::unique_lock<std::shared_mutex> lock(mtx_);
    for (auto cit = table_.begin(); cit != table_.end();) {
        auto& windows = cit->second;
        for (auto wit = windows.begin(); wit != windows.end();) {
            if (mode == MoveMode::COMPLETED_ONLY && wit->first == key) {
                ++wit;
                continue;
            }
            moved[cit->first][wit->first] = std::move(wit->second);
            wit = windows.erase(wit);
        }

        if (windows.empty()) {
            cit = table_.erase(cit);
        } else {
            ++cit;
        }
    }
    return moved;
}

std::string Collector::currentWindowKey() const {
    return WindowKey::fromTime(now_(), window_);
}

size_t Collector::pendingWindows() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    size_t n = 0;
    for (const auto& [component, windows] : table_) {
        n += windows.size();
    }
    return n;
}

size_t Collector::pendingValues() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    size_t n = 0;
    for (const auto& [component, windows] : table_) {
        for (const auto& [key, metrics] : windows) {
            for (const auto& [metric, values] : metrics) {
                n += values.size();
            }
        }
    }
    return n;
}

} // namespace HealthStream
