#include <healthstream/core/state/health_state.hpp>
#include <exception>
#include <utility>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace HealthStream {

namespace {

int64_t unixSeconds(SystemClock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

PersistenceConfig HealthState::persistenceConfigFrom(const AppConfig::AppConfiguration& config) {
    PersistenceConfig pc = config.persistence;
    pc.window = std::chrono::seconds(config.sample_rate_seconds);
    pc.backup = config.backup;
    return pc;
}

HealthState::HealthState(const AppConfig::AppConfiguration& config)
    : HealthState(std::chrono::seconds(config.sample_rate_seconds),
                  PersistenceManager::create(persistenceConfigFrom(config))) {
    info(config.identity);
}

HealthState::HealthState(std::chrono::seconds window, std::unique_ptr<PersistenceManager> persistence,
                         TimeSource now)
    : now_(now ? std::move(now) : TimeSource(&WindowKey::systemNow)),
      collector_(window, now_),
      persistence_(std::move(persistence)) {
    if (!persistence_) {
        persistence_ = std::make_unique<PersistenceManager>(nullptr, PersistenceConfig{}, now_);
    }
    started_ = unixSeconds(now_());

    flush_queue_ = std::make_unique<FlushQueue>(
        collector_, *persistence_,
        std::chrono::duration_cast<std::chrono::milliseconds>(collector_.windowSize()));
    flush_queue_->start();

    spdlog::info("[HealthState] Collecting in {}s windows (persistence {})",
                 collector_.windowSize().count(), persistence_->isEnabled() ? "on" : "off");
}

HealthState::~HealthState() noexcept {
    close();
}

void HealthState::info(const std::string& identity) {
    std::lock_guard<std::mutex> lock(info_mutex_);
    identity_ = identity.empty() ? std::string(DEFAULT_IDENTITY) : identity;
    started_ = unixSeconds(now_());
}

std::string HealthState::identity() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return identity_;
}

int64_t HealthState::started() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return started_;
}

void HealthState::incrMetric(const std::string& name) {
    collector_.incr(GLOBAL_COMPONENT, name);
}

void HealthState::incrComponentMetric(const std::string& component, const std::string& name) {
    collector_.incr(component, name);
}

void HealthState::addMetric(const std::string& name, double value) {
    collector_.append(GLOBAL_COMPONENT, name, value);
}

void HealthState::addComponentMetric(const std::string& component, const std::string& name, double value) {
    collector_.append(component, name, value);
}

CollectionSnapshot HealthState::snapshot() const {
    return collector_.snapshot();
}

std::string HealthState::dump() const {
    Json::Value root(Json::objectValue);
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        root["Identity"] = identity_;
        root["Started"] = Json::Int64(started_);
    }

    Json::Value metrics(Json::objectValue);
    for (const auto& [component, entries] : collector_.snapshot()) {
        Json::Value comp(Json::objectValue);
        for (const auto& [name, summary] : entries) {
            if (summary.counter) {
                comp[name] = Json::UInt64(summary.count);
            } else {
                Json::Value stats(Json::objectValue);
                stats["count"] = Json::UInt64(summary.count);
                stats["min"] = summary.min;
                stats["max"] = summary.max;
                stats["avg"] = summary.avg;
                comp[name] = stats;
            }
        }
        if (!comp.empty()) {
            metrics[component] = comp;
        }
    }
    root["Metrics"] = metrics;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, root);
}

void HealthState::forceFlush() {
    flush_queue_->forceFlush();
}

void HealthState::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // stop() runs the final all-window flush and logs its failure
    flush_queue_->stop();
    persistence_->close();
    spdlog::info("[HealthState] Closed");
}

} // namespace HealthStream
