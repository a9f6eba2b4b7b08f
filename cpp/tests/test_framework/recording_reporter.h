#pragma once
/**
 * @file recording_reporter.h
 * @brief Reporter that keeps every event, plus query helpers for tests.
 */
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tsp_engine.hpp"

namespace treespec::test
{

class RecordingReporter : public engine::Reporter
{
  public:
    void apply(const engine::Event &event) override;

    /// Snapshot of the events received so far, in arrival order.
    std::vector<engine::Event> events() const;

    std::vector<engine::Event> events_of(engine::EventType type) const;
    size_t count_of(engine::EventType type) const;

    /// Event types in arrival order; handy for whole-sequence assertions.
    std::vector<engine::EventType> types() const;

    /// Test names carried by events of @p type, in arrival order.
    std::vector<std::string> test_names_of(engine::EventType type) const;

    /// The last event of @p type for @p test_name.
    std::optional<engine::Event> find(engine::EventType type, const std::string &test_name) const;

    void clear();

  private:
    mutable std::mutex mutex_;
    std::vector<engine::Event> events_;
};

/// RunArgs over a fresh RecordingReporter.
struct RecordingRun
{
    std::shared_ptr<RecordingReporter> reporter = std::make_shared<RecordingReporter>();
    engine::RunArgs args = engine::RunArgs::with_reporter(reporter);
};

} // namespace treespec::test
