// metadoc/basic/progress.hpp - Progress reporting side channel
//
// Pipeline phases report coarse progress through a ProgressObserver.
// Observers are called from worker threads and must be thread-safe.
// Nothing in the pipeline depends on what an observer does with the ticks.
//
#pragma once

#include <cstddef>
#include <string_view>

namespace metadoc
{

class ProgressObserver
{
public:
  virtual ~ProgressObserver() = default;

  /// A phase named @p task with @p length units of work begins.
  virtual void start_task(std::string_view task, size_t length) = 0;

  /// @p done units of @p task are complete (monotonic per task, may skip values).
  virtual void tick(std::string_view task, size_t done) = 0;

  virtual void complete_task(std::string_view task, bool success) = 0;
};

/// Observer that ignores every event.
class NullProgress final : public ProgressObserver
{
public:
  void start_task(std::string_view /*task*/, size_t /*length*/) override {}
  void tick(std::string_view /*task*/, size_t /*done*/) override {}
  void complete_task(std::string_view /*task*/, bool /*success*/) override {}
};

}  // namespace metadoc
