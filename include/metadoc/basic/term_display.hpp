// metadoc/basic/term_display.hpp - Terminal progress display
#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

#include "metadoc/basic/progress.hpp"

namespace metadoc
{

/**
 * Renders phase progress on a terminal.
 *
 * Interactive mode redraws a single status line in place
 * ("Building symbol index  1234/5000  24%"). Fallback mode, used for
 * non-TTY output and --non-interactive, prints one line when a phase
 * starts and one when it completes.
 */
class TermDisplay final : public ProgressObserver
{
public:
  TermDisplay(std::ostream & os, bool fallback_mode);

  void start_task(std::string_view task, size_t length) override;
  void tick(std::string_view task, size_t done) override;
  void complete_task(std::string_view task, bool success) override;

  /// True when the stream looks like an interactive terminal.
  [[nodiscard]] static bool default_fallback_mode();

private:
  void render_locked(size_t done);

  std::ostream & os_;
  const bool fallback_mode_;

  std::mutex mutex_;
  std::string task_;
  size_t length_ = 0;
  size_t last_rendered_ = 0;
  std::chrono::steady_clock::time_point started_at_;
  std::chrono::steady_clock::time_point last_render_at_;
};

}  // namespace metadoc
