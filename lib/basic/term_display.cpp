// metadoc/basic/term_display.cpp - Terminal progress display
//
#include "metadoc/basic/term_display.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cstdlib>
#include <cstring>
#include <ostream>
#include <rang.hpp>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace metadoc
{

namespace
{

constexpr auto k_render_interval = std::chrono::milliseconds(100);

}  // namespace

TermDisplay::TermDisplay(std::ostream & os, bool fallback_mode)
: os_(os), fallback_mode_(fallback_mode)
{
}

bool TermDisplay::default_fallback_mode()
{
  const char * term = std::getenv("TERM");
  if (term != nullptr && std::strcmp(term, "dumb") == 0) {
    return true;
  }
  return isatty(fileno(stdout)) == 0;
}

void TermDisplay::start_task(std::string_view task, size_t length)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  task_ = std::string(task);
  length_ = length;
  last_rendered_ = 0;
  started_at_ = std::chrono::steady_clock::now();
  last_render_at_ = started_at_;

  if (fallback_mode_) {
    fmt::print(os_, "{} ({})\n", task_, length_);
    os_.flush();
    return;
  }
  render_locked(0);
}

void TermDisplay::tick(std::string_view task, size_t done)
{
  if (fallback_mode_) {
    return;
  }

  // Workers never wait on the display; a busy lock just drops this tick.
  std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock() || task != task_ || done <= last_rendered_) {
    return;
  }

  const auto now = std::chrono::steady_clock::now();
  if (done < length_ && now - last_render_at_ < k_render_interval) {
    return;
  }
  last_render_at_ = now;
  render_locked(done);
}

void TermDisplay::complete_task(std::string_view task, bool success)
{
  const std::lock_guard<std::mutex> lock(mutex_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started_at_);

  if (!fallback_mode_) {
    render_locked(success ? length_ : last_rendered_);
    os_ << "\n";
  }

  if (success) {
    fmt::print(os_, "{} done in {} ms\n", task, elapsed.count());
  } else {
    os_ << rang::fg::red;
    fmt::print(os_, "{} failed after {} ms\n", task, elapsed.count());
    os_ << rang::fg::reset;
  }
  os_.flush();
  task_.clear();
}

void TermDisplay::render_locked(size_t done)
{
  last_rendered_ = done;
  const size_t percent = length_ == 0 ? 100 : (done * 100) / length_;

  os_ << "\r" << rang::style::bold << task_ << rang::style::reset;
  fmt::print(os_, "  {}/{}  {:>3}%", done, length_, percent);
  os_.flush();
}

}  // namespace metadoc
