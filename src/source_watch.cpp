#include "source_watch.h"

#include "tui.h"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace berth {

bool source_watch_is_ignored_dir(std::filesystem::path const &dir) {
  auto const name{ dir.filename().string() };
  if (name.empty()) { return false; }
  if (name.front() == '.' && name != "." && name != "..") { return true; }
  return name == "build" || name.starts_with("cmake-build-");
}

source_fingerprint source_fingerprint_of(std::filesystem::path const &root) {
  source_fingerprint fp;

  std::error_code ec;
  std::filesystem::recursive_directory_iterator it{
    root, std::filesystem::directory_options::skip_permission_denied, ec
  };
  if (ec) { return fp; }

  for (std::filesystem::recursive_directory_iterator const end; it != end; it.increment(ec)) {
    if (ec) { break; }

    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      if (source_watch_is_ignored_dir(it->path())) { it.disable_recursion_pending(); }
      continue;
    }
    if (!it->is_regular_file(entry_ec)) { continue; }

    auto const size{ it->file_size(entry_ec) };
    if (entry_ec) { continue; }
    auto const mtime{ it->last_write_time(entry_ec) };
    if (entry_ec) { continue; }

    ++fp.files;
    fp.bytes += size;
    if (mtime > fp.newest) { fp.newest = mtime; }
  }

  return fp;
}

struct source_watch::impl {
  std::filesystem::path root;
  std::chrono::milliseconds interval;
  std::function<void()> on_change;

  std::mutex mutex;
  std::condition_variable cv;
  bool stop{ false };
  std::thread thread;

  void poll_loop() {
    auto last{ source_fingerprint_of(root) };

    std::unique_lock lock{ mutex };
    while (!cv.wait_for(lock, interval, [this] { return stop; })) {
      lock.unlock();
      auto const current{ source_fingerprint_of(root) };
      if (current != last) {
        last = current;
        tui::debug("source change detected under %s", root.string().c_str());
        try {
          on_change();
        } catch (std::exception const &e) {
          tui::warn("source change handler for %s failed: %s", root.string().c_str(), e.what());
        }
      }
      lock.lock();
    }
  }
};

source_watch::source_watch(std::filesystem::path root,
                           std::chrono::milliseconds interval,
                           std::function<void()> on_change)
    : m{ std::make_unique<impl>() } {
  if (!on_change) { throw std::logic_error("source_watch requires a change handler"); }
  m->root = std::move(root);
  m->interval = interval;
  m->on_change = std::move(on_change);
  m->thread = std::thread{ [this] { m->poll_loop(); } };
}

source_watch::~source_watch() {
  {
    std::lock_guard lock{ m->mutex };
    m->stop = true;
  }
  m->cv.notify_all();
  if (m->thread.joinable()) { m->thread.join(); }
}

std::filesystem::path const &source_watch::root() const { return m->root; }

}  // namespace berth
