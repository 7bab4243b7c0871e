#include "toolchain.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <chrono>
#include <mutex>
#include <system_error>

namespace berth {

std::vector<std::string> toolchain_run_step(std::string const &label,
                                            std::vector<std::string> const &argv,
                                            build_options const &options) {
  std::string const rendered{ process_render_argv(argv) };
  tui::debug("[%s] %s", label.c_str(), rendered.c_str());

  std::mutex lines_mutex;
  std::vector<std::string> lines;

  process_run_cfg cfg{
    .on_output_line =
        [&](process_stream, std::string_view line) {
          tui::debug("[%s] %.*s", label.c_str(), static_cast<int>(line.size()), line.data());
          std::lock_guard lock{ lines_mutex };
          lines.emplace_back(line);
        },
    .env = options.env,
  };

  auto const start{ std::chrono::steady_clock::now() };
  process_result result{};
  try {
    result = process_run(argv, cfg);
  } catch (std::system_error const &e) {
    throw build_error(build_error_cause::toolchain_failed,
                      "failed to run " + rendered + ": " + e.what(),
                      std::move(lines));
  }

  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  BERTH_TRACE_TOOLCHAIN_STEP(label, rendered, result.exit_code, duration_ms);

  if (result.signal) {
    throw build_error(build_error_cause::toolchain_failed,
                      rendered + " killed by signal " + std::to_string(*result.signal),
                      std::move(lines));
  }
  if (result.exit_code != 0) {
    throw build_error(build_error_cause::toolchain_failed,
                      rendered + " exited with code " + std::to_string(result.exit_code),
                      std::move(lines));
  }

  return lines;
}

}  // namespace berth
