#include "util.h"

#include <cerrno>
#include <cstring>
#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace berth {

namespace {

void write_all_and_sync(int fd, char const *data, std::size_t size, std::string const &what) {
  while (size > 0) {
    ssize_t const n{ ::write(fd, data, size) };
    if (n < 0) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "write failed: " + what);
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0) {
    throw std::system_error(errno, std::generic_category(), "fsync failed: " + what);
  }
}

struct fd_guard {
  int fd;
  ~fd_guard() {
    if (fd >= 0) { ::close(fd); }
  }
};

}  // namespace

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::string util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::string buffer(static_cast<size_t>(file_size), '\0');
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

void util_write_file_synced(std::filesystem::path const &path, std::string_view contents) {
  fd_guard out{ ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644) };
  if (out.fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open failed: " + path.string());
  }
  write_all_and_sync(out.fd, contents.data(), contents.size(), path.string());
}

void util_copy_file_synced(std::filesystem::path const &src,
                           std::filesystem::path const &dst) {
  fd_guard in{ ::open(src.c_str(), O_RDONLY | O_CLOEXEC) };
  if (in.fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open failed: " + src.string());
  }

  fd_guard out{ ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0755) };
  if (out.fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open failed: " + dst.string());
  }

  char buf[65536];
  for (;;) {
    ssize_t const n{ ::read(in.fd, buf, sizeof buf) };
    if (n < 0) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "read failed: " + src.string());
    }
    if (n == 0) { break; }
    write_all_and_sync(out.fd, buf, static_cast<std::size_t>(n), dst.string());
  }
}

std::string util_random_alnum(std::size_t length) {
  static constexpr char kAlphabet[]{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
  };

  std::random_device rd;
  std::mt19937_64 gen{ (static_cast<std::uint64_t>(rd()) << 32) ^ rd() };
  std::uniform_int_distribution<std::size_t> dist{ 0, sizeof kAlphabet - 2 };

  std::string result;
  result.reserve(length);
  for (std::size_t i{ 0 }; i < length; ++i) { result.push_back(kAlphabet[dist(gen)]); }
  return result;
}

std::string util_trim(std::string_view s) {
  auto const is_space{ [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
  } };

  std::size_t begin{ 0 };
  while (begin < s.size() && is_space(s[begin])) { ++begin; }
  std::size_t end{ s.size() };
  while (end > begin && is_space(s[end - 1])) { --end; }
  return std::string{ s.substr(begin, end - begin) };
}

std::vector<std::string> util_split_words(std::string_view s) {
  std::vector<std::string> words;
  std::string current;
  for (char const c : s) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      if (!current.empty()) { words.push_back(std::move(current)); }
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) { words.push_back(std::move(current)); }
  return words;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace berth
