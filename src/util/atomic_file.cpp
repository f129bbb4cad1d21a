#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <system_error>

namespace regflow::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string tmp_name =
      target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / tmp_name;
}

void SetError(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error) {
  if (path.empty() || !path.has_filename()) {
    SetError(error, "invalid output path '" + path.string() + "'");
    return false;
  }
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      SetError(error, "create_directories(" + parent.string() + ") failed: " + ec.message());
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      SetError(error, "failed to open " + tmp_path.string() + " for write");
      return false;
    }
    if (!writer(out)) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error && error->empty()) {
        *error = "writer failed";
      }
      return false;
    }
    out.flush();
    if (!out.good()) {
      out.close();
      RemoveQuietly(tmp_path);
      SetError(error, "flush of " + tmp_path.string() + " failed");
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    SetError(error, "rename to " + path.string() + " failed: " + ec.message());
    RemoveQuietly(tmp_path);
    return false;
  }
  return true;
}

bool AtomicWriteText(const std::filesystem::path& path, std::string_view text,
                     std::string* error) {
  return AtomicWriteFile(
      path,
      [&](std::ofstream& out) -> bool {
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        return out.good();
      },
      error);
}

}  // namespace regflow::util
