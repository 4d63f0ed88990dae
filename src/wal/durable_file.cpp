#include "photolens/wal/durable_file.hpp"

#include <fstream>
#include <string>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace photolens::wal {

auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "wal.io"});
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed", "wal.io"});
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_READ,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    DWORD err = ::GetLastError();
    if (err == ERROR_SHARING_VIOLATION || err == ERROR_ACCESS_DENIED) { return {}; }
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "wal.io"});
  }
  BOOL ok = ::FlushFileBuffers(h);
  ::CloseHandle(h);
  if (!ok) {
    return std::unexpected(error{error_code::io_failed, "FlushFileBuffers failed", "wal.io"});
  }
#endif
  return {};
}

auto fsync_dir_path(const std::filesystem::path& dir) -> void {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(dir.string().c_str(), O_RDONLY);
  if (fd < 0) return;
  (void)::fsync(fd);
  (void)::close(fd);
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(dir.wstring().c_str(), GENERIC_READ,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
  if (h != INVALID_HANDLE_VALUE) {
    (void)::FlushFileBuffers(h);
    ::CloseHandle(h);
  }
#else
  (void)dir;
#endif
}

auto write_file_atomic(const std::filesystem::path& dst, std::string_view content, std::string_view component)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  const std::string comp(component);
  auto tmp = dst;
  tmp += ".tmp";
  {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
  }
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "tmp open failed: " + tmp.filename().string(), comp});
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code ec; std::filesystem::remove(tmp, ec);
      return std::unexpected(error{error_code::io_failed, "tmp write failed: " + tmp.filename().string(), comp});
    }
  }
  if (auto r = fsync_file_path(tmp); !r) {
    std::error_code ec; std::filesystem::remove(tmp, ec);
    return std::unexpected(error{r.error().code, r.error().message, comp});
  }
#if defined(_WIN32)
  if (!::MoveFileExW(tmp.wstring().c_str(), dst.wstring().c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    std::error_code ec; std::filesystem::remove(tmp, ec);
    return std::unexpected(error{error_code::io_failed, "replace failed: " + dst.filename().string(), comp});
  }
#else
  std::error_code ec;
  std::filesystem::rename(tmp, dst, ec);
  if (ec) {
    std::error_code rec; std::filesystem::remove(tmp, rec);
    return std::unexpected(error{error_code::io_failed, "rename failed: " + dst.filename().string(), comp});
  }
#endif
  fsync_dir_path(dst.parent_path());
  return {};
}

} // namespace photolens::wal
