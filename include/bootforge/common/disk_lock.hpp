#pragma once
#include <bootforge/common/unique_fd.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>

namespace bootforge::common {

class disk_lock_registry;

/// Exclusive hold on one disk id. Released on destruction.
class disk_lock final {
 public:
  disk_lock(disk_lock&& other) noexcept;
  disk_lock& operator=(disk_lock&& other) noexcept;
  disk_lock(const disk_lock&) = delete;
  disk_lock& operator=(const disk_lock&) = delete;
  ~disk_lock();

  const bootforge::schema::disk_id_t& disk_id() const { return disk_id_; }

 private:
  friend class disk_lock_registry;
  disk_lock(disk_lock_registry* registry,
            bootforge::schema::disk_id_t disk_id,
            unique_fd file_lock);
  void release();

  disk_lock_registry* registry_{nullptr};
  bootforge::schema::disk_id_t disk_id_;
  unique_fd file_lock_;
};

/// Issues at most one `disk_lock` per disk id.
///
/// Within the process a set of held ids excludes concurrent runs. With a lock
/// directory, an advisory `flock` on `<lock_dir>/<disk_id>.lock` also
/// excludes other processes. The registry must outlive its locks.
class disk_lock_registry final {
 public:
  explicit disk_lock_registry(std::filesystem::path lock_directory = {});

  disk_lock_registry(const disk_lock_registry&) = delete;
  disk_lock_registry& operator=(const disk_lock_registry&) = delete;

  /// Fails with `device_busy` when the disk is already held.
  std::optional<disk_lock> try_acquire(
      const bootforge::schema::disk_id_t& disk_id,
      bootforge::schema::error_t& error);

  bool is_held(const bootforge::schema::disk_id_t& disk_id) const;

 private:
  friend class disk_lock;
  void release(const bootforge::schema::disk_id_t& disk_id);

  mutable std::mutex mutex_;
  std::set<bootforge::schema::disk_id_t> held_;
  std::filesystem::path lock_directory_;
};

}  // namespace bootforge::common
