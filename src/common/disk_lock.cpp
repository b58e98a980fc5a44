#include <bootforge/common/disk_lock.hpp>
#include <bootforge/common/posix_io.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>

namespace bootforge::common {

namespace {

std::string lock_file_name(const bootforge::schema::disk_id_t& disk_id) {
  auto name = std::string{};
  name.reserve(disk_id.size() + 5);
  for (auto c : disk_id) {
    auto keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    name.push_back(keep ? c : '_');
  }
  name.append(".lock");
  return name;
}

}  // namespace

disk_lock::disk_lock(disk_lock_registry* registry,
                     bootforge::schema::disk_id_t disk_id,
                     unique_fd file_lock)
    : registry_{registry},
      disk_id_{std::move(disk_id)},
      file_lock_{std::move(file_lock)} {}

disk_lock::disk_lock(disk_lock&& other) noexcept
    : registry_{other.registry_},
      disk_id_{std::move(other.disk_id_)},
      file_lock_{std::move(other.file_lock_)} {
  other.registry_ = nullptr;
}

disk_lock& disk_lock::operator=(disk_lock&& other) noexcept {
  if (this != &other) {
    release();
    registry_ = other.registry_;
    disk_id_ = std::move(other.disk_id_);
    file_lock_ = std::move(other.file_lock_);
    other.registry_ = nullptr;
  }
  return *this;
}

disk_lock::~disk_lock() {
  release();
}

void disk_lock::release() {
  if (!registry_) {
    return;
  }
  if (file_lock_) {
    ::flock(file_lock_.get(), LOCK_UN);
    file_lock_.reset();
  }
  registry_->release(disk_id_);
  registry_ = nullptr;
  spdlog::debug("released disk lock '{}'", disk_id_);
}

disk_lock_registry::disk_lock_registry(std::filesystem::path lock_directory)
    : lock_directory_{std::move(lock_directory)} {}

std::optional<disk_lock> disk_lock_registry::try_acquire(
    const bootforge::schema::disk_id_t& disk_id,
    bootforge::schema::error_t& error) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  if (held_.contains(disk_id)) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::device_busy,
        "disk '" + disk_id + "' is locked by another run in this process");
    return std::nullopt;
  }

  auto file_lock = unique_fd{};
  if (!lock_directory_.empty()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(lock_directory_, ec);
    if (ec) {
      error = bootforge::schema::make_error(
          bootforge::schema::error_code_t::io_error,
          "cannot create lock directory " + lock_directory_.string() + ": " +
              ec.message());
      return std::nullopt;
    }
    auto path = lock_directory_ / lock_file_name(disk_id);
    file_lock.reset(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!file_lock) {
      error = make_errno_error(errno, "open " + path.string());
      return std::nullopt;
    }
    if (::flock(file_lock.get(), LOCK_EX | LOCK_NB) != 0) {
      auto error_number = errno;
      if (error_number == EWOULDBLOCK) {
        error = bootforge::schema::make_error(
            bootforge::schema::error_code_t::device_busy,
            "disk '" + disk_id + "' is locked by another process");
      } else {
        error = make_errno_error(error_number, "flock " + path.string());
      }
      return std::nullopt;
    }
  }

  held_.insert(disk_id);
  spdlog::debug("acquired disk lock '{}'", disk_id);
  return disk_lock{this, disk_id, std::move(file_lock)};
}

bool disk_lock_registry::is_held(
    const bootforge::schema::disk_id_t& disk_id) const {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  return held_.contains(disk_id);
}

void disk_lock_registry::release(const bootforge::schema::disk_id_t& disk_id) {
  auto guard = std::lock_guard<std::mutex>{mutex_};
  held_.erase(disk_id);
}

}  // namespace bootforge::common
