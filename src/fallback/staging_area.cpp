/**
 * @file staging_area.cpp
 * @brief Scoped staging directory implementation
 */

#include "kcenon/object_transfer/fallback/staging_area.h"

#include "kcenon/object_transfer/cloud/cloud_utils.h"
#include "kcenon/object_transfer/core/logging.h"

namespace kcenon::object_transfer {

namespace {

constexpr int max_create_attempts = 8;

auto sanitize_file_name(std::string_view name) -> std::string {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        out += (c == '/' || c == '\\' || c == '\0') ? '_' : c;
    }
    if (out.empty() || out == "." || out == "..") {
        out = "object";
    }
    return out;
}

}  // namespace

// ============================================================================
// staging_lease
// ============================================================================

staging_lease::staging_lease(std::filesystem::path directory, std::string file_name,
                             std::shared_ptr<std::atomic<std::size_t>> active)
    : directory_(std::move(directory)),
      file_name_(std::move(file_name)),
      active_(std::move(active)) {}

staging_lease::~staging_lease() {
    release();
}

staging_lease::staging_lease(staging_lease&& other) noexcept
    : directory_(std::move(other.directory_)),
      file_name_(std::move(other.file_name_)),
      active_(std::move(other.active_)) {
    other.directory_.clear();
}

staging_lease& staging_lease::operator=(staging_lease&& other) noexcept {
    if (this != &other) {
        release();
        directory_ = std::move(other.directory_);
        file_name_ = std::move(other.file_name_);
        active_ = std::move(other.active_);
        other.directory_.clear();
    }
    return *this;
}

void staging_lease::release() noexcept {
    if (directory_.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
    if (ec) {
        OT_LOG_WARN(log_category::staging,
                    "failed to remove stage " + directory_.string() + ": " + ec.message());
    }
    directory_.clear();

    if (active_) {
        active_->fetch_sub(1, std::memory_order_acq_rel);
        active_.reset();
    }
}

// ============================================================================
// staging_area
// ============================================================================

staging_area::staging_area(staging_config config)
    : config_(std::move(config)),
      active_(std::make_shared<std::atomic<std::size_t>>(0)) {}

auto staging_area::acquire(std::string_view object_name) -> result<staging_lease> {
    std::error_code ec;
    std::filesystem::create_directories(config_.root, ec);
    if (ec) {
        return unexpected{error{error_code::staging_create_failed,
            "cannot create staging root " + config_.root.string() + ": " + ec.message()}};
    }

    for (int attempt = 0; attempt < max_create_attempts; ++attempt) {
        auto name = "stage-" + std::to_string(sequence_.fetch_add(1)) + "-" +
                    cloud_utils::generate_random_hex(4);
        auto directory = config_.root / name;

        if (std::filesystem::create_directory(directory, ec)) {
            active_->fetch_add(1, std::memory_order_acq_rel);
            OT_LOG_TRACE(log_category::staging, "acquired stage " + directory.string());
            return staging_lease{std::move(directory), sanitize_file_name(object_name), active_};
        }
        if (ec) {
            return unexpected{error{error_code::staging_create_failed,
                "cannot create stage " + directory.string() + ": " + ec.message()}};
        }
    }

    return unexpected{error{error_code::staging_create_failed,
        "no unique stage name under " + config_.root.string()}};
}

}  // namespace kcenon::object_transfer
