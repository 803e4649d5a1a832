#include "logger/audit_file_sink.hpp"

#include <ctime>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::tm utc_tm(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&t, &tm_val);
    return tm_val;
}

std::string format_tm(const char* pattern, const std::tm& tm_val) {
    char buf[64]{};
    const std::size_t n = std::strftime(buf, sizeof(buf), pattern, &tm_val);
    return std::string(buf, n);
}

bool is_audit_file(const std::filesystem::path& p) {
    const std::string name = p.filename().string();
    return name.size() > 10 && name.rfind("audit_", 0) == 0 && p.extension() == ".log";
}

}  // namespace

AuditFileSink::AuditFileSink(std::filesystem::path directory,
                             AuditRotation         rotation,
                             std::uint64_t         max_size_bytes,
                             std::uint32_t         retention_days,
                             Clock                 clock)
    : directory_(std::move(directory))
    , rotation_(rotation)
    , max_size_bytes_(max_size_bytes)
    , retention_days_(retention_days)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
    std::filesystem::create_directories(directory_);
    open_locked(directory_ / file_name_for(rotation_, clock_()));
    prune_locked();
}

std::string AuditFileSink::file_name_for(AuditRotation rotation, std::chrono::system_clock::time_point tp) {
    switch (rotation) {
        case AuditRotation::kDaily:
            return "audit_" + format_tm("%Y-%m-%d", utc_tm(tp)) + ".log";
        case AuditRotation::kWeekly:
            return "audit_" + format_tm("%G-W%V", utc_tm(tp)) + ".log";
        case AuditRotation::kSize:
            return "audit_current.log";
    }
    return "audit_current.log";
}

std::filesystem::path AuditFileSink::current_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_path_;
}

std::size_t AuditFileSink::prune_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return prune_locked();
}

void AuditFileSink::open_locked(const std::filesystem::path& path) {
    file_helper_.open(path.string(), /*truncate=*/false);
    current_path_ = path;
}

// ---------------------------------------------------------------------------
// sink_it_
//   1. 날짜/주차 정책: 파일 이름이 바뀌었으면 새 파일로 전환 후 보존 정리
//   2. 크기 정책: 이번 줄을 쓰면 상한을 넘는 경우 현재 파일을 타임스탬프 이름으로 회전
// ---------------------------------------------------------------------------
void AuditFileSink::sink_it_(const spdlog::details::log_msg& msg) {
    spdlog::memory_buf_t formatted;
    formatter_->format(msg, formatted);

    if (rotation_ == AuditRotation::kSize) {
        const std::size_t current = file_helper_.size();
        if (max_size_bytes_ > 0 && current > 0 && current + formatted.size() > max_size_bytes_) {
            rotate_by_size_locked();
        }
    } else {
        const auto expected = directory_ / file_name_for(rotation_, clock_());
        if (expected != current_path_) {
            open_locked(expected);
            prune_locked();
        }
    }

    file_helper_.write(formatted);
}

void AuditFileSink::flush_() {
    file_helper_.flush();
}

void AuditFileSink::rotate_by_size_locked() {
    file_helper_.close();

    const std::string stamp = format_tm("%Y%m%d_%H%M%S", utc_tm(clock_()));
    std::filesystem::path target = directory_ / fmt::format("audit_{}.log", stamp);
    for (int suffix = 1; std::filesystem::exists(target); ++suffix) {
        target = directory_ / fmt::format("audit_{}_{}.log", stamp, suffix);
    }

    std::error_code ec;
    std::filesystem::rename(current_path_, target, ec);
    if (ec) {
        spdlog::warn("audit_file_sink: rotate {} failed: {}", current_path_.string(), ec.message());
    }

    file_helper_.open(current_path_.string(), /*truncate=*/!ec);
    prune_locked();
}

std::size_t AuditFileSink::prune_locked() {
    if (retention_days_ == 0) {
        return 0;
    }

    const auto cutoff = std::filesystem::file_time_type::clock::now()
                      - std::chrono::hours(24) * static_cast<long>(retention_days_);

    std::size_t removed = 0;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(directory_, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& path = it->path();
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || !is_audit_file(path) || path == current_path_) {
            continue;
        }

        std::error_code time_ec;
        const auto mtime = std::filesystem::last_write_time(path, time_ec);
        if (time_ec || mtime >= cutoff) {
            continue;
        }

        std::error_code rm_ec;
        if (std::filesystem::remove(path, rm_ec)) {
            ++removed;
            spdlog::info("audit_file_sink: removed expired audit log {}", path.filename().string());
        } else if (rm_ec) {
            spdlog::warn("audit_file_sink: failed to remove {}: {}", path.filename().string(), rm_ec.message());
        }
    }
    if (ec) {
        spdlog::warn("audit_file_sink: cannot scan {}: {}", directory_.string(), ec.message());
    }
    return removed;
}
