#pragma once

// ---------------------------------------------------------------------------
// audit_file_sink.hpp
//
// 감사 로그 전용 spdlog 싱크. 회전 정책과 보존 기간 정리를 담당한다.
//
// [파일 이름] directory 아래
//   daily   audit_YYYY-MM-DD.log      (UTC 날짜가 바뀌면 새 파일)
//   weekly  audit_YYYY-Www.log        (ISO 주차)
//   size    audit_current.log         (max_size_bytes 초과 직전에 audit_YYYYMMDD_HHMMSS.log 로 이름 변경)
//
// [보존] audit_*.log 중 마지막 수정 시각이 retention_days 보다 오래된 파일 삭제.
//        생성 시 한 번, 회전할 때마다 실행한다. 현재 파일은 삭제하지 않는다.
//
// base_sink<std::mutex> 의 mutex 가 쓰기를 직렬화한다 (다중 스레드 안전).
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>

#include <spdlog/details/file_helper.h>
#include <spdlog/sinks/base_sink.h>

#include "config/gate_config.hpp"

class AuditFileSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // 디렉터리 생성/파일 열기 실패 시 spdlog::spdlog_ex 또는 std::filesystem::filesystem_error.
    AuditFileSink(std::filesystem::path directory,
                  AuditRotation         rotation,
                  std::uint64_t         max_size_bytes,
                  std::uint32_t         retention_days,
                  Clock                 clock = {});

    [[nodiscard]] std::filesystem::path current_file();

    // 보존 기간이 지난 파일 삭제. 삭제한 수를 반환한다.
    std::size_t prune_expired();

    // 회전 정책에 따른 파일 이름 (디렉터리 제외).
    [[nodiscard]] static std::string file_name_for(AuditRotation rotation,
                                                   std::chrono::system_clock::time_point tp);

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override;

private:
    void open_locked(const std::filesystem::path& path);
    void rotate_by_size_locked();
    std::size_t prune_locked();

    std::filesystem::path       directory_;
    AuditRotation               rotation_;
    std::uint64_t               max_size_bytes_;
    std::uint32_t               retention_days_;
    Clock                       clock_;
    spdlog::details::file_helper file_helper_;
    std::filesystem::path       current_path_;
};
