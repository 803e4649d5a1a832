#pragma once

// ---------------------------------------------------------------------------
// write_detector.hpp
//
// 쓰기 연산 탐지기. read-only 게이트(Sanitizer)와 PROFILE 안전장치
// (PlanAnalyzer) 가 공유한다.
//
// [탐지 방식]
// 1. TextShield 로 리터럴/주석 제거 (문자열 안의 'CREATE' 오탐 방지)
// 2. 공백 정규화 (탭/개행/연속 공백 → 스페이스 하나)
// 3. 단어 경계 정규식:
//    - 쓰기 키워드: CREATE MERGE DELETE DETACH SET REMOVE DROP FOREACH
//      단, 앞 글자가 '.', ':', '$', 식별자 문자이면 제외 (n.set, :Create, $delete)
//    - LOAD CSV
//    - 쓰기 프로시저 계열: db.schema.* db.create.* apoc.write.* apoc.create.*
//      apoc.merge.* apoc.refactor.*
//
// [알려진 한계]
// - 읽기 전용 프로시저라도 위 계열 이름이면 차단된다 (fail-close).
// - 사용자 정의 쓰기 프로시저(CALL custom.writeSomething) 는 탐지하지 않는다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// WriteDetection
// ---------------------------------------------------------------------------
struct WriteDetection {
    bool        detected{false};
    std::string keyword{};   // 대문자 정규화된 키워드 또는 프로시저 접두어
};

class WriteDetector {
public:
    WriteDetector();

    // CompiledPattern 이 cpp 에서만 완전한 타입이므로 특수 멤버는 cpp 에서 default 정의.
    ~WriteDetector();
    WriteDetector(const WriteDetector&);
    WriteDetector& operator=(const WriteDetector&);
    WriteDetector(WriteDetector&&) noexcept;
    WriteDetector& operator=(WriteDetector&&) noexcept;

    // 원문 쿼리를 받아 내부에서 리터럴/주석 제거 후 검사한다.
    [[nodiscard]] WriteDetection detect(std::string_view query) const;

    [[nodiscard]] bool contains_write(std::string_view query) const {
        return detect(query).detected;
    }

    // 이미 shield_query() 를 거친 텍스트 검사 (Sanitizer 전용 경로).
    [[nodiscard]] WriteDetection detect_shielded(std::string_view shielded) const;

private:
    struct CompiledPattern;
    std::vector<CompiledPattern> patterns_;
};
