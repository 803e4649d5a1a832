#pragma once

// ---------------------------------------------------------------------------
// graph_driver.hpp
//
// 외부 협력자 경계 (인터페이스만).
//
// GraphDriver   : 그래프 DB 드라이버. run() 은 결과 핸들을 즉시 돌려준다.
// ResultHandle  : consume() 는 행을 읽지 않고 요약(계획 포함)만 받는다.
//                 materialize() 는 모든 행을 읽는다.
//                 PlanAnalyzer 는 어떤 모드에서도 materialize() 를 호출하지 않는다.
// QueryTranslator: 자연어 → 쿼리 생성기. 출력은 신뢰하지 않으며
//                 원시 클라이언트 입력과 동일한 게이트를 다시 통과한다.
//
// 구현체의 실패는 std::exception 파생 예외로 보고한다 (파이프라인 경계에서 EngineError 로 변환).
// ---------------------------------------------------------------------------

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "plan/plan_types.hpp"

using ResultRow = std::map<std::string, std::string>;

class ResultHandle {
public:
    virtual ~ResultHandle() = default;

    virtual PlanSummary consume() = 0;

    virtual std::vector<ResultRow> materialize() = 0;
};

class GraphDriver {
public:
    virtual ~GraphDriver() = default;

    virtual std::unique_ptr<ResultHandle> run(const std::string& query, const ParameterMap& params) = 0;
};

class QueryTranslator {
public:
    virtual ~QueryTranslator() = default;

    virtual std::string translate(const std::string& question) = 0;
};
