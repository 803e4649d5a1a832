// ---------------------------------------------------------------------------
// pattern_catalog.cpp
//
// [패턴 작성 규칙]
// - 키워드와 피연산자 사이는 항상 \s+ / \s* 로 매칭한다 (탭/개행 우회 방지).
// - 점 표기 프로시저는 apoc\s*\.\s*load 처럼 점 주변 공백을 허용한다.
// - kShielded 패턴은 리터럴이 '' 로 비워진 텍스트를 전제로 한다.
// ---------------------------------------------------------------------------

#include "parser/pattern_catalog.hpp"

const std::vector<PatternSpec>& dangerous_patterns() {
    static const std::vector<PatternSpec> patterns = {
        // 파일 시스템 접근
        {PatternCategory::kFilesystemAccess, MatchTarget::kShielded,
         R"(\bLOAD\s+CSV\b)", "LOAD CSV file access"},
        {PatternCategory::kFilesystemAccess, MatchTarget::kShielded,
         R"(\bapoc\s*\.\s*load\s*\.)", "apoc.load file/URL access"},
        {PatternCategory::kFilesystemAccess, MatchTarget::kShielded,
         R"(\bapoc\s*\.\s*export\s*\.)", "apoc.export file write"},
        {PatternCategory::kFilesystemAccess, MatchTarget::kShielded,
         R"(\bapoc\s*\.\s*import\s*\.)", "apoc.import file read"},

        // 동적 코드 실행
        {PatternCategory::kDynamicExecution, MatchTarget::kShielded,
         R"(\bapoc\s*\.\s*cypher\s*\.\s*(run\w*|parallel\w*|doit|mapParallel\w*))",
         "apoc.cypher dynamic execution"},
        {PatternCategory::kDynamicExecution, MatchTarget::kShielded,
         R"(\bapoc\s*\.\s*periodic\s*\.\s*(iterate|submit|commit|repeat)\b)",
         "apoc.periodic batch execution"},

        // 관리/시스템 프로시저
        {PatternCategory::kAdminProcedure, MatchTarget::kShielded,
         R"(\bdbms\s*\.\s*security\s*\.)", "dbms.security procedure"},
        {PatternCategory::kAdminProcedure, MatchTarget::kShielded,
         R"(\bdbms\s*\.\s*cluster\s*\.)", "dbms.cluster procedure"},

        // 스키마/그래프 리팩터링
        {PatternCategory::kMutatingProcedure, MatchTarget::kShielded,
         R"(\bapoc\s*\.\s*refactor\s*\.)", "apoc.refactor graph mutation"},

        // 구문 체이닝: 세미콜론 뒤에 어떤 토큰이든 오면 체이닝
        {PatternCategory::kStatementChaining, MatchTarget::kShielded,
         R"(;\s*\S)", "statement chaining via ';'"},

        // 거대 반복
        {PatternCategory::kHugeIteration, MatchTarget::kShielded,
         R"(\bFOREACH\s*\([^)]*\bIN\s+range\s*\(\s*-?\d+\s*,\s*\d{6,})", "FOREACH over huge range"},
        {PatternCategory::kHugeIteration, MatchTarget::kShielded,
         R"(\bUNWIND\s+range\s*\(\s*-?\d+\s*,\s*\d{6,})", "UNWIND over huge range"},

        // 문자열 이스케이프 인젝션
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"(\\x[0-9a-f]{2})", "hex escape sequence"},
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"(\\u[0-9a-f]{4})", "unicode escape sequence"},
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"(\\[0-7]{3})", "octal escape sequence"},
        {PatternCategory::kEscapeInjection, MatchTarget::kShielded,
         R"('\s*\+\s*')", "single-quoted string concatenation"},
        {PatternCategory::kEscapeInjection, MatchTarget::kShielded,
         R"("\s*\+\s*")", "double-quoted string concatenation"},
    };
    return patterns;
}

const std::vector<PatternSpec>& suspicious_patterns() {
    static const std::vector<PatternSpec> patterns = {
        {PatternCategory::kProcedureCall, MatchTarget::kShielded,
         R"(\bCALL\s+apoc\s*\.)", "CALL apoc procedure"},
        {PatternCategory::kProcedureCall, MatchTarget::kShielded,
         R"(\bCALL\s+dbms\s*\.)", "CALL dbms procedure"},
        {PatternCategory::kSchemaChange, MatchTarget::kShielded,
         R"(\b(CREATE|DROP)\s+((RANGE|TEXT|POINT|FULLTEXT|LOOKUP|VECTOR|BTREE)\s+)?INDEX\b)",
         "index schema change"},
        {PatternCategory::kSchemaChange, MatchTarget::kShielded,
         R"(\b(CREATE|DROP)\s+CONSTRAINT\b)", "constraint schema change"},
    };
    return patterns;
}

const std::vector<PatternSpec>& parameter_patterns() {
    static const std::vector<PatternSpec> patterns = {
        {PatternCategory::kParameterInjection, MatchTarget::kRaw,
         R"(;\s*\w+)", "statement separator"},
        {PatternCategory::kParameterInjection, MatchTarget::kRaw,
         R"(\b(MATCH|CREATE|MERGE|DELETE|DROP|CALL|LOAD)\b)", "query keyword"},
        {PatternCategory::kParameterInjection, MatchTarget::kRaw,
         R"(--)", "comment marker '--'"},
        {PatternCategory::kParameterInjection, MatchTarget::kRaw,
         R"(/\*)", "block comment start"},
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"(\\x[0-9a-f]{2})", "hex escape sequence"},
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"(\\u[0-9a-f]{4})", "unicode escape sequence"},
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"(\\[0-7]{3})", "octal escape sequence"},
        {PatternCategory::kEscapeInjection, MatchTarget::kRaw,
         R"('\s*\+\s*')", "string concatenation"},
    };
    return patterns;
}

std::string_view category_name(PatternCategory category) noexcept {
    switch (category) {
        case PatternCategory::kFilesystemAccess:   return "filesystem_access";
        case PatternCategory::kDynamicExecution:   return "dynamic_execution";
        case PatternCategory::kAdminProcedure:     return "admin_procedure";
        case PatternCategory::kMutatingProcedure:  return "mutating_procedure";
        case PatternCategory::kStatementChaining:  return "statement_chaining";
        case PatternCategory::kHugeIteration:      return "huge_iteration";
        case PatternCategory::kEscapeInjection:    return "escape_injection";
        case PatternCategory::kSchemaChange:       return "schema_change";
        case PatternCategory::kProcedureCall:      return "procedure_call";
        case PatternCategory::kParameterInjection: return "parameter_injection";
    }
    return "unknown";
}
