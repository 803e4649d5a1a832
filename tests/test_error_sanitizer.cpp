// ---------------------------------------------------------------------------
// test_error_sanitizer.cpp
//
// ErrorSanitizer 단위 테스트.
//
// [테스트 범위]
// - production 모드: 안전 부분 문자열 포함 메시지는 그대로, 나머지는 일반 메시지
// - 대소문자 무시 매칭
// - debug 모드: 원본 그대로
// - 일반 메시지에 오류 종류 이름 포함
// ---------------------------------------------------------------------------

#include "pipeline/error_sanitizer.hpp"

#include <gtest/gtest.h>
#include <string>

// ---- SafeMessagesPassThrough
TEST(ErrorSanitizer, SafeMessagesPassThrough) {
    const ErrorSanitizer sanitizer(false);

    EXPECT_EQ(sanitizer.sanitize(ErrorKind::kEngine, "Query execution timeout after 30000 ms"),
              "Query execution timeout after 30000 ms");
    EXPECT_EQ(sanitizer.sanitize(ErrorKind::kEngine, "Connection refused by bolt://db:7687"),
              "Connection refused by bolt://db:7687");
    EXPECT_EQ(sanitizer.sanitize(ErrorKind::kValidation, "Query exceeds maximum length of 10000 characters"),
              "Query exceeds maximum length of 10000 characters");
}

// ---- UnsafeMessagesBecomeGeneric
TEST(ErrorSanitizer, UnsafeMessagesBecomeGeneric) {
    const ErrorSanitizer sanitizer(false);

    EXPECT_EQ(sanitizer.sanitize(ErrorKind::kEngine, "Neo.ClientError.Statement.SyntaxError at /var/lib/neo4j"),
              "EngineError: An error occurred. Enable debug_mode for details.");
    EXPECT_EQ(sanitizer.sanitize(ErrorKind::kInternal, "std::bad_alloc"),
              "InternalError: An error occurred. Enable debug_mode for details.");
}

// ---- MatchingIsCaseInsensitive
TEST(ErrorSanitizer, MatchingIsCaseInsensitive) {
    EXPECT_TRUE(ErrorSanitizer::is_safe_message("NODE NOT FOUND"));
    EXPECT_TRUE(ErrorSanitizer::is_safe_message("Unauthorized access"));
    EXPECT_TRUE(ErrorSanitizer::is_safe_message("BLOCKED: Query contains dangerous pattern: x"));
    EXPECT_FALSE(ErrorSanitizer::is_safe_message("segmentation fault in driver"));
    EXPECT_FALSE(ErrorSanitizer::is_safe_message(""));
}

// ---- DebugModeKeepsOriginal
TEST(ErrorSanitizer, DebugModeKeepsOriginal) {
    const ErrorSanitizer sanitizer(true);
    EXPECT_TRUE(sanitizer.debug_mode());
    EXPECT_EQ(sanitizer.sanitize(ErrorKind::kEngine, "driver stack trace: frame 0 ..."),
              "driver stack trace: frame 0 ...");
}

// ---- GenericMessageNamesKind
TEST(ErrorSanitizer, GenericMessageNamesKind) {
    EXPECT_EQ(ErrorSanitizer::generic_message(ErrorKind::kRateLimit),
              "RateLimitError: An error occurred. Enable debug_mode for details.");
    EXPECT_EQ(ErrorSanitizer::generic_message(ErrorKind::kWriteBlocked),
              "WriteBlockedError: An error occurred. Enable debug_mode for details.");
}
