// ---------------------------------------------------------------------------
// test_identifier_validator.cpp
//
// IdentifierValidator / is_valid_identifier 단위 테스트.
//
// [테스트 범위]
// - 문자 규칙 (첫 글자, 허용 문자, ASCII 전용)
// - 기본 예약 목록 (SQLite / PostgreSQL / MySQL / SQL Server), 대소문자 무관
// - 위반 규칙별 메시지와 kInvalidIdentifier 코드
// - 사용자 정의 예약 목록 (기본 목록 대체)
// ---------------------------------------------------------------------------

#include "guard/identifier_validator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(IdentifierValidator, AcceptsOrdinaryNames) {
    for (const char* name : {"users", "user_accounts", "Products", "table123", "T1", "_staging"}) {
        SCOPED_TRACE(name);
        EXPECT_TRUE(is_valid_identifier(name));
    }
}

TEST(IdentifierValidator, RejectsMalformedNames) {
    for (const char* name : {"", "123table", "user-accounts", "user accounts", "user.accounts",
                             "users;", "\"users\"", "caf\xc3\xa9"}) {
        SCOPED_TRACE(name);
        EXPECT_FALSE(is_valid_identifier(name));
    }
}

TEST(IdentifierValidator, RejectsReservedNames) {
    for (const char* name : {"sqlite_master", "pg_tables", "information_schema",
                             "SQLITE_MASTER", "Pg_Catalog", "sysobjects", "mysql"}) {
        SCOPED_TRACE(name);
        EXPECT_FALSE(is_valid_identifier(name));
    }
}

TEST(IdentifierValidator, ReservedMatchIsExact) {
    // 접두어만 같은 이름은 예약 이름이 아니다
    EXPECT_TRUE(is_valid_identifier("sqlite_master_backup"));
    EXPECT_TRUE(is_valid_identifier("pg_tables2"));
    EXPECT_TRUE(is_valid_identifier("system"));
}

TEST(IdentifierValidator, MessagesNameTheViolatedRule) {
    const IdentifierValidator validator;

    const auto empty = validator.validate("");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, GuardErrorCode::kInvalidIdentifier);
    EXPECT_EQ(empty.error().message, "Identifier is empty");

    const auto digit = validator.validate("1abc");
    ASSERT_FALSE(digit.has_value());
    EXPECT_EQ(digit.error().message, "Identifier must start with a letter or underscore");

    const auto hyphen = validator.validate("a-b");
    ASSERT_FALSE(hyphen.has_value());
    EXPECT_EQ(hyphen.error().message,
              "Identifier may only contain letters, digits and underscores");

    const auto reserved = validator.validate("sqlite_schema");
    ASSERT_FALSE(reserved.has_value());
    EXPECT_EQ(reserved.error().message, "Identifier names a reserved system object");
    EXPECT_EQ(reserved.error().context, "sqlite_schema");
    EXPECT_EQ(to_string(reserved.error().code), "invalid_identifier");
}

TEST(IdentifierValidator, DefaultListCoversAllEngines) {
    const IdentifierValidator validator;
    EXPECT_EQ(validator.reserved_count(), default_reserved_identifiers().size());

    for (const auto& name : default_reserved_identifiers()) {
        SCOPED_TRACE(name);
        EXPECT_TRUE(validator.is_reserved(name));
    }
}

TEST(IdentifierValidator, CustomListReplacesDefaults) {
    const IdentifierValidator validator(std::vector<std::string>{"Secrets", "audit_log", ""});

    EXPECT_EQ(validator.reserved_count(), 2U);
    EXPECT_FALSE(validator.is_valid("secrets"));
    EXPECT_FALSE(validator.is_valid("AUDIT_LOG"));
    EXPECT_TRUE(validator.is_valid("sqlite_master"));
}

TEST(IdentifierValidator, EmptyListOnlyChecksCharacters) {
    const IdentifierValidator validator(std::vector<std::string>{});
    EXPECT_EQ(validator.reserved_count(), 0U);
    EXPECT_TRUE(validator.is_valid("sqlite_master"));
    EXPECT_FALSE(validator.is_valid("9lives"));
}
