// ---------------------------------------------------------------------------
// identifier_validator.cpp
//
// 식별자 문자 규칙 + 예약 이름 검사 구현.
// 문자 규칙은 정규식 대신 직접 검사한다 (로케일 영향 없는 ASCII 범위 비교).
// ---------------------------------------------------------------------------

#include "guard/identifier_validator.hpp"

#include <algorithm>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

// ASCII 소문자 변환 (로케일 무관).
std::string to_lower_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
    });
    return result;
}

bool is_ident_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

}  // namespace

std::vector<std::string> default_reserved_identifiers() {
    return {
        // SQLite
        "sqlite_master", "sqlite_schema", "sqlite_temp_master", "sqlite_temp_schema",
        "sqlite_sequence", "sqlite_stat1", "sqlite_stat2", "sqlite_stat3", "sqlite_stat4",
        // PostgreSQL
        "pg_catalog", "pg_tables", "pg_class", "pg_namespace", "pg_attribute",
        "pg_roles", "pg_user", "pg_shadow", "pg_authid", "pg_database",
        "pg_settings", "pg_stat_activity", "pg_proc", "pg_views", "pg_indexes",
        // MySQL
        "information_schema", "mysql", "performance_schema", "sys",
        // SQL Server
        "sysobjects", "syscolumns", "sysusers",
    };
}

IdentifierValidator::IdentifierValidator()
    : IdentifierValidator(default_reserved_identifiers())
{}

IdentifierValidator::IdentifierValidator(const std::vector<std::string>& reserved_names) {
    reserved_.reserve(reserved_names.size());
    for (const auto& name : reserved_names) {
        if (name.empty()) {
            continue;
        }
        reserved_.insert(to_lower_ascii(name));
    }
    if (reserved_.empty()) {
        // 예약 목록이 비면 카탈로그 테이블 탐색을 막을 수 없다.
        spdlog::warn("identifier_validator: reserved name list is empty, "
                     "system catalog names will be accepted");
    }
}

std::expected<void, GuardError> IdentifierValidator::validate(std::string_view name) const {
    if (name.empty()) {
        return std::unexpected(GuardError{
            GuardErrorCode::kInvalidIdentifier,
            "Identifier is empty",
            ""
        });
    }

    if (!is_ident_start(name.front())) {
        return std::unexpected(GuardError{
            GuardErrorCode::kInvalidIdentifier,
            "Identifier must start with a letter or underscore",
            std::string(name)
        });
    }

    const auto bad = std::find_if(name.begin() + 1, name.end(),
                                  [](char c) { return !is_ident_char(c); });
    if (bad != name.end()) {
        return std::unexpected(GuardError{
            GuardErrorCode::kInvalidIdentifier,
            "Identifier may only contain letters, digits and underscores",
            std::string(name)
        });
    }

    if (is_reserved(name)) {
        return std::unexpected(GuardError{
            GuardErrorCode::kInvalidIdentifier,
            "Identifier names a reserved system object",
            std::string(name)
        });
    }

    return {};
}

bool IdentifierValidator::is_reserved(std::string_view name) const {
    return reserved_.contains(to_lower_ascii(name));
}

bool is_valid_identifier(std::string_view name) {
    static const IdentifierValidator kDefaultValidator;
    return kDefaultValidator.is_valid(name);
}
