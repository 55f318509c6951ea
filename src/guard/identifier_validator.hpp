#pragma once

// ---------------------------------------------------------------------------
// identifier_validator.hpp
//
// 테이블/컬럼 식별자 검증기.
// 생성 텍스트나 사용자 입력에서 온 "맨 이름"을 쿼리에 넣기 전에 호출한다.
//
// [검증 규칙: 모두 만족해야 유효]
// 1. 비어 있지 않음
// 2. ^[A-Za-z_][A-Za-z0-9_]*$ (ASCII 전용, 숫자 시작/하이픈/점/공백 거부)
// 3. 예약(시스템 카탈로그) 이름 목록과 대소문자 무관 불일치
//
// [한계]
// - 인용 식별자("my table", `x`)는 지원하지 않는다. 인용이 필요한 이름은 거부된다.
// - 예약 목록은 정확 일치만 검사한다. sqlite_stat5 처럼 목록에 없는
//   카탈로그 이름은 통과한다 (config 에서 목록 확장 가능).
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "common/types.hpp"  // GuardError

// 기본 예약 이름 목록 (SQLite / PostgreSQL / MySQL / SQL Server 카탈로그).
[[nodiscard]] std::vector<std::string> default_reserved_identifiers();

// ---------------------------------------------------------------------------
// IdentifierValidator
//   예약 이름 목록을 생성 시 주입받는 불변 검증기.
//   생성 후 읽기 전용이므로 여러 스레드에서 동시 호출 안전.
// ---------------------------------------------------------------------------
class IdentifierValidator {
public:
    IdentifierValidator();
    explicit IdentifierValidator(const std::vector<std::string>& reserved_names);

    // validate
    //   유효하면 void, 아니면 kInvalidIdentifier + 위반 규칙 설명.
    [[nodiscard]] std::expected<void, GuardError> validate(std::string_view name) const;

    [[nodiscard]] bool is_valid(std::string_view name) const {
        return validate(name).has_value();
    }

    // is_reserved
    //   문자 규칙과 무관하게 예약 목록 포함 여부만 확인한다.
    [[nodiscard]] bool is_reserved(std::string_view name) const;

    [[nodiscard]] std::size_t reserved_count() const noexcept { return reserved_.size(); }

private:
    std::unordered_set<std::string> reserved_;  // 소문자로 정규화하여 보관
};

// is_valid_identifier
//   기본 예약 목록을 사용하는 편의 함수.
[[nodiscard]] bool is_valid_identifier(std::string_view name);
