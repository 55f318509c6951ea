#pragma once

// ---------------------------------------------------------------------------
// sql_guardrail.hpp
//
// 텍스트 모델이 생성한 SQL 후보를 실행 없이 판정/정규화하는 가드레일.
//
// [판정 순서: 첫 번째 거부가 결과]
// 1. 입력 없음 / 공백만            → kEmptyInput
//    최대 길이 초과                → kNonSelectOrUnsafe
// 2. 아티팩트 제거: 코드 펜스(```), 선두 언어 태그 줄("sql"), 끝 세미콜론 전부
//    제거 후 비어 있으면           → kEmptyInput
// 3. StatementSafetyCheck: 허용 앵커 불일치 → kNonSelectOrUnsafe
// 4. StatementSafetyCheck: 금지 키워드      → kForbiddenKeyword
// 5. LIMIT <n> 검사: n > 상한              → kExcessiveLimit
//    LIMIT 없음                            → " LIMIT <상한>" 추가
// 6. 허용: 정규화된 문장 반환
//
// [보장]
// - 허용된 문장에는 상한 이하의 LIMIT 절이 항상 존재한다.
// - 허용된 문장을 다시 sanitize 하면 동일한 문장이 반환된다 (멱등).
// - 예외를 던지지 않는다. 잘못된 후보는 예상된 입력이다.
//
// [한계]
// - SQL 파서가 아니다. LIMIT 판정은 정규식 기반이며 LIMIT ?, LIMIT (subquery),
//   LIMIT -1 같은 비숫자 형태는 인식하지 못한다 (뒤에 LIMIT 이 추가되어
//   실행 엔진에서 구문 오류로 실패한다).
// - 서브쿼리/CTE 안의 LIMIT 만 있어도 "LIMIT 존재"로 본다.
// - 문자열 리터럴/주석 안의 LIMIT 는 무시한다. 문장이 -- 주석으로 끝나면
//   추가 LIMIT 를 다음 줄에 붙이고, 닫히지 않은 /* 나 리터럴로 끝나면 거부한다
//   (추가한 LIMIT 가 주석/리터럴에 삼켜지는 것을 방지).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "guard/statement_safety_check.hpp"

inline constexpr std::uint32_t kDefaultRowLimitCap = 500;

// 후보 원문 최대 길이. 이보다 긴 입력은 정규식 검사 전에 거부한다.
inline constexpr std::size_t kDefaultMaxCandidateBytes = 8192;

// 허용 시 정규화된 SQL, 거부 시 GuardError.
using SanitizeVerdict = std::expected<std::string, GuardError>;

// ---------------------------------------------------------------------------
// SqlGuardrail
//   생성 후 불변. 여러 스레드에서 동시 호출 안전.
// ---------------------------------------------------------------------------
class SqlGuardrail {
public:
    // check 가 nullptr 이면 PatternSafetyCheck 를 사용한다.
    explicit SqlGuardrail(std::uint32_t                               row_limit_cap = kDefaultRowLimitCap,
                          std::shared_ptr<const StatementSafetyCheck> check         = nullptr,
                          std::size_t max_candidate_bytes = kDefaultMaxCandidateBytes);

    // sanitize
    //   candidate: 생성기 원문. std::nullopt 은 "응답 없음"을 뜻한다.
    [[nodiscard]] SanitizeVerdict sanitize(std::optional<std::string_view> candidate) const;

    // 상한을 호출마다 지정하는 오버로드.
    [[nodiscard]] SanitizeVerdict sanitize(std::optional<std::string_view> candidate,
                                           std::uint32_t                   row_limit_cap) const;

    [[nodiscard]] std::uint32_t row_limit_cap() const noexcept { return row_limit_cap_; }

    [[nodiscard]] std::size_t max_candidate_bytes() const noexcept { return max_candidate_bytes_; }

    [[nodiscard]] const StatementSafetyCheck& safety_check() const noexcept { return *check_; }

private:
    std::uint32_t                               row_limit_cap_;
    std::size_t                                 max_candidate_bytes_;
    std::shared_ptr<const StatementSafetyCheck> check_;
};

// strip_sql_artifacts
//   코드 펜스/언어 태그/끝 세미콜론을 제거하고 앞뒤 공백을 자른다.
//   SqlGuardrail 내부 2단계와 동일. 로그 미리보기 등에 재사용한다.
[[nodiscard]] std::string strip_sql_artifacts(std::string_view candidate);
