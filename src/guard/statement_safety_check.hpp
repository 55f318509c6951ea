#pragma once

// ---------------------------------------------------------------------------
// statement_safety_check.hpp
//
// SQL 후보 문장의 "형태 안전성" 판정 인터페이스와 구현.
// SqlGuardrail 의 3~4 단계(허용 앵커 + 금지 키워드 스캔)를 이 인터페이스 뒤에 둔다.
// 더 엄격한 구현으로 교체해도 SqlGuardrail 호출자는 바뀌지 않는다.
//
// [PatternSafetyCheck: 기본값]
// - 앵커: ^\s*(WITH <name> AS (...)\s*)*SELECT\b (대소문자 무관, 줄바꿈 포함)
// - 금지 키워드: INSERT|UPDATE|DELETE|DROP|ALTER|TRUNCATE|ATTACH|DETACH|PRAGMA
//   단어 경계 기준, 후보 원문 전체를 스캔한다 (세미콜론 뒤 두 번째 문장 포함).
//
// [설계 한계 / 알려진 우회 가능성: 의도적으로 유지]
// 1. 주석/문자열 리터럴 내부의 금지 키워드도 탐지된다:
//    SELECT 'drop' AS x → kForbiddenKeyword (false positive).
// 2. 금지 키워드가 없는 두 번째 문장은 통과한다:
//    SELECT 1; SELECT 2 → 허용 (읽기 전용 엔진이 최종 방어선).
// 3. SELECT * FROM t -- comment 같은 주석 꼬리는 기본 모드에서 허용된다.
//    정책 변경 없이 막으려면 safety_mode: strict 를 사용한다.
// 4. 인코딩 우회(hex 리터럴, 유니코드 동형 문자)는 탐지하지 못한다.
//
// [StrictSafetyCheck: 선택]
// PatternSafetyCheck 를 먼저 적용한 뒤 추가로 거부한다 (kNonSelectOrUnsafe):
// - 문자열 리터럴 밖의 주석 (--, /* */, #)
// - 문자열 리터럴 밖의 세미콜론 (멀티 스테이트먼트)
// - 닫히지 않은 문자열 리터럴
// - FROM/JOIN 뒤 예약(시스템 카탈로그) 이름 참조
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <regex>
#include <string>
#include <string_view>

#include "common/types.hpp"             // GuardError
#include "guard/identifier_validator.hpp"

// ---------------------------------------------------------------------------
// StatementSafetyCheck
//   statement    : 아티팩트(코드 펜스, 언어 태그, 끝 세미콜론) 제거 후 문장
//   raw_candidate: 생성기가 반환한 원문 그대로
//   반환         : 안전하면 void, 아니면 GuardError
// ---------------------------------------------------------------------------
class StatementSafetyCheck {
public:
    virtual ~StatementSafetyCheck() = default;

    [[nodiscard]] virtual std::expected<void, GuardError>
    check(std::string_view statement, std::string_view raw_candidate) const = 0;

    // 로그/설정 표시용 이름 ("pattern" | "strict")
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ---------------------------------------------------------------------------
// PatternSafetyCheck
//   SELECT 앵커는 선형 스캔, 금지 키워드는 생성자에서 한 번 컴파일한 정규식.
//   인스턴스를 재사용할 것.
// ---------------------------------------------------------------------------
class PatternSafetyCheck final : public StatementSafetyCheck {
public:
    PatternSafetyCheck();

    [[nodiscard]] std::expected<void, GuardError>
    check(std::string_view statement, std::string_view raw_candidate) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "pattern"; }

private:
    std::regex forbidden_keyword_;
};

// ---------------------------------------------------------------------------
// StrictSafetyCheck
//   validator 가 nullptr 이면 기본 예약 목록을 사용한다.
// ---------------------------------------------------------------------------
class StrictSafetyCheck final : public StatementSafetyCheck {
public:
    explicit StrictSafetyCheck(std::shared_ptr<const IdentifierValidator> validator = nullptr);

    [[nodiscard]] std::expected<void, GuardError>
    check(std::string_view statement, std::string_view raw_candidate) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "strict"; }

private:
    PatternSafetyCheck                         base_;
    std::shared_ptr<const IdentifierValidator> validator_;
    std::regex                                 table_reference_;
};

// make_statement_safety_check
//   mode: "pattern" | "strict". 그 외 값은 std::unexpected(설명).
[[nodiscard]] std::expected<std::shared_ptr<const StatementSafetyCheck>, std::string>
make_statement_safety_check(std::string_view                           mode,
                            std::shared_ptr<const IdentifierValidator> validator = nullptr);
