#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// GuardErrorCode
//   SQL 가드레일 / 식별자 검증 단계에서 발생 가능한 거부 사유 분류.
//   모든 값은 "예상된 입력"에 대한 판정이며 프로그램 오류가 아니다.
// ---------------------------------------------------------------------------
enum class GuardErrorCode : std::uint8_t {
    kEmptyInput         = 0,  // 입력 없음 또는 공백/아티팩트만 존재
    kNonSelectOrUnsafe  = 1,  // (WITH ... AS (...))* SELECT 로 시작하지 않음
    kForbiddenKeyword   = 2,  // 변경/관리 키워드가 단어 단위로 포함됨
    kExcessiveLimit     = 3,  // 명시적 LIMIT 값이 상한 초과
    kInvalidIdentifier  = 4,  // 식별자 문자 규칙 위반 또는 시스템 이름 (식별자 검증 전용)
};

// ---------------------------------------------------------------------------
// GuardError
//   거부 시 반환되는 오류 정보.
//   std::expected<T, GuardError> 패턴과 함께 사용한다.
//   message/context 는 로깅용이며, 최종 사용자 메시지는 호출자(오케스트레이터)가 만든다.
// ---------------------------------------------------------------------------
struct GuardError {
    GuardErrorCode code{GuardErrorCode::kNonSelectOrUnsafe};
    std::string    message{};  // 사람이 읽을 수 있는 거부 설명
    std::string    context{};  // 거부를 유발한 키워드/값/이름 단편
};

// to_string
//   로그/CLI 출력용 고정 이름. 값이 바뀌면 하위 호환이 깨지므로 변경 금지.
[[nodiscard]] constexpr std::string_view to_string(GuardErrorCode code) noexcept {
    switch (code) {
        case GuardErrorCode::kEmptyInput:        return "empty_sql";
        case GuardErrorCode::kNonSelectOrUnsafe: return "non_select_or_unsafe";
        case GuardErrorCode::kForbiddenKeyword:  return "forbidden_keyword";
        case GuardErrorCode::kExcessiveLimit:    return "excessive_limit";
        case GuardErrorCode::kInvalidIdentifier: return "invalid_identifier";
    }
    return "unknown";
}
