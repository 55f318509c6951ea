#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - guard/, router/ 헤더를 include 하지 않는다.
// - 판정 결과는 호출자가 문자열(to_string)로 변환해 채운다.
//
// [민감정보 취급 주의]
// - candidate_sql / question 은 생성기/사용자 원문이다. 운영 환경에서 로그
//   레벨/보존 정책을 별도로 적용할 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug"|"info"|"warn"|"error" 외 값은 kInfo.
[[nodiscard]] LogLevel parse_log_level(const std::string& level);

// ---------------------------------------------------------------------------
// VerdictLog
//   SqlGuardrail::sanitize 판정 1건.
//   accepted == true  → normalized_sql 유효, error_code 빈 값
//   accepted == false → error_code/reason 유효, normalized_sql 빈 값
// ---------------------------------------------------------------------------
struct VerdictLog {
    std::string                                candidate_sql{};   // 원문 (마스킹 주의)
    bool                                       accepted{false};
    std::string                                normalized_sql{};
    std::string                                error_code{};      // to_string(GuardErrorCode)
    std::string                                reason{};          // GuardError::message
    std::string                                safety_mode{};     // "pattern" | "strict"
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};       // 판정 소요 시간
};

// ---------------------------------------------------------------------------
// RouteLog
//   QueryRouter::route 판정 1건.
// ---------------------------------------------------------------------------
struct RouteLog {
    std::string                                question{};        // 원문 (마스킹 주의)
    std::string                                category{};        // "simple" | "complex"
    double                                     confidence{0.0};
    std::string                                rule{};            // to_string(RoutingRule)
    std::string                                rationale{};
    int                                        simple_score{0};
    int                                        complex_score{0};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};
};
