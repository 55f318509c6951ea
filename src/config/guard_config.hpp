#pragma once

// ---------------------------------------------------------------------------
// guard_config.hpp
//
// sqlgate 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/sqlgate.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. YAML 에 없는 필드는 기본값 유지.
// - 빈 목록은 "내장 기본값 사용"을 뜻한다 (router 패턴/키워드, 예약 이름).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/sqlgate.log"};
};

// ---------------------------------------------------------------------------
// GuardrailConfig
//   row_limit_cap: LIMIT 상한이자 LIMIT 없는 문장에 추가할 값. 0 불가.
//   safety_mode  : "pattern" (기본) | "strict"
//   max_candidate_bytes: 후보 원문 최대 길이. 초과 시 거부. 0 불가.
// ---------------------------------------------------------------------------
struct GuardrailConfig {
    std::uint32_t row_limit_cap{500};
    std::string   safety_mode{"pattern"};
    std::uint32_t max_candidate_bytes{8192};
};

// ---------------------------------------------------------------------------
// IdentifierConfig
//   reserved_names 가 비어 있으면 내장 기본 목록을 사용한다.
//   값이 있으면 기본 목록을 대체한다 (병합하지 않음).
// ---------------------------------------------------------------------------
struct IdentifierConfig {
    std::vector<std::string> reserved_names{};
};

// ---------------------------------------------------------------------------
// RouterConfig
//   각 목록이 비어 있으면 내장 기본값, 값이 있으면 해당 목록만 대체한다.
//   analysis_threshold: should_use_analysis 의 신뢰도 기준 [0, 1]
// ---------------------------------------------------------------------------
struct RouterConfig {
    double                   analysis_threshold{0.7};
    std::vector<std::string> simple_patterns{};
    std::vector<std::string> complex_patterns{};
    std::vector<std::string> simple_keywords{};
    std::vector<std::string> complex_keywords{};
};

// ---------------------------------------------------------------------------
// GuardConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 가 반환한다.
// ---------------------------------------------------------------------------
struct GuardConfig {
    GlobalConfig     global{};
    GuardrailConfig  guardrail{};
    IdentifierConfig identifiers{};
    RouterConfig     router{};
};
