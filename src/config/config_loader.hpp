#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 GuardConfig 로 로드하고, 런타임 구성요소를 조립하는 헬퍼.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message). 부분 설정을 반환하지 않는다.
// - 파싱 실패 원인은 로깅하되 YAML 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// config_loader.hpp → guard_config.hpp (단방향)
// ❌ guard_config.hpp → config_loader.hpp 금지
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

#include "guard_config.hpp"
#include "router/routing_tables.hpp"

class ConfigLoader {
public:
    // load
    //   파일 없음, YAML 오류, 값 검증 실패 모두 std::unexpected.
    //   [검증]
    //   - guardrail.row_limit_cap > 0
    //   - router.analysis_threshold ∈ [0, 1]
    //   - guardrail.safety_mode 가 알 수 없는 값이면 경고 후 "pattern"
    //   - router 정규식 오류는 경고만 (QueryRouter 가 건너뜀)
    [[nodiscard]] static std::expected<GuardConfig, std::string>
    load(const std::filesystem::path& config_path);

    // apply_env_overrides
    //   SQLGATE_ROW_LIMIT_CAP, SQLGATE_LOG_LEVEL, SQLGATE_LOG_PATH 로 덮어쓴다.
    //   잘못된 값은 경고 후 무시한다.
    static void apply_env_overrides(GuardConfig& config);
};

// make_routing_tables
//   RouterConfig 의 비어 있지 않은 목록으로 기본 테이블을 대체한다.
//   키워드는 소문자로 정규화한다.
[[nodiscard]] std::shared_ptr<const RoutingTables> make_routing_tables(const RouterConfig& config);
