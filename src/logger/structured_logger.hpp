#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 가드레일/라우터 자체는 로거를 모른다. CLI 드라이버가 판정 결과를 기록한다.
//
// [JSON 스키마]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
//   sql_verdict: event, accepted, safety_mode, candidate_sql, normalized_sql,
//                error_code, reason, timestamp, duration_us
//   route:       event, category, confidence, rule, rationale, simple_score,
//                complex_score, question, timestamp, duration_us
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// escape_json_string
//   JSON 문자열 값으로 쓸 수 있게 이스케이프한다. 제어 문자는 \uXXXX.
//   CLI 의 route 출력도 같은 함수를 쓴다.
[[nodiscard]] std::string escape_json_string(std::string_view raw);

// ---------------------------------------------------------------------------
// StructuredLogger
//   VerdictLog / RouteLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level   : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path    : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   echo_stderr : true 이면 stderr 에도 출력 (CLI 는 stdout 을 결과용으로 쓴다)
    //   초기화 실패 시 std::runtime_error.
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     bool                         echo_stderr = false);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_verdict
    //   허용은 info, 거부는 warn 레벨로 기록한다.
    void log_verdict(const VerdictLog& entry);

    // log_route
    //   info 레벨로 기록한다.
    void log_route(const RouteLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

private:
    [[nodiscard]] bool enabled(LogLevel level) const;
    void write(LogLevel level, std::string_view line);

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
