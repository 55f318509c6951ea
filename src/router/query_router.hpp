#pragma once

// ---------------------------------------------------------------------------
// query_router.hpp
//
// 자연어 질문을 단순 조회(kSimple) / 복합 분석(kComplex) 으로 분류하는
// 휴리스틱 라우터. SQL 생성 이전 단계에서 처리 전략 선택에 사용한다.
//
// [점수]
// simple_score  = 매칭된 simple 패턴 수 + 질문 토큰과 겹치는 simple 키워드 수(중복 제외)
// complex_score = 대칭
//
// [판정 규칙: 위에서부터 첫 번째 일치]
// 1. simple >= 3 && complex <= 1          → kSimple  0.9
// 2. complex >= 3 && simple <= 1          → kComplex 0.9
// 3. 토큰 <= 5 && simple > 0              → kSimple  0.8
// 4. 토큰 >= 10 && 의문사 포함            → kComplex 0.7
// 5. simple > complex                     → kSimple  0.6
// 6. complex > simple                     → kComplex 0.6
// 7. 동점 (0/0 포함)                      → kSimple  0.5  (저비용 경로 기본값)
//
// [보장]
// - 전함수: 빈 문자열 포함 모든 입력에 판정을 반환하며 예외를 던지지 않는다.
// - 같은 테이블이면 같은 입력에 같은 판정 (상태 없음).
//
// [한계]
// - 영어 전용 신호. 다른 언어 질문은 대부분 규칙 7 로 떨어진다.
// - 키워드는 토큰 단위 정확 일치다. "factors" 는 "factor" 와 다르다.
// - 정규식 패턴은 공백 연속을 한 칸으로 줄인 질문의 앞 kMaxPatternInputBytes
//   바이트에만 적용한다. 키워드/토큰 수는 질문 전체 기준.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "router/routing_tables.hpp"

// std::regex 는 재귀 역추적이라 긴 입력에서 스택이 넘친다.
inline constexpr std::size_t kMaxPatternInputBytes = 4096;

// ---------------------------------------------------------------------------
// QueryCategory
// ---------------------------------------------------------------------------
enum class QueryCategory : std::uint8_t {
    kSimple  = 0,  // 직접 조회 경로 (단일 SQL 생성)
    kComplex = 1,  // 다단계 분석 경로
};

// ---------------------------------------------------------------------------
// RoutingRule
//   판정에 사용된 규칙. 번호는 헤더 주석의 규칙 번호와 같다.
// ---------------------------------------------------------------------------
enum class RoutingRule : std::uint8_t {
    kStrongSimple      = 1,
    kStrongComplex     = 2,
    kShortSimple       = 3,
    kLongInterrogative = 4,
    kSimpleLeaning     = 5,
    kComplexLeaning    = 6,
    kTieDefault        = 7,
};

// ---------------------------------------------------------------------------
// RoutingDecision
//   질문마다 새로 만들어지며 캐시하지 않는다.
// ---------------------------------------------------------------------------
struct RoutingDecision {
    QueryCategory category{QueryCategory::kSimple};
    double        confidence{0.5};                  // [0, 1]
    RoutingRule   rule{RoutingRule::kTieDefault};
    std::string   rationale{};                      // 관측용 설명
    int           simple_score{0};
    int           complex_score{0};
    std::size_t   question_length{0};               // 공백 구분 토큰 수
};

// ---------------------------------------------------------------------------
// AnalysisAdvice
//   should_use_analysis 결과. explanation 은 사용자 안내 문구로 사용 가능.
// ---------------------------------------------------------------------------
struct AnalysisAdvice {
    bool        use_analysis{false};
    std::string explanation{};
};

[[nodiscard]] std::string_view to_string(QueryCategory category) noexcept;
[[nodiscard]] std::string_view to_string(RoutingRule rule) noexcept;

// ---------------------------------------------------------------------------
// QueryRouter
//   생성 시 패턴을 정규식으로 컴파일하고 이후 읽기 전용.
//   여러 스레드에서 동시 호출 안전.
//
//   [패턴 오류 처리]
//   - 잘못된 정규식은 경고 로그 후 건너뛴다. 해당 신호만 점수에서 빠진다.
//   - tables 가 nullptr 이면 빈 테이블로 동작한다 (모든 질문이 규칙 3~7 로 판정).
// ---------------------------------------------------------------------------
class QueryRouter {
public:
    QueryRouter();
    explicit QueryRouter(std::shared_ptr<const RoutingTables> tables);

    ~QueryRouter() = default;

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    QueryRouter(const QueryRouter&)            = delete;
    QueryRouter& operator=(const QueryRouter&) = delete;
    QueryRouter(QueryRouter&&)                 = default;
    QueryRouter& operator=(QueryRouter&&)      = default;

    [[nodiscard]] RoutingDecision route(std::string_view question) const;

    // should_use_analysis
    //   kComplex 이면 confidence 와 무관하게 true. threshold 는 설명 문구만 바꾼다.
    [[nodiscard]] AnalysisAdvice should_use_analysis(std::string_view question,
                                                     double           threshold = 0.7) const;

    [[nodiscard]] const RoutingTables& tables() const noexcept { return *tables_; }

    // 컴파일에 성공한 패턴 수 (설정 검증/테스트용)
    [[nodiscard]] std::size_t simple_pattern_count() const noexcept { return simple_.size(); }
    [[nodiscard]] std::size_t complex_pattern_count() const noexcept { return complex_.size(); }

private:
    struct CompiledPattern {
        std::string source_pattern;
        std::regex  compiled;
    };

    static std::vector<CompiledPattern> compile(const std::vector<std::string>& patterns,
                                                std::string_view                set_name);

    std::shared_ptr<const RoutingTables> tables_;
    std::vector<CompiledPattern>         simple_;
    std::vector<CompiledPattern>         complex_;
};
