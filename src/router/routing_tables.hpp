#pragma once

// ---------------------------------------------------------------------------
// routing_tables.hpp
//
// QueryRouter 가 사용하는 분류 신호 테이블 (헤더만, 판정 로직 없음).
//
// [설계 원칙]
// - 프로세스 시작 시 한 번 만들고 이후 변경하지 않는다.
//   QueryRouter 에 std::shared_ptr<const RoutingTables> 로 전달한다.
// - 패턴 순서는 의미가 없으나(점수는 매칭 개수) 로그 재현성을 위해 유지한다.
// - 키워드는 소문자로 보관한다. 질문 토큰도 소문자로 비교한다.
// ---------------------------------------------------------------------------

#include <string>
#include <unordered_set>
#include <vector>

struct RoutingTables {
    std::vector<std::string>        simple_patterns{};   // 단순 조회 의도 정규식
    std::vector<std::string>        complex_patterns{};  // 분석/인과 의도 정규식
    std::unordered_set<std::string> simple_keywords{};
    std::unordered_set<std::string> complex_keywords{};
    std::unordered_set<std::string> interrogatives{};    // 규칙 4: 의문사
};

// 기본 테이블. 값 복사본을 반환한다.
[[nodiscard]] RoutingTables default_routing_tables();
