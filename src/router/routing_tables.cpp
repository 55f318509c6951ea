// ---------------------------------------------------------------------------
// routing_tables.cpp
//
// 기본 분류 신호. 질문은 소문자로 변환된 뒤 icase 로 매칭된다.
//
// [오탐/미탐 트레이드오프]
// - "show/list/get" 은 분석 질문 앞머리에도 흔하다 ("show me why ...").
//   단순 점수가 올라가지만 complex 패턴이 함께 잡히면 규칙 1 은 적용되지 않는다.
// - "project" 는 예측(forecast) 의미로 complex 에 포함되어 있어
//   "list projects" 같은 질문에서 complex 점수 1 이 오른다.
// ---------------------------------------------------------------------------

#include "router/routing_tables.hpp"

RoutingTables default_routing_tables() {
    RoutingTables tables;

    tables.simple_patterns = {
        // 직접 조회
        R"(\b(show|list|display|get)\s+(?:me\s+)?(the\s+)?)",
        R"(\btop\s+\d+)",
        R"(\bbottom\s+\d+)",
        R"(\bfirst\s+\d+)",
        R"(\blast\s+\d+)",
        R"(\bhow\s+many)",
        R"(\bcount\s+(?:of\s+)?)",
        R"(\bsum\s+(?:of\s+)?)",
        R"(\baverage\s+(?:of\s+)?)",
        R"(\bmax(?:imum)?\s+)",
        R"(\bmin(?:imum)?\s+)",

        // 특정 값 조회
        R"(\bwhat\s+(?:is|are)\s+the\s+(?:name|title|value|amount))",
        R"(\bwhich\s+(?:driver|team|customer|product|user))",
        R"(\bwho\s+(?:won|has|is))",
        R"(\bwhen\s+(?:did|was))",
        R"(\bwhere\s+(?:is|are|did))",

        // 단순 집계
        R"(\btotal\s+(?:sales|revenue|orders|count))",
        R"(\ball\s+(?:customers|products|orders|users))",

        // 단순 비교
        R"(\bcompare\s+\w+\s+(?:and|vs|versus)\s+\w+)",
    };

    tables.complex_patterns = {
        // 원인 분석
        R"(\bwhy\s+(?:did|is|are|has|have))",
        R"(\bwhat\s+(?:caused|drove|contributed|led\s+to))",
        R"(\bwhat\s+(?:factors|reasons|causes))",

        // 분석/탐색
        R"(\b(?:analyze|analyse|investigate|examine|explore)\b)",
        R"(\bwhat\s+patterns?\b)",
        R"(\bwhat\s+trends?\b)",
        R"(\bwhat\s+insights?\b)",
        R"(\bwhat\s+should\s+i\s+know)",
        R"(\btell\s+me\s+about\s+(?:the\s+)?(?:data|dataset|performance|business))",
        R"(\bexplain\s+(?:the\s+)?(?:data|dataset|trends|patterns))",

        // 비즈니스 인텔리전스
        R"(\bhow\s+(?:is|are)\s+(?:we|our|the\s+business|performance))",
        R"(\bwhat\s+(?:drives|affects|influences|impacts))",
        R"(\bhow\s+(?:can|should|do)\s+(?:we|i)\s+improve)",
        R"(\b(?:optimize|optimization))",
        R"(\b(?:strategy|strategic))",

        // 다차원 분석
        R"(\brelationship\s+between)",
        R"(\bcorrelation\s+(?:between|with))",
        R"(\bimpact\s+of\s+\w+\s+on)",
        R"(\b(?:predict|forecast|project))",

        // 성과 비교
        R"(\bbetter\s+(?:than|performing))",
        R"(\bworst\s+performing)",
        R"(\bbest\s+performing)",
        R"(\bperformance\s+(?:analysis|comparison))",

        // 열린 질문
        R"(\bwhat\s+(?:else|other|more))",
        R"(\banything\s+(?:else|interesting|unusual))",
        R"(\b(?:surprising|unexpected|anomal))",
    };

    tables.simple_keywords = {
        "list", "show", "display", "count", "total", "sum", "average", "max", "min",
        "first", "last", "top", "bottom", "all", "latest", "recent", "name", "title",
    };

    tables.complex_keywords = {
        "why", "analyze", "investigate", "pattern", "trend", "factor", "cause",
        "insight", "understand", "explain", "explore", "relationship", "impact",
        "performance", "optimize", "strategy", "improve", "predict", "forecast",
    };

    tables.interrogatives = {"why", "how", "what", "when", "where", "who"};

    return tables;
}
