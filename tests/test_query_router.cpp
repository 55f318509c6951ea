// ---------------------------------------------------------------------------
// test_query_router.cpp
//
// QueryRouter 단위 테스트.
//
// [테스트 범위]
// - 판정 규칙 1~7 각각 (기본 테이블 기준 점수를 주석에 기록)
// - 대소문자 / 문장부호 / 중복 키워드 처리
// - 전함수성: 어떤 입력에도 [0, 1] 신뢰도 판정
// - 사용자 정의 테이블, 잘못된 정규식 건너뛰기, nullptr 테이블
// - should_use_analysis 문구
//
// [주의]
// - 기본 테이블을 바꾸면 아래 점수 주석과 기대값을 함께 갱신해야 한다.
// ---------------------------------------------------------------------------

#include "router/query_router.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// 판정 규칙
// ---------------------------------------------------------------------------

TEST(QueryRouter, ShowTopCustomersIsStrongSimple) {
    const QueryRouter router;
    // simple: show 패턴, top N 패턴, 키워드 show/top = 4
    const auto decision = router.route("show top 10 customers");
    EXPECT_EQ(decision.category, QueryCategory::kSimple);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.9);
    EXPECT_EQ(decision.rule, RoutingRule::kStrongSimple);
    EXPECT_EQ(decision.simple_score, 4);
    EXPECT_EQ(decision.complex_score, 0);
    EXPECT_EQ(decision.question_length, 4U);
    EXPECT_EQ(decision.rationale, "Strong simple query patterns detected");
}

TEST(QueryRouter, WhyDidRevenueDropIsStrongComplex) {
    const QueryRouter router;
    // complex: why did 패턴, what factors 패턴, 키워드 why = 3
    const auto decision = router.route("why did revenue drop in Q3 and what factors contributed");
    EXPECT_EQ(decision.category, QueryCategory::kComplex);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.9);
    EXPECT_EQ(decision.rule, RoutingRule::kStrongComplex);
    EXPECT_EQ(decision.simple_score, 0);
    EXPECT_EQ(decision.complex_score, 3);
    EXPECT_EQ(decision.rationale, "Strong complex analysis patterns detected");
}

TEST(QueryRouter, ShortQuestionWithSimpleSignal) {
    const QueryRouter router;
    // simple: list 패턴, 키워드 list = 2
    const auto decision = router.route("list customers");
    EXPECT_EQ(decision.category, QueryCategory::kSimple);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.8);
    EXPECT_EQ(decision.rule, RoutingRule::kShortSimple);
    EXPECT_EQ(decision.simple_score, 2);
}

TEST(QueryRouter, LongInterrogativeQuestion) {
    const QueryRouter router;
    // 점수 0/0, 13 토큰, 의문사 where
    const auto decision =
        router.route("where do the folks in the northern office usually eat lunch on fridays");
    EXPECT_EQ(decision.category, QueryCategory::kComplex);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.7);
    EXPECT_EQ(decision.rule, RoutingRule::kLongInterrogative);
    EXPECT_EQ(decision.simple_score, 0);
    EXPECT_EQ(decision.complex_score, 0);
    EXPECT_EQ(decision.question_length, 13U);
    EXPECT_EQ(decision.rationale, "Long analytical question");
}

TEST(QueryRouter, SimpleLeaning) {
    const QueryRouter router;
    // simple: display 패턴, 키워드 display = 2, 7 토큰
    const auto decision = router.route("please display revenue numbers for each region");
    EXPECT_EQ(decision.category, QueryCategory::kSimple);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.6);
    EXPECT_EQ(decision.rule, RoutingRule::kSimpleLeaning);
    EXPECT_EQ(decision.simple_score, 2);
    EXPECT_EQ(decision.complex_score, 0);
}

TEST(QueryRouter, ComplexLeaning) {
    const QueryRouter router;
    // complex: 키워드 understand = 1, 8 토큰
    const auto decision = router.route("i would like to understand seasonal revenue changes");
    EXPECT_EQ(decision.category, QueryCategory::kComplex);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.6);
    EXPECT_EQ(decision.rule, RoutingRule::kComplexLeaning);
    EXPECT_EQ(decision.complex_score, 1);
}

TEST(QueryRouter, TieDefaultsToSimple) {
    const QueryRouter router;
    // 키워드 recent(simple) / cause(complex) = 1 : 1, 9 토큰
    const auto decision = router.route("the recent cause of these delays on our side");
    EXPECT_EQ(decision.category, QueryCategory::kSimple);
    EXPECT_DOUBLE_EQ(decision.confidence, 0.5);
    EXPECT_EQ(decision.rule, RoutingRule::kTieDefault);
    EXPECT_EQ(decision.simple_score, 1);
    EXPECT_EQ(decision.complex_score, 1);
    EXPECT_EQ(decision.rationale, "Ambiguous question - defaulting to simple");
}

TEST(QueryRouter, EmptyQuestionIsTie) {
    const QueryRouter router;
    for (const char* question : {"", "   ", "\t\n"}) {
        SCOPED_TRACE(question);
        const auto decision = router.route(question);
        EXPECT_EQ(decision.category, QueryCategory::kSimple);
        EXPECT_DOUBLE_EQ(decision.confidence, 0.5);
        EXPECT_EQ(decision.rule, RoutingRule::kTieDefault);
        EXPECT_EQ(decision.question_length, 0U);
    }
}

// ---------------------------------------------------------------------------
// 토큰 처리
// ---------------------------------------------------------------------------

TEST(QueryRouter, CaseInsensitive) {
    const QueryRouter router;
    const auto lower = router.route("show top 10 customers");
    const auto upper = router.route("SHOW TOP 10 CUSTOMERS");
    EXPECT_EQ(upper.category, lower.category);
    EXPECT_EQ(upper.rule, lower.rule);
    EXPECT_EQ(upper.simple_score, lower.simple_score);
}

TEST(QueryRouter, PunctuationIsStrippedForKeywords) {
    const QueryRouter router;
    // "why?" → 키워드 why
    const auto decision = router.route("Why?");
    EXPECT_EQ(decision.complex_score, 1);
    EXPECT_EQ(decision.category, QueryCategory::kComplex);
    EXPECT_EQ(decision.rule, RoutingRule::kComplexLeaning);
}

TEST(QueryRouter, RepeatedKeywordCountsOnce) {
    const QueryRouter router;
    const auto decision = router.route("why why why");
    EXPECT_EQ(decision.complex_score, 1);
    EXPECT_EQ(decision.question_length, 3U);
}

TEST(QueryRouter, QuestionLengthCountsWhitespaceTokens) {
    const QueryRouter router;
    EXPECT_EQ(router.route("  show   top 10  ").question_length, 3U);
}

// ---------------------------------------------------------------------------
// 전함수성
// ---------------------------------------------------------------------------

TEST(QueryRouter, EveryInputGetsABoundedDecision) {
    const QueryRouter router;
    const std::vector<std::string> questions = {
        "",
        "?!?!",
        "지난 분기 매출이 왜 떨어졌나요",
        std::string(5000, 'a'),
        "((([[[ .* \\ $",
        "top 5 top 5 top 5 why why analyze",
        "show" + std::string(100000, ' ') + "me",
        "impact of " + std::string(100000, 'a') + " on sales",
        std::string(150000, 'x'),
    };
    for (const auto& q : questions) {
        const auto decision = router.route(q);
        EXPECT_GE(decision.confidence, 0.0);
        EXPECT_LE(decision.confidence, 1.0);
        EXPECT_FALSE(decision.rationale.empty());
    }
}

TEST(QueryRouter, SameInputSameDecision) {
    const QueryRouter router;
    const auto a = router.route("what trends should we watch in churn");
    const auto b = router.route("what trends should we watch in churn");
    EXPECT_EQ(a.category, b.category);
    EXPECT_EQ(a.rule, b.rule);
    EXPECT_EQ(a.simple_score, b.simple_score);
    EXPECT_EQ(a.complex_score, b.complex_score);
}

TEST(QueryRouter, WhitespaceRunsDoNotChangePatternScores) {
    const QueryRouter router;
    const auto decision = router.route("show" + std::string(100000, ' ') + "top 10\n\n\tcustomers");
    EXPECT_EQ(decision.simple_score, 4);
    EXPECT_EQ(decision.rule, RoutingRule::kStrongSimple);
    EXPECT_EQ(decision.question_length, 4U);
}

TEST(QueryRouter, PatternsSeeOnlyTheLeadingBytes) {
    const QueryRouter router;
    // "why did" 는 패턴 범위 밖, 키워드 why 는 질문 전체에서 센다
    const auto decision = router.route(std::string(kMaxPatternInputBytes + 100, 'x') + " why did");
    EXPECT_EQ(decision.complex_score, 1);
    EXPECT_EQ(decision.question_length, 3U);
}

// ---------------------------------------------------------------------------
// 기본 패턴의 단어 경계
// ---------------------------------------------------------------------------

TEST(QueryRouter, OptimizationPatternNeedsWordStart) {
    const QueryRouter router;
    EXPECT_EQ(router.route("optimization").complex_score, 1);
    EXPECT_EQ(router.route("optimize").complex_score, 2);  // 패턴 + 키워드
    EXPECT_EQ(router.route("reoptimization").complex_score, 0);
}

TEST(QueryRouter, AnomalyPatternNeedsWordStart) {
    const QueryRouter router;
    EXPECT_EQ(router.route("anomalies").complex_score, 1);
    EXPECT_EQ(router.route("unexpectedly").complex_score, 1);
    EXPECT_EQ(router.route("nonanomalous").complex_score, 0);
}

// ---------------------------------------------------------------------------
// 테이블 주입
// ---------------------------------------------------------------------------

TEST(QueryRouter, DefaultTablesCompileCompletely) {
    const QueryRouter router;
    EXPECT_EQ(router.simple_pattern_count(), router.tables().simple_patterns.size());
    EXPECT_EQ(router.complex_pattern_count(), router.tables().complex_patterns.size());
}

TEST(QueryRouter, InvalidPatternIsSkipped) {
    auto tables = std::make_shared<RoutingTables>();
    tables->simple_patterns  = {"(unclosed", R"(\bfoo\b)"};
    tables->complex_patterns = {"[z-a]"};

    const QueryRouter router(tables);
    EXPECT_EQ(router.simple_pattern_count(), 1U);
    EXPECT_EQ(router.complex_pattern_count(), 0U);

    const auto decision = router.route("foo");
    EXPECT_EQ(decision.simple_score, 1);
    EXPECT_EQ(decision.rule, RoutingRule::kShortSimple);
}

TEST(QueryRouter, CustomKeywordsAndInterrogatives) {
    auto tables = std::make_shared<RoutingTables>();
    tables->complex_keywords = {"churn", "cohort"};
    tables->interrogatives   = {"wie"};

    const QueryRouter router(tables);
    const auto keywords = router.route("churn by cohort");
    EXPECT_EQ(keywords.complex_score, 2);
    EXPECT_EQ(keywords.category, QueryCategory::kComplex);

    const auto long_question =
        router.route("wie hoch war der umsatz im letzten quartal in allen regionen insgesamt");
    EXPECT_EQ(long_question.rule, RoutingRule::kLongInterrogative);
}

TEST(QueryRouter, NullTablesBehaveAsEmpty) {
    const QueryRouter router(nullptr);
    EXPECT_EQ(router.simple_pattern_count(), 0U);
    EXPECT_EQ(router.complex_pattern_count(), 0U);

    const auto decision = router.route("show top 10 customers");
    EXPECT_EQ(decision.simple_score, 0);
    EXPECT_EQ(decision.rule, RoutingRule::kTieDefault);
}

// ---------------------------------------------------------------------------
// should_use_analysis
// ---------------------------------------------------------------------------

TEST(QueryRouter, AnalysisAdviceForConfidentComplex) {
    const QueryRouter router;
    const auto advice =
        router.should_use_analysis("why did revenue drop in Q3 and what factors contributed");
    EXPECT_TRUE(advice.use_analysis);
    EXPECT_EQ(advice.explanation, "Complex analytical question (confidence: 90.0%)");
}

TEST(QueryRouter, AnalysisAdviceForLowConfidenceComplex) {
    const QueryRouter router;
    const auto advice =
        router.should_use_analysis("i would like to understand seasonal revenue changes");
    EXPECT_TRUE(advice.use_analysis);
    EXPECT_EQ(advice.explanation, "Likely complex question (confidence: 60.0%)");

    const auto lowered =
        router.should_use_analysis("i would like to understand seasonal revenue changes", 0.5);
    EXPECT_EQ(lowered.explanation, "Complex analytical question (confidence: 60.0%)");
}

TEST(QueryRouter, AnalysisAdviceForSimple) {
    const QueryRouter router;
    const auto advice = router.should_use_analysis("show top 10 customers");
    EXPECT_FALSE(advice.use_analysis);
    EXPECT_EQ(advice.explanation, "Simple data query (confidence: 90.0%)");
}

// ---------------------------------------------------------------------------
// 문자열 표현
// ---------------------------------------------------------------------------

TEST(QueryRouter, WireNames) {
    EXPECT_EQ(to_string(QueryCategory::kSimple), "simple");
    EXPECT_EQ(to_string(QueryCategory::kComplex), "complex");
    EXPECT_EQ(to_string(RoutingRule::kStrongSimple), "strong_simple");
    EXPECT_EQ(to_string(RoutingRule::kLongInterrogative), "long_interrogative");
    EXPECT_EQ(to_string(RoutingRule::kTieDefault), "tie_default");
}
