// ---------------------------------------------------------------------------
// query_router.cpp
//
// 정규식 + 키워드 점수 기반 질문 분류 구현.
//
// [토큰화]
// - 질문을 소문자로 바꾸고 공백으로 분리한다.
// - 키워드/의문사 비교 시 토큰 양끝 문장부호를 제거한다 ("why?" → "why").
// - question_length 는 문장부호 제거 전 공백 구분 토큰 수다.
// - 정규식은 공백을 줄이고 길이를 제한한 사본에만 적용한다.
// ---------------------------------------------------------------------------

#include "router/query_router.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr double kConfidenceStrong    = 0.9;
constexpr double kConfidenceShort     = 0.8;
constexpr double kConfidenceLong      = 0.7;
constexpr double kConfidenceLeaning   = 0.6;
constexpr double kConfidenceAmbiguous = 0.5;

constexpr std::size_t kShortQuestionTokens = 5;
constexpr std::size_t kLongQuestionTokens  = 10;

std::string to_lower_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

// 양끝 문장부호 제거. 밑줄은 단어 문자로 본다.
std::string strip_punctuation(const std::string& token) {
    const auto is_word = [](unsigned char c) { return std::isalnum(c) != 0 || c == '_'; };
    const auto begin = std::find_if(token.begin(), token.end(), is_word);
    if (begin == token.end()) {
        return {};
    }
    const auto end = std::find_if(token.rbegin(), token.rend(), is_word).base();
    return std::string(begin, end);
}

// 패턴 매칭용 사본: 공백 연속을 한 칸으로 줄이고 길이를 제한한다.
std::string pattern_input(std::string_view lowered) {
    std::string out;
    out.reserve(std::min(lowered.size(), kMaxPatternInputBytes));
    bool in_space = false;
    for (const char c : lowered) {
        if (out.size() >= kMaxPatternInputBytes) {
            break;
        }
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!in_space && !out.empty()) {
                out += ' ';
            }
            in_space = true;
            continue;
        }
        in_space = false;
        out += c;
    }
    return out;
}

}  // namespace

std::string_view to_string(QueryCategory category) noexcept {
    switch (category) {
        case QueryCategory::kSimple:  return "simple";
        case QueryCategory::kComplex: return "complex";
    }
    return "simple";
}

std::string_view to_string(RoutingRule rule) noexcept {
    switch (rule) {
        case RoutingRule::kStrongSimple:      return "strong_simple";
        case RoutingRule::kStrongComplex:     return "strong_complex";
        case RoutingRule::kShortSimple:       return "short_simple";
        case RoutingRule::kLongInterrogative: return "long_interrogative";
        case RoutingRule::kSimpleLeaning:     return "simple_leaning";
        case RoutingRule::kComplexLeaning:    return "complex_leaning";
        case RoutingRule::kTieDefault:        return "tie_default";
    }
    return "tie_default";
}

// ---------------------------------------------------------------------------
// QueryRouter 생성자
// ---------------------------------------------------------------------------
QueryRouter::QueryRouter()
    : QueryRouter(std::make_shared<const RoutingTables>(default_routing_tables()))
{}

QueryRouter::QueryRouter(std::shared_ptr<const RoutingTables> tables)
    : tables_(std::move(tables))
{
    if (!tables_) {
        spdlog::warn("query_router: no routing tables given, every question will fall "
                     "through to the length/tie rules");
        tables_ = std::make_shared<const RoutingTables>();
    }
    simple_  = compile(tables_->simple_patterns, "simple");
    complex_ = compile(tables_->complex_patterns, "complex");
}

std::vector<QueryRouter::CompiledPattern>
QueryRouter::compile(const std::vector<std::string>& patterns, std::string_view set_name) {
    std::vector<CompiledPattern> compiled;
    compiled.reserve(patterns.size());

    for (const auto& p : patterns) {
        try {
            compiled.push_back(CompiledPattern{
                p,
                std::regex(p, std::regex_constants::icase | std::regex_constants::ECMAScript)
            });
        } catch (const std::regex_error& e) {
            spdlog::warn("query_router: invalid {} pattern '{}', skipping: {}",
                         set_name, p, e.what());
        }
    }
    return compiled;
}

// ---------------------------------------------------------------------------
// QueryRouter::route
// ---------------------------------------------------------------------------
RoutingDecision QueryRouter::route(std::string_view question) const {
    const std::string lowered = to_lower_ascii(question);

    // 1. 패턴 점수
    const std::string matched_text = pattern_input(lowered);
    const auto count_matches = [&matched_text](const std::vector<CompiledPattern>& set) {
        return static_cast<int>(std::count_if(set.begin(), set.end(), [&](const CompiledPattern& cp) {
            return std::regex_search(matched_text, cp.compiled);
        }));
    };
    const int simple_pattern_score  = count_matches(simple_);
    const int complex_pattern_score = count_matches(complex_);

    // 2. 키워드 점수 (중복 제외) + 의문사 여부
    const std::vector<std::string> tokens = split_whitespace(lowered);
    std::unordered_set<std::string> words;
    for (const auto& t : tokens) {
        auto w = strip_punctuation(t);
        if (!w.empty()) {
            words.insert(std::move(w));
        }
    }

    int  simple_keyword_score  = 0;
    int  complex_keyword_score = 0;
    bool has_interrogative     = false;
    for (const auto& w : words) {
        if (tables_->simple_keywords.contains(w)) {
            ++simple_keyword_score;
        }
        if (tables_->complex_keywords.contains(w)) {
            ++complex_keyword_score;
        }
        if (tables_->interrogatives.contains(w)) {
            has_interrogative = true;
        }
    }

    RoutingDecision decision;
    decision.simple_score    = simple_pattern_score + simple_keyword_score;
    decision.complex_score   = complex_pattern_score + complex_keyword_score;
    decision.question_length = tokens.size();

    const int simple_total  = decision.simple_score;
    const int complex_total = decision.complex_score;

    const auto decide = [&decision](QueryCategory category, double confidence,
                                    RoutingRule rule, std::string rationale) {
        decision.category   = category;
        decision.confidence = confidence;
        decision.rule       = rule;
        decision.rationale  = std::move(rationale);
    };

    // 3. 판정 규칙 (순서 중요)
    if (simple_total >= 3 && complex_total <= 1) {
        decide(QueryCategory::kSimple, kConfidenceStrong, RoutingRule::kStrongSimple,
               "Strong simple query patterns detected");
    } else if (complex_total >= 3 && simple_total <= 1) {
        decide(QueryCategory::kComplex, kConfidenceStrong, RoutingRule::kStrongComplex,
               "Strong complex analysis patterns detected");
    } else if (decision.question_length <= kShortQuestionTokens && simple_total > 0) {
        decide(QueryCategory::kSimple, kConfidenceShort, RoutingRule::kShortSimple,
               "Short question with simple patterns");
    } else if (decision.question_length >= kLongQuestionTokens && has_interrogative) {
        decide(QueryCategory::kComplex, kConfidenceLong, RoutingRule::kLongInterrogative,
               "Long analytical question");
    } else if (simple_total > complex_total) {
        decide(QueryCategory::kSimple, kConfidenceLeaning, RoutingRule::kSimpleLeaning,
               "Simple score higher than complex");
    } else if (complex_total > simple_total) {
        decide(QueryCategory::kComplex, kConfidenceLeaning, RoutingRule::kComplexLeaning,
               "Complex score higher than simple");
    } else {
        decide(QueryCategory::kSimple, kConfidenceAmbiguous, RoutingRule::kTieDefault,
               "Ambiguous question - defaulting to simple");
    }

    spdlog::debug("query_router: category={} rule={} simple={} complex={} tokens={}",
                  to_string(decision.category), to_string(decision.rule),
                  simple_total, complex_total, decision.question_length);

    return decision;
}

// ---------------------------------------------------------------------------
// QueryRouter::should_use_analysis
// ---------------------------------------------------------------------------
AnalysisAdvice QueryRouter::should_use_analysis(std::string_view question, double threshold) const {
    const RoutingDecision decision = route(question);
    const std::string confidence = fmt::format("{:.1f}%", decision.confidence * 100.0);

    if (decision.category == QueryCategory::kComplex && decision.confidence >= threshold) {
        return {true, fmt::format("Complex analytical question (confidence: {})", confidence)};
    }
    if (decision.category == QueryCategory::kComplex) {
        return {true, fmt::format("Likely complex question (confidence: {})", confidence)};
    }
    return {false, fmt::format("Simple data query (confidence: {})", confidence)};
}
