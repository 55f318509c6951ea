// ---------------------------------------------------------------------------
// sql_guardrail.cpp
//
// SQL 후보 판정/정규화 구현.
// 순서와 거부 사유는 헤더의 판정 순서를 그대로 따른다.
// ---------------------------------------------------------------------------

#include "guard/sql_guardrail.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "guard/sql_lexer.hpp"

namespace {

// 문자열의 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한다.
std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

std::string_view trim_left(std::string_view s) {
    const auto begin = std::find_if(s.begin(), s.end(),
                                    [](unsigned char c) { return std::isspace(c) == 0; });
    return s.substr(static_cast<std::size_t>(begin - s.begin()));
}

// LIMIT <n> 또는 LIMIT <offset>, <count> (MySQL/SQLite 형식)
// 두 번째 그룹이 있으면 그것이 행 수다.
const std::regex& limit_clause_regex() {
    static const std::regex kLimitClause(
        R"(\bLIMIT\s+(\d+)(?:\s*,\s*(\d+))?)",
        std::regex_constants::icase | std::regex_constants::ECMAScript
    );
    return kLimitClause;
}

}  // namespace

// ---------------------------------------------------------------------------
// strip_sql_artifacts
// ---------------------------------------------------------------------------
std::string strip_sql_artifacts(std::string_view candidate) {
    std::string_view s = trim(candidate);

    // 코드 펜스: 양끝 백틱 전부 제거 (```sql ... ```, `SELECT 1`)
    while (!s.empty() && s.front() == '`') {
        s.remove_prefix(1);
    }
    while (!s.empty() && s.back() == '`') {
        s.remove_suffix(1);
    }

    // 선두 언어 태그 줄. 뒤 공백을 먼저 자르면 "sql\n" 이 "sql" 이 되므로 왼쪽만 자른다.
    static const std::regex kLanguageTag(
        R"(^(?:sql|sqlite|postgresql|postgres|mysql)[ \t]*(?:\r?\n|$))",
        std::regex_constants::icase | std::regex_constants::ECMAScript
    );
    const std::string untagged = std::regex_replace(
        std::string(trim_left(s)), kLanguageTag, "",
        std::regex_constants::format_first_only);

    // 끝 종결자는 공백과 섞여 있어도 전부 제거한다 ("...;;", "...; ;")
    std::string_view body = trim(untagged);
    while (!body.empty() && body.back() == ';') {
        body.remove_suffix(1);
        body = trim(body);
    }
    return std::string(body);
}

// ---------------------------------------------------------------------------
// SqlGuardrail
// ---------------------------------------------------------------------------
SqlGuardrail::SqlGuardrail(std::uint32_t row_limit_cap,
                           std::shared_ptr<const StatementSafetyCheck> check,
                           std::size_t max_candidate_bytes)
    : row_limit_cap_(row_limit_cap)
    , max_candidate_bytes_(max_candidate_bytes)
    , check_(check ? std::move(check) : std::make_shared<const PatternSafetyCheck>())
{
    if (row_limit_cap_ == 0) {
        spdlog::warn("sql_guardrail: row_limit_cap is 0, every explicit LIMIT above 0 "
                     "will be rejected");
    }
}

SanitizeVerdict SqlGuardrail::sanitize(std::optional<std::string_view> candidate) const {
    return sanitize(candidate, row_limit_cap_);
}

SanitizeVerdict SqlGuardrail::sanitize(std::optional<std::string_view> candidate,
                                       std::uint32_t                   row_limit_cap) const {
    // 1. 빈 입력
    if (!candidate.has_value()) {
        return std::unexpected(GuardError{
            GuardErrorCode::kEmptyInput,
            "No SQL candidate was produced",
            ""
        });
    }
    if (trim(*candidate).empty()) {
        return std::unexpected(GuardError{
            GuardErrorCode::kEmptyInput,
            "SQL candidate is blank",
            ""
        });
    }

    // std::regex 는 재귀 역추적이라 긴 입력에서 스택이 넘친다. 정규식 전에 자른다.
    if (candidate->size() > max_candidate_bytes_) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "SQL candidate exceeds the maximum length of " +
                std::to_string(max_candidate_bytes_) + " bytes",
            std::to_string(candidate->size())
        });
    }

    // 2. 아티팩트 제거
    std::string statement = strip_sql_artifacts(*candidate);
    if (statement.empty()) {
        return std::unexpected(GuardError{
            GuardErrorCode::kEmptyInput,
            "SQL candidate contains only formatting artifacts",
            ""
        });
    }

    // 3~4. 허용 앵커 + 금지 키워드
    if (auto safe = check_->check(statement, *candidate); !safe) {
        spdlog::debug("sql_guardrail: rejected by {} check: {} ({})",
                      check_->name(), safe.error().message, safe.error().context);
        return std::unexpected(std::move(safe.error()));
    }

    // 5. LIMIT 검사: 리터럴/주석을 가린 사본에서 찾는다
    const SqlScan scan = scan_sql(statement);
    if (scan.end_state == SqlScanEnd::kInBlockComment) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "Statement ends inside an unterminated block comment",
            ""
        });
    }
    // 덧붙인 LIMIT 가 리터럴 안으로 들어가므로 거부한다
    if (scan.end_state == SqlScanEnd::kInLiteral) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "Statement ends inside an unterminated string literal or quoted identifier",
            ""
        });
    }

    bool has_limit = false;
    auto it = std::sregex_iterator(scan.masked.begin(), scan.masked.end(), limit_clause_regex());
    const auto end_it = std::sregex_iterator();
    for (; it != end_it; ++it) {
        const std::smatch& m = *it;
        has_limit = true;

        const std::string digits = m[2].matched ? m[2].str() : m[1].str();
        std::uint64_t value{0};
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        // 범위 초과(result_out_of_range)도 상한 초과로 본다
        if (ec != std::errc{} || value > row_limit_cap) {
            return std::unexpected(GuardError{
                GuardErrorCode::kExcessiveLimit,
                "LIMIT exceeds the configured row cap of " + std::to_string(row_limit_cap),
                digits
            });
        }
    }

    if (!has_limit) {
        // -- 주석으로 끝나는 문장에 같은 줄로 붙이면 LIMIT 가 주석이 된다
        statement += (scan.end_state == SqlScanEnd::kInLineComment) ? "\nLIMIT " : " LIMIT ";
        statement += std::to_string(row_limit_cap);
    }

    // 6. 허용
    return statement;
}
