// ---------------------------------------------------------------------------
// statement_safety_check.cpp
//
// 허용 앵커 + 금지 키워드 스캔(PatternSafetyCheck)과
// 리터럴/주석 상태 머신 기반 추가 검사(StrictSafetyCheck) 구현.
//
// [오탐/미탐 트레이드오프]
// - Pattern: 리터럴 안의 "drop" 도 차단 (false positive), 금지 키워드 없는
//   두 번째 문장은 통과 (false negative). 헤더의 한계 목록 참고.
// - Strict: 주석이 포함된 정상 쿼리도 차단 (false positive 증가).
//   생성 모델에는 주석 없는 단일 문장만 요구하므로 실제 영향은 작다.
// ---------------------------------------------------------------------------

#include "guard/statement_safety_check.hpp"

#include <cctype>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "guard/sql_lexer.hpp"

namespace {

constexpr auto kRegexFlags = std::regex_constants::icase | std::regex_constants::ECMAScript;

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_word(char c)  { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

std::size_t skip_spaces(std::string_view s, std::size_t pos) {
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }
    return pos;
}

// pos 에서 keyword 가 대소문자 무시로 시작하고 뒤가 단어 문자가 아닌가
bool keyword_at(std::string_view s, std::size_t pos, std::string_view keyword) {
    if (pos + keyword.size() > s.size()) {
        return false;
    }
    for (std::size_t k = 0; k < keyword.size(); ++k) {
        if (std::toupper(static_cast<unsigned char>(s[pos + k])) != keyword[k]) {
            return false;
        }
    }
    return pos + keyword.size() == s.size() || !is_word(s[pos + keyword.size()]);
}

// ---------------------------------------------------------------------------
// has_select_anchor
//   ^\s*(WITH\s+ ... AS\s*( ... )\s*)* SELECT\b 와 같은 판정을 정규식 없이 한다.
//   std::regex 는 재귀 역추적이라 긴 CTE 후보에서 스택이 넘친다.
//   - WITH 이 없으면 첫 단어가 SELECT 인지 본다.
//   - WITH 이 있으면 "AS (" 가 나온 뒤 어떤 ')' 다음(공백 허용)이 SELECT 인지 본다.
//   각 문자를 상수 번만 보므로 길이에 선형이다.
// ---------------------------------------------------------------------------
bool has_select_anchor(std::string_view sql) {
    std::size_t pos = skip_spaces(sql, 0);
    if (keyword_at(sql, pos, "SELECT")) {
        return true;
    }
    if (!keyword_at(sql, pos, "WITH")) {
        return false;
    }
    pos += 4;
    if (pos >= sql.size() || !is_space(sql[pos])) {
        return false;
    }
    pos = skip_spaces(sql, pos);

    // "AS" 뒤 공백을 건너뛰고 '(' 가 오는 첫 위치. 이름이 최소 한 글자 있어야 한다.
    std::size_t open = std::string_view::npos;
    for (std::size_t i = pos + 1; i + 1 < sql.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(sql[i])) == 'A' &&
            std::toupper(static_cast<unsigned char>(sql[i + 1])) == 'S') {
            const std::size_t after = skip_spaces(sql, i + 2);
            if (after < sql.size() && sql[after] == '(') {
                open = after;
                break;
            }
        }
    }
    if (open == std::string_view::npos) {
        return false;
    }

    for (std::size_t close = sql.find(')', open + 1); close != std::string_view::npos;
         close = sql.find(')', close + 1)) {
        if (keyword_at(sql, skip_spaces(sql, close + 1), "SELECT")) {
            return true;
        }
    }
    return false;
}

constexpr const char* kForbiddenKeywordPattern =
    R"(\b(INSERT|UPDATE|DELETE|DROP|ALTER|TRUNCATE|ATTACH|DETACH|PRAGMA)\b)";

// FROM/JOIN 뒤 첫 테이블명과 쉼표 구분 목록. 별칭 이후는 잡지 않는다.
constexpr const char* kTableReferencePattern =
    R"(\b(?:FROM|JOIN)\s+([^\s,()]+(?:\s*,\s*[^\s,()]+)*))";

// 인용 문자(" ` [ ])를 제거하고 점으로 구분된 각 부분을 돌려준다.
std::vector<std::string> split_qualified_name(std::string_view name) {
    std::vector<std::string> parts;
    std::string current;
    for (const char c : name) {
        if (c == '"' || c == '`' || c == '[' || c == ']') {
            continue;
        }
        if (c == '.') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
            }
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

}  // namespace

// ---------------------------------------------------------------------------
// PatternSafetyCheck
// ---------------------------------------------------------------------------
PatternSafetyCheck::PatternSafetyCheck()
    : forbidden_keyword_(kForbiddenKeywordPattern, kRegexFlags)
{}

std::expected<void, GuardError>
PatternSafetyCheck::check(std::string_view statement, std::string_view raw_candidate) const {
    if (!has_select_anchor(statement)) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "Statement must start with SELECT (optionally preceded by WITH ... AS (...))",
            std::string(statement.substr(0, 80))
        });
    }

    // 원문 전체 스캔: 세미콜론/주석 뒤에 숨긴 두 번째 문장도 포함
    const std::string raw(raw_candidate);
    std::smatch m;
    if (std::regex_search(raw, m, forbidden_keyword_)) {
        return std::unexpected(GuardError{
            GuardErrorCode::kForbiddenKeyword,
            "Statement contains a forbidden keyword",
            m[1].str()
        });
    }

    return {};
}

// ---------------------------------------------------------------------------
// StrictSafetyCheck
// ---------------------------------------------------------------------------
StrictSafetyCheck::StrictSafetyCheck(std::shared_ptr<const IdentifierValidator> validator)
    : validator_(validator ? std::move(validator) : std::make_shared<const IdentifierValidator>())
    , table_reference_(kTableReferencePattern, kRegexFlags)
{}

std::expected<void, GuardError>
StrictSafetyCheck::check(std::string_view statement, std::string_view raw_candidate) const {
    // 금지 키워드 판정 우선순위를 기본 모드와 동일하게 유지한다.
    if (auto base = base_.check(statement, raw_candidate); !base) {
        return base;
    }

    const SqlScan scan = scan_sql(statement);

    if (scan.end_state == SqlScanEnd::kInLiteral) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "Statement contains an unterminated string literal or quoted identifier",
            ""
        });
    }
    if (scan.has_comment) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "Statement contains an SQL comment",
            ""
        });
    }
    if (scan.has_semicolon) {
        return std::unexpected(GuardError{
            GuardErrorCode::kNonSelectOrUnsafe,
            "Multiple statements detected: semicolon outside string literal",
            ""
        });
    }

    // 리터럴/주석을 가린 사본에서 FROM/JOIN 대상만 검사 ('from sqlite_master' 문자열 오탐 방지)
    auto it = std::sregex_iterator(scan.masked.begin(), scan.masked.end(), table_reference_);
    const auto end_it = std::sregex_iterator();
    for (; it != end_it; ++it) {
        const std::string table_list = (*it)[1].str();

        std::size_t pos = 0;
        while (pos <= table_list.size()) {
            const auto comma = table_list.find(',', pos);
            const auto token = table_list.substr(
                pos, comma == std::string::npos ? std::string::npos : comma - pos);
            pos = (comma == std::string::npos) ? table_list.size() + 1 : comma + 1;

            for (const auto& part : split_qualified_name(token)) {
                const auto trimmed_begin = part.find_first_not_of(" \t\r\n");
                if (trimmed_begin == std::string::npos) {
                    continue;
                }
                const auto trimmed_end = part.find_last_not_of(" \t\r\n");
                const auto name = part.substr(trimmed_begin, trimmed_end - trimmed_begin + 1);
                if (validator_->is_reserved(name)) {
                    spdlog::debug("statement_safety_check: reserved object referenced: {}", name);
                    return std::unexpected(GuardError{
                        GuardErrorCode::kNonSelectOrUnsafe,
                        "Statement references a reserved system object",
                        name
                    });
                }
            }
        }
    }

    return {};
}

// ---------------------------------------------------------------------------
// make_statement_safety_check
// ---------------------------------------------------------------------------
std::expected<std::shared_ptr<const StatementSafetyCheck>, std::string>
make_statement_safety_check(std::string_view                           mode,
                            std::shared_ptr<const IdentifierValidator> validator) {
    if (mode == "pattern") {
        return std::make_shared<const PatternSafetyCheck>();
    }
    if (mode == "strict") {
        return std::make_shared<const StrictSafetyCheck>(std::move(validator));
    }
    return std::unexpected(
        "unknown safety mode '" + std::string(mode) + "' (expected 'pattern' or 'strict')");
}
