// ---------------------------------------------------------------------------
// sql_lexer.cpp
//
// 리터럴/주석 상태 머신 구현.
// 각 step 함수는 현재 위치에서 소비한 문자 수를 돌려준다.
// ---------------------------------------------------------------------------

#include "guard/sql_lexer.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace {

enum class Region : std::uint8_t {
    kCode,
    kQuoted,        // quote_ 로 닫히는 ' " ` 영역
    kLineComment,
    kBlockComment,
};

class Scanner {
public:
    explicit Scanner(std::string_view sql)
        : sql_(sql)
    {
        out_.masked.assign(sql.begin(), sql.end());
    }

    SqlScan run() {
        for (std::size_t pos = 0; pos < sql_.size();) {
            switch (region_) {
                case Region::kCode:         pos += step_code(pos);          break;
                case Region::kQuoted:       pos += step_quoted(pos);        break;
                case Region::kLineComment:  pos += step_line_comment(pos);  break;
                case Region::kBlockComment: pos += step_block_comment(pos); break;
            }
        }
        out_.end_state = end_state();
        return std::move(out_);
    }

private:
    [[nodiscard]] char at(std::size_t pos) const {
        return pos < sql_.size() ? sql_[pos] : '\0';
    }

    // 줄바꿈은 남겨 줄 구조를 유지한다
    void mask(std::size_t pos, std::size_t count = 1) {
        for (std::size_t k = pos; k < pos + count && k < out_.masked.size(); ++k) {
            if (out_.masked[k] != '\n') {
                out_.masked[k] = ' ';
            }
        }
    }

    std::size_t step_code(std::size_t pos) {
        const char c = sql_[pos];
        const char n = at(pos + 1);

        if (c == '\'' || c == '"' || c == '`') {
            region_ = Region::kQuoted;
            quote_  = c;
            return 1;
        }
        if ((c == '/' && n == '*') || (c == '-' && n == '-') || c == '#') {
            out_.has_comment = true;
            region_ = (c == '/') ? Region::kBlockComment : Region::kLineComment;
            const std::size_t marker = (c == '#') ? 1 : 2;
            mask(pos, marker);
            return marker;
        }
        if (c == ';') {
            out_.has_semicolon = true;
        }
        return 1;
    }

    // 작은따옴표 리터럴만 내용을 가린다. 식별자(" `)는 원문 유지.
    std::size_t step_quoted(std::size_t pos) {
        const char c       = sql_[pos];
        const bool literal = (quote_ == '\'');

        if (quote_ != '`' && c == '\\') {
            if (literal && pos + 1 >= sql_.size()) {
                mask(pos);
                return 1;
            }
            if (literal) {
                mask(pos, 2);
            }
            return 2;
        }
        if (c != quote_) {
            if (literal) {
                mask(pos);
            }
            return 1;
        }
        // '' / "" 는 닫힘이 아니라 이스케이프
        if (quote_ != '`' && at(pos + 1) == quote_) {
            if (literal) {
                mask(pos, 2);
            }
            return 2;
        }
        region_ = Region::kCode;
        return 1;
    }

    std::size_t step_line_comment(std::size_t pos) {
        if (sql_[pos] == '\n') {
            region_ = Region::kCode;
        } else {
            mask(pos);
        }
        return 1;
    }

    std::size_t step_block_comment(std::size_t pos) {
        if (sql_[pos] == '*' && at(pos + 1) == '/') {
            mask(pos, 2);
            region_ = Region::kCode;
            return 2;
        }
        mask(pos);
        return 1;
    }

    [[nodiscard]] SqlScanEnd end_state() const {
        switch (region_) {
            case Region::kQuoted:       return SqlScanEnd::kInLiteral;
            case Region::kLineComment:  return SqlScanEnd::kInLineComment;
            case Region::kBlockComment: return SqlScanEnd::kInBlockComment;
            case Region::kCode:         break;
        }
        return SqlScanEnd::kNormal;
    }

    std::string_view sql_;
    SqlScan          out_;
    Region           region_{Region::kCode};
    char             quote_{'\0'};
};

}  // namespace

SqlScan scan_sql(std::string_view sql) {
    return Scanner(sql).run();
}
