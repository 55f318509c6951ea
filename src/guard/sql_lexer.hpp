#pragma once

// ---------------------------------------------------------------------------
// sql_lexer.hpp
//
// SQL 원문을 한 번 훑어 문자열 리터럴 / 인용 식별자 / 주석 영역을 추적하는
// 상태 머신. 토큰화는 하지 않는다.
//
// [용도]
// - SqlGuardrail: 리터럴/주석 안의 "LIMIT 5" 를 LIMIT 절로 오인하지 않도록
//   masked 사본에서 LIMIT 를 찾는다.
// - StrictSafetyCheck: 주석/멀티 스테이트먼트 탐지, FROM/JOIN 대상 추출.
//
// [한계]
// - 중첩 블록 주석 미지원.
// - 백슬래시 이스케이프는 MySQL 규칙을 따른다. 표준 SQL(SQLite) 에서
//   'C:\' 같은 리터럴은 닫히지 않은 것으로 판정될 수 있다 (차단 쪽 오탐).
// - '#' 은 MySQL 주석으로 취급한다 (PostgreSQL XOR 연산자 오탐 가능).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>

// 스캔이 끝났을 때의 상태
enum class SqlScanEnd : std::uint8_t {
    kNormal        = 0,
    kInLiteral     = 1,  // 닫히지 않은 ' " ` 
    kInLineComment = 2,  // -- 또는 # 주석으로 끝남 (줄바꿈 없음)
    kInBlockComment = 3, // 닫히지 않은 /* 
};

// ---------------------------------------------------------------------------
// SqlScan
//   masked: 원문과 길이가 같은 사본. 작은따옴표 리터럴 내용과 주석 전체를
//           공백으로 치환한다. 큰따옴표/백틱 식별자는 그대로 둔다.
// ---------------------------------------------------------------------------
struct SqlScan {
    std::string masked{};
    bool        has_comment{false};    // 리터럴 밖 --, #, /* 존재
    bool        has_semicolon{false};  // 리터럴/주석 밖 ; 존재
    SqlScanEnd  end_state{SqlScanEnd::kNormal};
};

[[nodiscard]] SqlScan scan_sql(std::string_view sql);
