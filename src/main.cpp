#include "config/config_loader.hpp"
#include "guard/identifier_validator.hpp"
#include "guard/sql_guardrail.hpp"
#include "logger/structured_logger.hpp"
#include "router/query_router.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// sqlgate
//   sqlgate sanitize                  stdin 전체를 SQL 후보 1건으로 판정
//   sqlgate route                     stdin 한 줄 = 질문 1건, JSON 1줄 출력
//   sqlgate check-identifier <name>.. 이름마다 valid/invalid 출력
//
//   설정: SQLGATE_CONFIG (YAML, 없으면 내장 기본값) + SQLGATE_* 환경변수
//   종료 코드: 0 성공/허용, 1 거부/무효 식별자 포함, 2 사용법/설정 오류
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitRejected = 1;
constexpr int kExitUsage    = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

void print_usage() {
    std::cerr << "usage: sqlgate sanitize < candidate.sql\n"
                 "       sqlgate route < questions.txt\n"
                 "       sqlgate check-identifier <name>...\n";
}

std::chrono::microseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

int run_sanitize(const GuardConfig& config, StructuredLogger& logger,
                 std::shared_ptr<const IdentifierValidator> validator) {
    auto check = make_statement_safety_check(config.guardrail.safety_mode, std::move(validator));
    if (!check) {
        spdlog::error("sqlgate: {}", check.error());
        return kExitUsage;
    }
    const SqlGuardrail guardrail(config.guardrail.row_limit_cap, *check,
                                 config.guardrail.max_candidate_bytes);

    const std::string candidate{std::istreambuf_iterator<char>(std::cin),
                                std::istreambuf_iterator<char>()};

    const auto start   = std::chrono::steady_clock::now();
    const auto verdict = guardrail.sanitize(candidate);

    VerdictLog entry;
    entry.candidate_sql = candidate;
    entry.accepted      = verdict.has_value();
    entry.safety_mode   = std::string(guardrail.safety_check().name());
    entry.timestamp     = std::chrono::system_clock::now();
    entry.duration      = elapsed_since(start);
    if (verdict) {
        entry.normalized_sql = *verdict;
    } else {
        entry.error_code = std::string(to_string(verdict.error().code));
        entry.reason     = verdict.error().message;
    }
    logger.log_verdict(entry);

    if (!verdict) {
        std::cerr << "rejected: " << to_string(verdict.error().code) << ": "
                  << verdict.error().message;
        if (!verdict.error().context.empty()) {
            std::cerr << " (" << verdict.error().context << ")";
        }
        std::cerr << '\n';
        return kExitRejected;
    }

    std::cout << *verdict << '\n';
    return EXIT_SUCCESS;
}

int run_route(const GuardConfig& config, StructuredLogger& logger) {
    const QueryRouter router(make_routing_tables(config.router));

    std::string line;
    while (std::getline(std::cin, line)) {
        const auto start    = std::chrono::steady_clock::now();
        const auto decision = router.route(line);
        const auto advice   = router.should_use_analysis(line, config.router.analysis_threshold);

        RouteLog entry;
        entry.question      = line;
        entry.category      = std::string(to_string(decision.category));
        entry.confidence    = decision.confidence;
        entry.rule          = std::string(to_string(decision.rule));
        entry.rationale     = decision.rationale;
        entry.simple_score  = decision.simple_score;
        entry.complex_score = decision.complex_score;
        entry.timestamp     = std::chrono::system_clock::now();
        entry.duration      = elapsed_since(start);
        logger.log_route(entry);

        std::cout << fmt::format(
            R"({{"category":"{}","confidence":{:.2f},"rule":"{}","rationale":"{}",)"
            R"("simple_score":{},"complex_score":{},"use_analysis":{},"advice":"{}"}})",
            to_string(decision.category), decision.confidence, to_string(decision.rule),
            escape_json_string(decision.rationale), decision.simple_score, decision.complex_score,
            advice.use_analysis ? "true" : "false", escape_json_string(advice.explanation))
                  << '\n';
    }
    return EXIT_SUCCESS;
}

int run_check_identifier(const IdentifierValidator& validator, int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return kExitUsage;
    }

    int exit_code = EXIT_SUCCESS;
    for (int i = 2; i < argc; ++i) {
        const std::string_view name = argv[i];
        const auto result = validator.validate(name);
        if (result) {
            std::cout << name << ": valid\n";
        } else {
            std::cout << name << ": invalid (" << result.error().message << ")\n";
            exit_code = kExitRejected;
        }
    }
    return exit_code;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }
    const std::string_view command = argv[1];

    // CLI 의 stdout 은 결과 전용. 진단 로그는 stderr 로 보낸다.
    spdlog::set_default_logger(spdlog::stderr_color_mt("sqlgate_diag"));
    spdlog::set_level(spdlog::level::warn);

    // ── 설정 로드 (파일 → 환경변수 덮어쓰기) ───────────────────────────
    GuardConfig config;
    if (const std::string path = env_str("SQLGATE_CONFIG", ""); !path.empty()) {
        auto loaded = ConfigLoader::load(path);
        if (!loaded) {
            std::cerr << "sqlgate: " << loaded.error() << '\n';
            return kExitUsage;
        }
        config = std::move(*loaded);
    }
    ConfigLoader::apply_env_overrides(config);

    const LogLevel level = parse_log_level(config.global.log_level);
    if (level == LogLevel::kDebug) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto validator = config.identifiers.reserved_names.empty()
        ? std::make_shared<const IdentifierValidator>()
        : std::make_shared<const IdentifierValidator>(config.identifiers.reserved_names);

    if (command == "check-identifier") {
        return run_check_identifier(*validator, argc, argv);
    }
    if (command != "sanitize" && command != "route") {
        print_usage();
        return kExitUsage;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    std::optional<StructuredLogger> logger;
    try {
        logger.emplace(level, config.global.log_path, level == LogLevel::kDebug);
    } catch (const std::runtime_error& e) {
        std::cerr << "sqlgate: " << e.what() << '\n';
        return kExitUsage;
    }

    if (command == "sanitize") {
        return run_sanitize(config, *logger, std::move(validator));
    }
    return run_route(config, *logger);
}
