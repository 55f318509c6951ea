// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// JSON 한 줄은 fmt 로 조립하고, 레벨 필터링은 spdlog 에 맡긴다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/fmt/chrono.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "sqlgate";

// 회전 파일: 100MB x 3개
constexpr std::size_t kMaxFileBytes = 100 * 1024 * 1024;
constexpr std::size_t kMaxFiles     = 3;

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// 2026-01-02T03:04:05.678Z (UTC, 밀리초)
std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = tp.time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
                      - std::chrono::duration_cast<std::chrono::seconds>(since_epoch);

    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis.count());
}

}  // namespace

// 제어 문자는 \uXXXX 로 바꾼다.
std::string escape_json_string(std::string_view raw) {
    std::string out;
    out.reserve(raw.size() + 8);

    for (const char c : raw) {
        switch (c) {
            case '"':  out += R"(\")"; break;
            case '\\': out += R"(\\)"; break;
            case '\b': out += R"(\b)"; break;
            case '\f': out += R"(\f)"; break;
            case '\n': out += R"(\n)"; break;
            case '\r': out += R"(\r)"; break;
            case '\t': out += R"(\t)"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    fmt::format_to(std::back_inserter(out), "\\u{:04x}",
                                   static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug" || level == "trace") {
        return LogLevel::kDebug;
    }
    if (level == "warn" || level == "warning") {
        return LogLevel::kWarn;
    }
    if (level == "error" || level == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
//   파일 sink 는 항상, stderr sink 는 echo_stderr 일 때만 붙인다.
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         echo_stderr)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks{
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), kMaxFileBytes, kMaxFiles)
        };
        if (echo_stderr) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));
        // 접두어는 타임스탬프만. 본문은 각 메서드가 만든 JSON 한 줄.
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

        spdlog::register_logger(logger_);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(
            fmt::format("sqlgate logger init failed for '{}': {}", log_path_.string(), ex.what()));
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(
            fmt::format("sqlgate logger init failed for '{}': {}", log_path_.string(), ex.what()));
    }
}

StructuredLogger::~StructuredLogger() {
    if (!logger_) {
        return;  // moved-from
    }
    logger_->flush();
    spdlog::drop(kLoggerName);
}

// ---------------------------------------------------------------------------
// write: 모든 출력의 단일 경로
// ---------------------------------------------------------------------------
bool StructuredLogger::enabled(LogLevel level) const {
    return logger_ && logger_->should_log(to_spdlog_level(level));
}

void StructuredLogger::write(LogLevel level, std::string_view line) {
    if (enabled(level)) {
        logger_->log(to_spdlog_level(level), line);
    }
}

void StructuredLogger::log_verdict(const VerdictLog& entry) {
    const LogLevel level = entry.accepted ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    write(level, fmt::format(
        R"({{"event":"sql_verdict","accepted":{},"safety_mode":"{}","candidate_sql":"{}",)"
        R"("normalized_sql":"{}","error_code":"{}","reason":"{}","timestamp":"{}","duration_us":{}}})",
        entry.accepted,
        escape_json_string(entry.safety_mode),
        escape_json_string(entry.candidate_sql),
        escape_json_string(entry.normalized_sql),
        escape_json_string(entry.error_code),
        escape_json_string(entry.reason),
        format_iso8601(entry.timestamp),
        entry.duration.count()));
}

void StructuredLogger::log_route(const RouteLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    write(LogLevel::kInfo, fmt::format(
        R"({{"event":"route","category":"{}","confidence":{:.2f},"rule":"{}","rationale":"{}",)"
        R"("simple_score":{},"complex_score":{},"question":"{}","timestamp":"{}","duration_us":{}}})",
        escape_json_string(entry.category),
        entry.confidence,
        escape_json_string(entry.rule),
        escape_json_string(entry.rationale),
        entry.simple_score,
        entry.complex_score,
        escape_json_string(entry.question),
        format_iso8601(entry.timestamp),
        entry.duration.count()));
}

void StructuredLogger::debug(std::string_view msg) { write(LogLevel::kDebug, msg); }
void StructuredLogger::info(std::string_view msg)  { write(LogLevel::kInfo, msg); }
void StructuredLogger::warn(std::string_view msg)  { write(LogLevel::kWarn, msg); }
void StructuredLogger::error(std::string_view msg) { write(LogLevel::kError, msg); }
