// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 GuardConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱/검증 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - row_limit_cap 은 uint32 범위만 허용한다. 음수/문자열은 파싱 오류로 처리.
// - router 정규식은 로드 시 미리 컴파일해 경고만 출력한다. 잘못된 패턴은
//   QueryRouter 에서 건너뛰므로 해당 신호가 점수에서 빠진다 (미탐 증가).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// 숫자 필드는 잘못된 값이면 조용히 기본값으로 돌리지 않고 예외를 그대로 올린다.
// (상한/임계값 오설정은 fail-close: 로드 실패)
[[nodiscard]] std::uint32_t read_uint32_strict(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::uint32_t>();
}

[[nodiscard]] double read_double_strict(const YAML::Node& node, double fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<double>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 정규식 사전 검증 (경고만)
// ---------------------------------------------------------------------------
void validate_patterns(const std::vector<std::string>& patterns, std::string_view key) {
    for (const auto& p : patterns) {
        try {
            std::regex re(p, std::regex_constants::icase | std::regex_constants::ECMAScript);
            (void)re;  // 컴파일만 확인
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "config_loader: router.{} pattern '{}' is invalid regex and will be skipped "
                "by QueryRouter: {}",
                key, p, e.what()
            );
        }
    }
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level = read_string(node["log_level"], cfg.log_level);
    cfg.log_path  = read_string(node["log_path"],  cfg.log_path);
    return cfg;
}

[[nodiscard]] GuardrailConfig parse_guardrail(const YAML::Node& node) {
    GuardrailConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.row_limit_cap = read_uint32_strict(node["row_limit_cap"], cfg.row_limit_cap);
    cfg.safety_mode   = read_string(node["safety_mode"], cfg.safety_mode);
    cfg.max_candidate_bytes =
        read_uint32_strict(node["max_candidate_bytes"], cfg.max_candidate_bytes);

    if (cfg.safety_mode != "pattern" && cfg.safety_mode != "strict") {
        spdlog::warn(
            "config_loader: guardrail.safety_mode '{}' is not 'pattern' or 'strict', "
            "defaulting to 'pattern'",
            cfg.safety_mode
        );
        cfg.safety_mode = "pattern";
    }
    return cfg;
}

[[nodiscard]] IdentifierConfig parse_identifiers(const YAML::Node& node) {
    IdentifierConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.reserved_names = read_string_sequence(node["reserved_names"]);
    return cfg;
}

[[nodiscard]] RouterConfig parse_router(const YAML::Node& node) {
    RouterConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }

    cfg.analysis_threshold = read_double_strict(node["analysis_threshold"], cfg.analysis_threshold);
    cfg.simple_patterns    = read_string_sequence(node["simple_patterns"]);
    cfg.complex_patterns   = read_string_sequence(node["complex_patterns"]);
    cfg.simple_keywords    = read_string_sequence(node["simple_keywords"]);
    cfg.complex_keywords   = read_string_sequence(node["complex_keywords"]);

    validate_patterns(cfg.simple_patterns,  "simple_patterns");
    validate_patterns(cfg.complex_patterns, "complex_patterns");
    return cfg;
}

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// 로드 실패: error 로그 후 같은 문구를 호출자에게 돌려준다.
template <typename... Args>
std::unexpected<std::string> load_error(fmt::format_string<Args...> format, Args&&... args) {
    std::string err = "config_loader: " + fmt::format(format, std::forward<Args>(args)...);
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
//   경로 정규화 → YAML 로드 → 섹션 파싱 → 값 검증 순서.
// ---------------------------------------------------------------------------
std::expected<GuardConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto resolved = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return load_error("cannot resolve config path '{}': {}", config_path.string(),
                          ec.message());
    }
    const std::string file = resolved.string();
    spdlog::info("config_loader: loading config from '{}'", file);

    YAML::Node root;
    try {
        root = YAML::LoadFile(file);
    } catch (const YAML::ParserException& e) {
        // mark 는 0-based
        return load_error("YAML parse error in '{}' at line {}, col {}: {}", file,
                          e.mark.line + 1, e.mark.column + 1, e.what());
    } catch (const YAML::Exception& e) {
        return load_error("cannot read '{}': {}", file, e.what());
    }

    if (!root.IsMap()) {
        return load_error("'{}' must hold a YAML map at the top level", file);
    }

    // 섹션 단위로 실패 위치를 알린다. 일부만 채운 설정은 돌려주지 않는다.
    GuardConfig cfg{};
    const char* section = "global";
    try {
        cfg.global = parse_global(root[section]);
        section = "guardrail";
        cfg.guardrail = parse_guardrail(root[section]);
        section = "identifiers";
        cfg.identifiers = parse_identifiers(root[section]);
        section = "router";
        cfg.router = parse_router(root[section]);
    } catch (const YAML::Exception& e) {
        return load_error("error parsing '{}' section: {}", section, e.what());
    }

    if (cfg.guardrail.row_limit_cap == 0) {
        return load_error("guardrail.row_limit_cap must be greater than 0");
    }
    if (cfg.guardrail.max_candidate_bytes == 0) {
        return load_error("guardrail.max_candidate_bytes must be greater than 0");
    }
    if (!(cfg.router.analysis_threshold >= 0.0 && cfg.router.analysis_threshold <= 1.0)) {
        return load_error("router.analysis_threshold must be within [0, 1], got {}",
                          cfg.router.analysis_threshold);
    }

    const std::size_t router_overrides =
        cfg.router.simple_patterns.size() + cfg.router.complex_patterns.size() +
        cfg.router.simple_keywords.size() + cfg.router.complex_keywords.size();
    spdlog::info("config_loader: loaded '{}' (row_limit_cap={}, safety_mode={}, "
                 "reserved_names={}, router_overrides={})",
                 file, cfg.guardrail.row_limit_cap, cfg.guardrail.safety_mode,
                 cfg.identifiers.reserved_names.size(), router_overrides);
    return cfg;
}

// ---------------------------------------------------------------------------
// ConfigLoader::apply_env_overrides
// ---------------------------------------------------------------------------
void ConfigLoader::apply_env_overrides(GuardConfig& config) {
    if (const char* cap = std::getenv("SQLGATE_ROW_LIMIT_CAP");  // NOLINT(concurrency-mt-unsafe)
        cap != nullptr && cap[0] != '\0') {
        try {
            std::size_t idx{0};
            const long parsed = std::stol(cap, &idx);
            if (idx != std::string(cap).size() || parsed <= 0 || parsed > 0xFFFFFFFFL) {
                spdlog::warn("env SQLGATE_ROW_LIMIT_CAP: value '{}' out of range, keeping {}",
                             cap, config.guardrail.row_limit_cap);
            } else {
                config.guardrail.row_limit_cap = static_cast<std::uint32_t>(parsed);
            }
        } catch (const std::exception&) {
            spdlog::warn("env SQLGATE_ROW_LIMIT_CAP: invalid value '{}', keeping {}",
                         cap, config.guardrail.row_limit_cap);
        }
    }

    if (const char* level = std::getenv("SQLGATE_LOG_LEVEL");  // NOLINT(concurrency-mt-unsafe)
        level != nullptr && level[0] != '\0') {
        config.global.log_level = level;
    }

    if (const char* path = std::getenv("SQLGATE_LOG_PATH");  // NOLINT(concurrency-mt-unsafe)
        path != nullptr && path[0] != '\0') {
        config.global.log_path = path;
    }
}

// ---------------------------------------------------------------------------
// make_routing_tables
// ---------------------------------------------------------------------------
std::shared_ptr<const RoutingTables> make_routing_tables(const RouterConfig& config) {
    RoutingTables tables = default_routing_tables();

    if (!config.simple_patterns.empty()) {
        tables.simple_patterns = config.simple_patterns;
    }
    if (!config.complex_patterns.empty()) {
        tables.complex_patterns = config.complex_patterns;
    }
    if (!config.simple_keywords.empty()) {
        tables.simple_keywords.clear();
        for (const auto& k : config.simple_keywords) {
            tables.simple_keywords.insert(to_lower_ascii(k));
        }
    }
    if (!config.complex_keywords.empty()) {
        tables.complex_keywords.clear();
        for (const auto& k : config.complex_keywords) {
            tables.complex_keywords.insert(to_lower_ascii(k));
        }
    }

    return std::make_shared<const RoutingTables>(std::move(tables));
}
