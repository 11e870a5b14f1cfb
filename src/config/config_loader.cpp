// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일 → ServerConfig.
//
// [설계 원칙]
// - All-or-nothing: 어느 섹션이든 타입 변환에 실패하면 전체 로드 실패.
//   (섹션별 try-catch 로 어느 섹션이 문제인지 메시지에 포함한다)
// - 필드 누락 시 구조체 기본값을 유지한다.
// - 설정 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 스칼라 읽기. 노드가 없거나 null 이면 fallback.
// 타입 변환 실패는 YAML::Exception 으로 호출자에게 전파한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::string>();
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::uint32_t>();
}

// port 는 uint32 로 읽은 뒤 범위를 검사한다 (uint16 직접 변환은 wrap 될 수 있음)
[[nodiscard]] std::uint16_t read_port(const YAML::Node& node, std::uint16_t fallback) {
    const std::uint32_t value = read_uint32(node, fallback);
    if (value < 1 || value > 65535) {
        throw YAML::Exception(node.Mark(), fmt::format("port {} out of range 1-65535", value));
    }
    return static_cast<std::uint16_t>(value);
}

void parse_server(const YAML::Node& node, ServerConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.listen_address = read_string(node["listen_address"], cfg.listen_address);
    cfg.listen_port    = read_port(node["listen_port"], cfg.listen_port);
    cfg.base_url       = read_string(node["base_url"], cfg.base_url);
    cfg.worker_threads = read_uint32(node["worker_threads"], cfg.worker_threads);
}

void parse_store(const YAML::Node& node, StoreConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.backend         = read_string(node["backend"], cfg.backend);
    cfg.path            = read_string(node["path"], cfg.path);
    cfg.busy_timeout_ms = read_uint32(node["busy_timeout_ms"], cfg.busy_timeout_ms);
}

void parse_logging(const YAML::Node& node, ServerConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.log_level = read_string(node["level"], cfg.log_level);
    cfg.log_path  = read_string(node["path"], cfg.log_path);
}

void parse_limits(const YAML::Node& node, ServerConfig& cfg) {
    if (!node || !node.IsMap()) {
        return;
    }
    cfg.max_request_bytes       = read_uint32(node["max_request_bytes"], cfg.max_request_bytes);
    cfg.max_url_length          = read_uint32(node["max_url_length"], cfg.max_url_length);
    cfg.max_generation_attempts =
        read_uint32(node["max_generation_attempts"], cfg.max_generation_attempts);
    cfg.request_timeout_sec     = read_uint32(node["request_timeout_sec"], cfg.request_timeout_sec);
}

// ---------------------------------------------------------------------------
// 환경변수 헬퍼 (없거나 빈 값이면 현재 값 유지)
// ---------------------------------------------------------------------------
void env_str(const char* name, std::string& target) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        target = val;
    }
}

void env_u16(const char* name, std::uint16_t& target) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return;
    }
    try {
        const int parsed = std::stoi(val);
        if (parsed < 1 || parsed > 65535) {
            spdlog::warn("env {}: value {} out of range, keeping {}", name, parsed, target);
            return;
        }
        target = static_cast<std::uint16_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', keeping {}", name, val, target);
    }
}

void env_u32(const char* name, std::uint32_t& target) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed < 0 || parsed > static_cast<long>(UINT32_MAX)) {
            spdlog::warn("env {}: value {} out of range, keeping {}", name, parsed, target);
            return;
        }
        target = static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', keeping {}", name, val, target);
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<ServerConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return std::unexpected(fmt::format("config_loader: cannot resolve config path '{}': {}",
                                           config_path.string(), ec.message()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return std::unexpected(fmt::format("config_loader: cannot open file '{}': {}",
                                           canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("config_loader: YAML error in '{}': {}",
                                           canonical_path.string(), e.what()));
    }

    // 빈 파일은 null 노드 → 기본값 그대로 사용
    if (root && !root.IsNull() && !root.IsMap()) {
        return std::unexpected(fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", canonical_path.string()));
    }

    ServerConfig cfg{};

    const auto parse_section = [&root](const char* section, auto&& parse_fn)
        -> std::expected<void, std::string> {
        try {
            parse_fn(root[section]);
        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format(
                "config_loader: error parsing '{}' section: {}", section, e.what()));
        }
        return {};
    };

    if (auto r = parse_section("server",  [&cfg](const YAML::Node& n) { parse_server(n, cfg); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("store",   [&cfg](const YAML::Node& n) { parse_store(n, cfg.store); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("logging", [&cfg](const YAML::Node& n) { parse_logging(n, cfg); }); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = parse_section("limits",  [&cfg](const YAML::Node& n) { parse_limits(n, cfg); }); !r) {
        return std::unexpected(r.error());
    }

    if (auto valid = validate(cfg); !valid) {
        return std::unexpected(valid.error());
    }

    spdlog::info("config_loader: loaded '{}' (listen={}:{}, store={})",
                 canonical_path.string(), cfg.listen_address, cfg.listen_port,
                 cfg.store.backend);
    return cfg;
}

// ---------------------------------------------------------------------------
// ConfigLoader::apply_env_overrides
// ---------------------------------------------------------------------------
void ConfigLoader::apply_env_overrides(ServerConfig& config) {
    env_str("SHORTLINK_LISTEN_ADDR",   config.listen_address);
    env_u16("SHORTLINK_PORT",          config.listen_port);
    env_str("SHORTLINK_BASE_URL",      config.base_url);
    env_u32("SHORTLINK_THREADS",       config.worker_threads);
    env_str("SHORTLINK_STORE_BACKEND", config.store.backend);
    env_str("SHORTLINK_DB_PATH",       config.store.path);
    env_str("SHORTLINK_LOG_PATH",      config.log_path);
    env_str("SHORTLINK_LOG_LEVEL",     config.log_level);
}

// ---------------------------------------------------------------------------
// ConfigLoader::validate
// ---------------------------------------------------------------------------
std::expected<void, std::string> ConfigLoader::validate(const ServerConfig& config) {
    if (config.store.backend != "sqlite" && config.store.backend != "memory") {
        return std::unexpected(fmt::format(
            "config_loader: store.backend '{}' must be 'sqlite' or 'memory'",
            config.store.backend));
    }
    if (config.store.backend == "sqlite" && config.store.path.empty()) {
        return std::unexpected(std::string{"config_loader: store.path must not be empty"});
    }
    if (!config.base_url.starts_with("http://") && !config.base_url.starts_with("https://")) {
        return std::unexpected(fmt::format(
            "config_loader: server.base_url '{}' must start with http:// or https://",
            config.base_url));
    }
    if (config.worker_threads > kMaxWorkerThreads) {
        return std::unexpected(fmt::format(
            "config_loader: server.worker_threads {} must be at most {}",
            config.worker_threads, kMaxWorkerThreads));
    }
    if (config.store.busy_timeout_ms > kMaxBusyTimeoutMs) {
        return std::unexpected(fmt::format(
            "config_loader: store.busy_timeout_ms {} must be at most {}",
            config.store.busy_timeout_ms, kMaxBusyTimeoutMs));
    }
    if (config.max_generation_attempts == 0) {
        return std::unexpected(
            std::string{"config_loader: limits.max_generation_attempts must be at least 1"});
    }
    if (config.request_timeout_sec == 0) {
        return std::unexpected(
            std::string{"config_loader: limits.request_timeout_sec must be at least 1"});
    }
    if (config.max_url_length == 0) {
        return std::unexpected(std::string{"config_loader: limits.max_url_length must be at least 1"});
    }
    if (config.max_request_bytes < 1024) {
        return std::unexpected(
            std::string{"config_loader: limits.max_request_bytes must be at least 1024"});
    }
    if (config.log_level != "debug" && config.log_level != "info" &&
        config.log_level != "warn" && config.log_level != "error") {
        return std::unexpected(fmt::format(
            "config_loader: logging.level '{}' must be debug, info, warn or error",
            config.log_level));
    }
    return {};
}
