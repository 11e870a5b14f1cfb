#include "config/config_loader.hpp"
#include "server/shortener_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (파일 → 환경변수 오버라이드) ───────────────────────────
    const char* config_env = std::getenv("SHORTLINK_CONFIG");  // NOLINT(concurrency-mt-unsafe)
    const std::filesystem::path config_path =
        (config_env != nullptr && config_env[0] != '\0') ? config_env : "config/shortlink.yaml";

    ServerConfig config;
    std::error_code exists_ec;
    if (std::filesystem::exists(config_path, exists_ec)) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            spdlog::error("{}", loaded.error());
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    } else {
        spdlog::warn("config file '{}' not found, using defaults", config_path.string());
    }

    ConfigLoader::apply_env_overrides(config);
    if (auto valid = ConfigLoader::validate(config); !valid) {
        spdlog::error("{}", valid.error());
        return EXIT_FAILURE;
    }

    const unsigned threads = config.worker_threads > 0
        ? config.worker_threads
        : std::max(1U, std::thread::hardware_concurrency());

    spdlog::info("Starting shortlink");
    spdlog::info("Listen: {}:{}", config.listen_address, config.listen_port);
    spdlog::info("Base URL: {}", config.base_url);
    spdlog::info("Store: {} ({})", config.store.backend, config.store.path);
    spdlog::info("Worker threads: {}", threads);
    spdlog::info("Log level: {}", config.log_level);

    // ── ShortenerServer 생성 및 실행 ────────────────────────────────────
    boost::asio::io_context ioc{static_cast<int>(threads)};
    ShortenerServer server{config};
    try {
        server.run(ioc);
    } catch (const std::exception& e) {
        spdlog::error("startup failed: {}", e.what());
        return EXIT_FAILURE;
    }

    std::vector<std::thread> workers;
    int exit_code = EXIT_SUCCESS;
    try {
        workers.reserve(threads - 1);
        for (unsigned i = 1; i < threads; ++i) {
            workers.emplace_back([&ioc]() { ioc.run(); });
        }
    } catch (const std::exception& e) {
        // 이미 띄운 스레드는 아래 ioc.run() 과 함께 stop 으로 정리한다
        spdlog::error("cannot start worker threads: {}", e.what());
        server.stop();
        exit_code = EXIT_FAILURE;
    }
    ioc.run();
    for (auto& worker : workers) {
        worker.join();
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("shortlink stopped");

    return exit_code;
}
