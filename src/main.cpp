/**
 * @file main.cpp
 * @brief filest_server entry point
 *
 * Run with:
 *   ./build/filest_server --root ./files --port 3000
 *
 * Test with:
 *   curl -u admin:admin123 -F path=/docs -F files=@report.pdf http://localhost:3000/api/upload
 */

#include "filest/core/config.hpp"
#include "filest/core/logging.hpp"
#include "filest/server/upload_server.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "filest_server";
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            std::cout << filest::usage_text(program);
            return 0;
        }
    }

    auto parsed = filest::parse_command_line(args);
    if (parsed.is_error()) {
        std::cerr << "Error: " << parsed.error().message << "\n\n" << filest::usage_text(program);
        return 1;
    }
    const filest::ServerConfig config = parsed.value();

    filest::init_logging(config.log_level);

    spdlog::info("════════════════════════════════════════════");
    spdlog::info("filest upload server");
    spdlog::info("════════════════════════════════════════════");
    spdlog::info("Staging directory: {}", config.staging_dir.string());
    spdlog::info("Worker threads: {}", config.worker_threads);

    filest::server::UploadServer server(config);

    auto started = server.start();
    if (started.is_error()) {
        spdlog::critical("{}", started.error().message);
        return 1;
    }

    spdlog::info("Press Ctrl+C to stop");
    server.run();

    spdlog::info("Server stopped");
    return 0;
}
