#include "boardbuild/config.hpp"
#include "boardbuild/pipeline.hpp"
#include "boardbuild/process_exec.hpp"
#include "boardbuild/report.hpp"

#include <filesystem>
#include <iostream>
#include <print>
#include <string>

extern char **environ;

void print_help() {
    std::println("Usage: boardbuild [options]");
    std::println("Builds one board image from the TB_* environment variables.");
    std::println("Options:");
    std::println("  -h, --help          Show this help message");
    std::println("  -v, --version       Show version");
    std::println("  --env-file <file>   Read TB_* defaults from <file>; the environment wins");
    std::println("  --plan              Print the resolved build plan as JSON and exit");
    std::println("Required: TB_BOARD, and TB_REPO unless TB_LOCAL=true.");
}

void print_version() {
    std::println("boardbuild {}", BOARDBUILD_PROJ_VER);
}

int main(const int argc, const char *const *argv) {
    bool plan = false;
    std::filesystem::path env_file;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--env-file") {
            if (i + 1 < argc) {
                env_file = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for --env-file");
                return 1;
            }
        } else if (arg == "--plan") {
            plan = true;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    boardbuild::Environment env = boardbuild::capture_environment(environ);
    if (!env_file.empty()) {
        auto merged = boardbuild::apply_env_file(std::move(env), env_file);
        if (!merged) {
            std::println(std::cerr, "{}", merged.error());
            return 1;
        }
        env = std::move(*merged);
    }

    auto request = boardbuild::parse_request(env);
    if (!request) {
        std::println(std::cerr, "{}", request.error());
        return 1;
    }

    if (plan) {
        std::println("{}", boardbuild::plan_to_json(boardbuild::plan_pipeline(*request)).dump(4));
        return 0;
    }

    boardbuild::ProcessRunner runner;
    auto outcome = boardbuild::run_pipeline(*request, runner);
    if (!outcome) {
        std::println(std::cerr, "{}", outcome.error());
        return boardbuild::exit_code(outcome.error().status);
    }
    return 0;
}
