/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Argument Parsing.
 * 2. Configuration Loading (file + environment).
 * 3. Subsystem Initialization (Transport & Storage).
 * 4. Request Execution: one request from argv, or one per stdin line.
 */

#include "repodb/config/config.hpp"
#include "repodb/infra/json.hpp"
#include "repodb/infra/logger.hpp"
#include "repodb/infra/string.hpp"
#include "repodb/network/handler.hpp"
#include "repodb/remote/curl_http_client.hpp"
#include "repodb/storage/db.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " CONFIG.json [REQUEST_JSON]\n"
              << "Options:\n"
              << "  CONFIG.json   Repository coordinates, queue tuning and schemas\n"
              << "  REQUEST_JSON  Single request to execute, e.g.\n"
              << "                '{\"action\":\"find\",\"collection\":\"users\"}'\n"
              << "                Without it, one request is read per stdin line.\n"
              << "  --help        Show this help message\n"
              << "Environment:\n"
              << "  REPODB_TOKEN  Access token used when the config leaves store.token empty\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 0. Argument Pre-check
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }
    if (argc < 2 || argc > 3) {
        print_help(argv[0]);
        return 2;
    }

    // 1. Configuration
    repodb::config::Config config;
    try {
        config = repodb::config::Config::from_file(argv[1]);
    } catch (const std::exception& e) {
        repodb::infra::Logger::log(repodb::infra::LogLevel::FATAL,
                                   "System: Invalid configuration: " + std::string(e.what()));
        return 1;
    }
    repodb::infra::Logger::set_level(config.log_level);

    int exit_code = 0;

    try {
        // 2. System Bootstrap
        repodb::infra::Logger::log(repodb::infra::LogLevel::INFO, "System: Booting RepoDB...");

        repodb::remote::CurlHttpClient http(config.db.store.timeout_ms);
        repodb::storage::Db db(http, config.db);
        config.apply_schemas(db);

        // 3. Request Execution
        if (argc == 3) {
            std::string response = repodb::network::Handler::process(db, argv[2]);
            std::cout << response << std::endl;
            repodb::infra::JsonPtr parsed = repodb::infra::Json::parse(response);
            if (repodb::infra::Json::get_string(parsed.get(), "status") != "ok") {
                exit_code = 3;
            }
        } else {
            std::string line;
            while (std::getline(std::cin, line)) {
                line = repodb::infra::String::trim(line);
                if (line.empty()) {
                    continue;
                }
                std::cout << repodb::network::Handler::process(db, line) << std::endl;
            }
        }

        // 4. Db destructor drains the write lanes before returning.
    } catch (const std::exception& e) {
        repodb::infra::Logger::log(repodb::infra::LogLevel::FATAL,
                                   "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    repodb::infra::Logger::log(repodb::infra::LogLevel::INFO, "System: Shutdown complete.");
    return exit_code;
}
