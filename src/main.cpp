/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundstation.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>

/** Program entry point */
int main(int argc, char* argv[]) {

    groundstation::Config config;

    std::string configFile = "/etc/groundstation.toml";

    CLI::App app{"Groundstation"};
    argv = app.ensure_utf8(argv);

    groundstation::addConfigOptions(app, config, configFile);

    CLI11_PARSE(app, argc, argv);

    try {
        config.validate();
    } catch (const groundstation::ConfigException &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    groundstation::initLogging(config);

    try {
        groundstation::Daemon daemon(std::move(config));
        daemon.start();
        daemon.wait();
    } catch (const std::exception &e) {
        spdlog::critical("Ground station failed: {}", e.what());
        return 1;
    }

    return 0;
}
