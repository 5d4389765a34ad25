/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/argument_parser.hpp"
#include "core/logger.hpp"

#include <print>

int main(int argc, char* argv[]) {
    // Parse arguments (this also initializes the logger from --log-level)
    auto params_result = adocam::core::args::parse_args_and_params(argc, argv);
    if (!params_result) {
        LOG_ERROR("Failed to parse arguments: {}", params_result.error());
        std::println(stderr, "Error: {}\n", params_result.error());
        std::print(stderr, "{}", adocam::core::args::usage());
        return -1;
    }

    LOG_DEBUG("adocam starting");

    adocam::app::Application app;
    return app.run(*params_result);
}
