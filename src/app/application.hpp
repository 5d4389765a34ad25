/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/argument_parser.hpp"
#include <expected>
#include <string>

namespace adocam::app {

    class Application {
    public:
        int run(const core::args::AppParameters& params);

    private:
        std::expected<void, std::string> runInfo(const core::args::AppParameters& params);
        std::expected<void, std::string> runSample(const core::args::AppParameters& params);
        std::expected<void, std::string> runExport(const core::args::AppParameters& params);
        std::expected<void, std::string> runCurve(const core::args::AppParameters& params);
    };

} // namespace adocam::app
