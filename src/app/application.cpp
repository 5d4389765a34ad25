/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/application.hpp"
#include "core/logger.hpp"
#include "editor/camera_editor.hpp"
#include "sequencer/easing_curve.hpp"

#include <print>

namespace adocam::app {

    using core::args::AppParameters;
    using core::args::Command;

    namespace {
        void printState(const sequencer::CameraState& s) {
            std::println("{:.3f} {:.3f} {:.3f} {:.3f}", s.position.x, s.position.y, s.zoom, s.angle);
        }
    } // namespace

    int Application::run(const AppParameters& params) {
        if (params.show_help) {
            std::print("{}", core::args::usage());
            return 0;
        }

        std::expected<void, std::string> result;
        switch (params.command) {
        case Command::INFO: result = runInfo(params); break;
        case Command::SAMPLE: result = runSample(params); break;
        case Command::EXPORT: result = runExport(params); break;
        case Command::CURVE: result = runCurve(params); break;
        case Command::NONE:
            std::print(stderr, "{}", core::args::usage());
            return 1;
        }

        if (!result) {
            LOG_ERROR("{}", result.error());
            std::println(stderr, "Error: {}", result.error());
            core::Logger::get().flush();
            return 1;
        }
        core::Logger::get().flush();
        return 0;
    }

    std::expected<void, std::string> Application::runInfo(const AppParameters& params) {
        editor::CameraEditor editor(params.editor);
        if (auto opened = editor.open(params.level_path); !opened) {
            return opened;
        }

        const auto& track = editor.track();
        std::println("Level:         {}", params.level_path.filename().string());
        std::println("BPM:           {}", editor.level().bpm());
        std::println("Tiles:         {}", editor.timing().floorCount());
        std::println("Level length:  {:.1f} ms", editor.timing().duration());
        std::println("Camera events: {}", editor.cameraEventCount());
        std::println("Keyframes:     {}", track.size());
        if (!track.empty()) {
            std::println("Camera span:   {} .. {} ms ({} ms)", track.startTime(), track.endTime(), track.duration());
        }
        return {};
    }

    std::expected<void, std::string> Application::runSample(const AppParameters& params) {
        editor::CameraEditor editor(params.editor);
        if (auto opened = editor.open(params.level_path); !opened) {
            return opened;
        }

        const double start = *params.time_ms;
        if (!params.end_ms) {
            printState(editor.track().stateAt(start));
            return {};
        }

        const double step = params.step_ms.value_or(static_cast<double>(params.editor.path_step_ms));
        const double end = *params.end_ms;
        for (size_t i = 0;; ++i) {
            const double t = start + static_cast<double>(i) * step;
            if (t > end) break;
            std::print("{:.1f} ", t);
            printState(editor.track().stateAt(t));
        }
        return {};
    }

    std::expected<void, std::string> Application::runExport(const AppParameters& params) {
        editor::CameraEditor editor(params.editor);
        if (auto opened = editor.open(params.level_path); !opened) {
            return opened;
        }
        if (auto saved = editor.save(params.output_path); !saved) {
            return saved;
        }
        std::println("Exported {} camera events to {}", editor.cameraEventCount(), params.output_path.string());
        return {};
    }

    std::expected<void, std::string> Application::runCurve(const AppParameters& params) {
        auto curve = sequencer::EasingCurve::fromName(params.ease_name);
        const size_t count = params.curve_samples.value_or(params.editor.preview_samples);
        curve.regenerateSamples(count);

        LOG_DEBUG("Sampling {} with {} points", curve.name(), count);
        const auto& samples = curve.samples();
        for (size_t i = 0; i < samples.size(); ++i) {
            const double t = samples.size() > 1 ? static_cast<double>(i) / static_cast<double>(samples.size() - 1) : 1.0;
            std::println("{:.4f} {:.6f}", t, samples[i]);
        }
        return {};
    }

} // namespace adocam::app
