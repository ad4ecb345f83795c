#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include "exposure_evaluator.h"
#include "io/metric_parser.h"
#include "io/report.h"
#include "errors.h"

using namespace smallspot;

namespace {

// Reads one line after printing the prompt; empty optional on end of input.
std::optional<std::string> prompt(const std::string& text) {
    std::cout << text << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}

std::optional<ExposureRequest> read_request() {
    while (true) {
        auto wavelength = prompt("Enter wavelength (nm, 400-500): ");
        if (!wavelength) return std::nullopt;
        auto power = prompt("Enter power at pupil (e.g., 5u for 5 uW): ");
        if (!power) return std::nullopt;
        auto duration = prompt("Enter exposure duration (e.g., 100m for 100 ms): ");
        if (!duration) return std::nullopt;

        try {
            ExposureRequest request;
            request.wavelength_nm = parse_wavelength_nm(*wavelength);
            request.power_w = parse_metric_value(*power);
            request.duration_s = parse_metric_value(*duration);
            return request;
        } catch (const std::invalid_argument& e) {
            spdlog::warn("{}. Please try again.", e.what());
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    EvaluationConfig config;
    std::vector<std::string> values;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--pulse") {
            config.evaluate_single_pulse = true;
        } else {
            values.push_back(arg);
        }
    }

    if (!values.empty() && values.size() != 3) {
        std::cerr << "Usage: " << argv[0] << " [--pulse] [<wavelength_nm> <power> <duration>]\n";
        return 2;
    }

    try {
        ExposureEvaluator evaluator(config);

        // Non-interactive: evaluate once, report the error and exit
        if (values.size() == 3) {
            try {
                EvaluationResult result = evaluator.evaluate(
                    parse_wavelength_nm(values[0]),
                    parse_metric_value(values[2]),
                    parse_metric_value(values[1]));
                print_report(std::cout, result);
                return 0;
            } catch (const DomainError& e) {
                spdlog::error("{}", e.what());
                return 1;
            } catch (const std::invalid_argument& e) {
                spdlog::error("{}", e.what());
                return 2;
            }
        }

        while (true) {
            auto request = read_request();
            if (!request) {
                spdlog::info("No more input, exiting.");
                return 1;
            }
            try {
                EvaluationResult result = evaluator.evaluate(*request);
                print_report(std::cout, result);
                return 0;
            } catch (const DomainError& e) {
                spdlog::warn("{}. Please try again.", e.what());
            }
        }

    } catch (const std::exception& e) {
        spdlog::error("Fatal error in main: {}", e.what());
        return 1;
    }
}
