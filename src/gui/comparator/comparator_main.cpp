#include <filesystem>
#include <print>
#include <span>
#include <string>
#include <vector>

#include "Application.hpp"
#include "simulations/Report.hpp"

static void usage(const char* executable) { std::println("usage: {} <file1.met> <file2.met> [<file.met>...]", executable); }

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() < 3) {
        std::println(stderr, "[ERROR] expected at least two result files to compare");
        usage(args[0]);
        return 1;
    }

    std::vector<std::string>         labels;
    std::vector<Simulations::Report> reports;
    for (const auto* const arg : args.subspan(1)) {
        const auto path   = std::filesystem::path(arg);
        auto       report = Simulations::Report::load(path);
        if (!report) { return 1; }

        labels.push_back(path.stem().string());
        reports.push_back(std::move(*report));
    }

    auto series = Simulations::Report::group_metrics(reports);
    if (!series) { return 1; }

    const auto app = Application::create(std::move(labels), std::move(*series));
    if (!app) { return 1; }
    app->render();

    return 0;
}
