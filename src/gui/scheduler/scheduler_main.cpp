#include <memory>
#include <print>
#include <span>

#include "Application.hpp"
#include "lang/Interpreter.hpp"
#include "simulations/Workload.hpp"
#include "Util.hpp"

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() > 2) {
        std::println(stderr, "[ERROR] expected at most one workload script");
        std::println("usage: {} [workload.sl]", args[0]);
        return 1;
    }

    auto workload = std::make_shared<Simulations::Workload>();

    if (args.size() == 2) {
        const auto* const script_path    = args[1];
        const auto        script_content = Util::read_entire_file(script_path);
        if (!script_content) { return 1; }

        if (!Interpreter::Interpreter<Simulations::Workload>::eval(*script_content, workload)) {
            std::println(stderr, "[ERROR] Could not correctly evaluate script {}", script_path);
            return 1;
        }
    }

    auto app = Application::create(workload);
    if (!app) { return 1; }
    app->render();

    return 0;
}
