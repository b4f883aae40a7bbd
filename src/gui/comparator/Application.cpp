#include "Application.hpp"

#include <algorithm>
#include <utility>

auto Application::create(std::vector<std::string> labels, std::vector<Simulations::MetricSeries> series)
  -> std::unique_ptr<Application>
{
    const auto window = Gui::init_window("sim-sched: comparator", WINDOW_WIDTH, WINDOW_HEIGHT);
    if (!window) { return nullptr; }

    Gui::load_default_fonts();
    Gui::black_and_red_style();

    return std::unique_ptr<Application>(new Application { *window, std::move(labels), std::move(series) });
}

void Application::render()
{
    while (!quit) {
        if (glfwWindowShouldClose(window) == 1) { quit = true; }

        glfwPollEvents();
        if (glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0) { continue; }

        Gui::new_frame();

        ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
        ImGui::SetNextWindowPos(ImVec2(0, 0));
        Gui::window(
          "sim-sched: comparator",
          Gui::WindowFlags::NoDecoration | Gui::WindowFlags::NoResize | Gui::WindowFlags::NoMove,
          [&] { draw_bar_charts(); }
        );

        Gui::draw_call(window, BACKGROUND_COLOR);
    }
}

void Application::draw_bar_charts() const
{
    auto plot_opts = Gui::Plotting::PlotOpts {
        .x_axis_flags = Gui::Plotting::AxisFlags::NoTickMarks,
        .y_axis_flags = Gui::Plotting::AxisFlags::None,
        .x_min        = -0.5,
        .x_max        = static_cast<double>(labels.size()) - 0.5,
        .y_min        = 0.0,
        .scrollable   = false,
    };

    ImPlot::PushStyleColor(ImPlotCol_FrameBg, BACKGROUND_COLOR);

    Gui::grid(series.size(), ImGui::GetContentRegionAvail(), [&](const auto& subplot_size, const auto& idx) {
        const auto& metric = series[idx];

        // Keep a visible axis when every value is zero
        plot_opts.y_max = std::max(std::ranges::max(metric.values) * 1.1, 1.0);

        Gui::title(metric.label, subplot_size, [&](const auto& remaining_size) {
            Gui::Plotting::plot(std::format("##{}", metric.label), remaining_size, plot_opts, [&] {
                Gui::Plotting::bars(labels, metric.values);
            });
        });
    });

    ImPlot::PopStyleColor();
}

Application::~Application() { Gui::shutdown(window); }

Application::Application(
  GLFWwindow*                            window,
  std::vector<std::string>               labels,
  std::vector<Simulations::MetricSeries> series
)
  : window { window },
    labels { std::move(labels) },
    series { std::move(series) }
{}
