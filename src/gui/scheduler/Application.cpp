#include "Application.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#include "simulations/Format.hpp"
#include "simulations/Report.hpp"

constexpr static auto TABLE_FLAGS = Gui::TableFlags::Borders | Gui::TableFlags::RowBackground;

static void error_toast(const std::string& message)
{
    Gui::toast(message, std::chrono::seconds(3), Gui::ToastLevel::Error);
}

static void info_toast(const std::string& message)
{
    Gui::toast(message, std::chrono::seconds(2), Gui::ToastLevel::Info);
}

auto Application::create(const std::shared_ptr<Simulations::Workload>& workload) -> std::unique_ptr<Application>
{
    const auto window = Gui::init_window("sim-sched: scheduler", WINDOW_WIDTH, WINDOW_HEIGHT);
    if (!window) { return nullptr; }

    Gui::load_default_fonts();
    Gui::black_and_red_style();

    return std::unique_ptr<Application>(new Application { *window, workload });
}

void Application::render()
{
    while (!quit) {
        if (glfwWindowShouldClose(window) == 1) { quit = true; }

        glfwPollEvents();
        poll_pending_run();
        if (glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0) { continue; }

        Gui::new_frame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
        Gui::window(
          "sim-sched: scheduler",
          Gui::WindowFlags::NoDecoration | Gui::WindowFlags::NoResize | Gui::WindowFlags::NoMove,
          [this] {
              draw_save_button();
              ImGui::SameLine();
              draw_run_button();
              ImGui::SameLine();
              draw_schedule_policy_picker();
              ImGui::SameLine();
              draw_time_quantum_input();
              ImGui::SameLine();
              draw_random_processes_controls();

              const std::array<Gui::IndexGridCallback, 4> drawables = {
                  [&](const auto& size) { draw_processes(size); },
                  [&](const auto& size) { draw_gantt_chart(size); },
                  [&](const auto& size) { draw_metrics(size); },
                  [&](const auto& size) { draw_per_process_metrics(size); },
              };

              const auto available_space = ImGui::GetContentRegionAvail();
              Gui::grid(2UZ, 2UZ, 4UZ, available_space, [&](const auto& child_size, const auto& idx) {
                  drawables[idx](child_size);
              });
          }
        );

        Gui::draw_call(window, BACKGROUND_COLOR);
    }
}

void Application::draw_save_button()
{
    if (show_save_path) {
        const auto file_path = Gui::input_text_popup("Enter file path", show_save_path);
        if (file_path.has_value()) {
            if (file_path->empty()) {
                error_toast("Failed to save simulation: empty path");
            } else if (Simulations::Report::save(*file_path, *last_result)) {
                info_toast(std::format("Saved simulation result to {}", *file_path));
            } else {
                error_toast(std::format("Failed to save simulation to {}", *file_path));
            }
        }
    }

    if (last_result && ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S, false)) { show_save_path = true; }

    Gui::enabled_if(last_result.has_value(), [&] {
        Gui::image_button(save_texture, BUTTON_SIZE, "[Ctrl+S]ave Results", [&] { show_save_path = true; });
    });
}

void Application::draw_run_button()
{
    const auto running = pending_run.valid();

    if (!running && ImGui::GetIO().KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_R, false)) { start_run(); }

    Gui::disabled_if(running, [&] {
        Gui::image_button(play_texture, BUTTON_SIZE, "[Ctrl+R]un", [this] { start_run(); });
    });

    if (running) {
        ImGui::SameLine();
        Gui::text("Running...");
    }
}

void Application::draw_random_processes_controls()
{
    ImGui::SetNextItemWidth(120.0F);
    ImGui::InputInt("##RandomCount", &random_count);
    random_count = std::clamp(random_count, 1, MAX_RANDOM_PROCESSES);

    ImGui::SameLine();

    Gui::image_button(random_texture, BUTTON_SIZE, "Generate random processes", [this] {
        workload->randomize(static_cast<std::size_t>(random_count), Simulations::Workload::GUI_ARRIVAL_SPREAD);
        reset_process_form();
        info_toast(std::format("Generated {} random processes", random_count));
    });
}

void Application::draw_schedule_policy_picker()
{
    ImGui::SetNextItemWidth(280.0F);
    Gui::combo(
      "##SchedulePolicyPicker",
      std::span<const Simulations::SchedulePolicy>(Simulations::ALL_SCHEDULE_POLICIES),
      workload->schedule_policy,
      [&](const auto& selected) { workload->schedule_policy = selected; }
    );
}

void Application::draw_time_quantum_input()
{
    Gui::enabled_if(workload->schedule_policy == Simulations::SchedulePolicy::RoundRobin, [&] {
        ImGui::SetNextItemWidth(120.0F);
        ImGui::InputDouble("Time quantum", &workload->time_quantum, 0.5, 1.0, "%.2f");
    });
}

void Application::draw_processes(const ImVec2& child_size)
{
    Gui::title("Processes", child_size, [&](const auto& remaining_size) {
        draw_process_form();
        ImGui::Separator();

        std::optional<std::size_t> to_remove;

        constexpr static auto HEADERS    = std::array { "PID", "Arrival", "Burst", "Priority", "" };
        const auto            table_size = ImVec2(remaining_size.x, ImGui::GetContentRegionAvail().y);
        Gui::child("##ProcessTable", table_size, Gui::ChildFlags::None, Gui::WindowFlags::None, [&] {
            Gui::draw_table("ProcessTable", HEADERS, TABLE_FLAGS | Gui::TableFlags::ScrollY, [&] {
                for (std::size_t idx = 0; idx < workload->processes.size(); ++idx) {
                    const auto& process = workload->processes[idx];

                    ImGui::PushID(static_cast<int>(idx));
                    Gui::draw_table_row(
                      [&] { Gui::text("{}", process.pid); },
                      [&] { Gui::text("{:.2f}", process.arrival_time); },
                      [&] { Gui::text("{:.2f}", process.burst_time); },
                      [&] {
                          if (process.priority) {
                              Gui::text("{}", *process.priority);
                          } else {
                              Gui::text("-");
                          }
                      },
                      [&] {
                          Gui::button("Edit", [&] {
                              form = ProcessForm {
                                  .arrival_time = process.arrival_time,
                                  .burst_time   = process.burst_time,
                                  .has_priority = process.has_priority(),
                                  .priority     = process.priority.value_or(0),
                                  .editing      = idx,
                              };
                              std::strncpy(form.pid.data(), process.pid.c_str(), form.pid.size() - 1);
                          });
                          ImGui::SameLine();
                          Gui::button("Remove", [&] { to_remove = idx; });
                      }
                    );
                    ImGui::PopID();
                }
            });
        });

        if (to_remove) {
            workload->processes.erase(workload->processes.begin() + static_cast<std::ptrdiff_t>(*to_remove));
            reset_process_form();
        }
    });
}

void Application::draw_process_form()
{
    ImGui::SetNextItemWidth(100.0F);
    ImGui::InputText("PID", form.pid.data(), form.pid.size());
    ImGui::SameLine();
    ImGui::SetNextItemWidth(100.0F);
    ImGui::InputDouble("Arrival", &form.arrival_time, 0.0, 0.0, "%.2f");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(100.0F);
    ImGui::InputDouble("Burst", &form.burst_time, 0.0, 0.0, "%.2f");

    ImGui::Checkbox("Priority", &form.has_priority);
    ImGui::SameLine();
    Gui::enabled_if(form.has_priority, [&] {
        ImGui::SetNextItemWidth(100.0F);
        ImGui::InputInt("##Priority", &form.priority);
    });
    ImGui::SameLine();

    Gui::button(form.editing ? "Update" : "Add", [this] { submit_process_form(); });

    if (form.editing) {
        ImGui::SameLine();
        Gui::button("Cancel", [this] { reset_process_form(); });
    }

    ImGui::SameLine();
    Gui::enabled_if(!workload->processes.empty(), [&] {
        Gui::image_button(restart_texture, BUTTON_SIZE, "Clear processes", [this] {
            workload->processes.clear();
            reset_process_form();
        });
    });
}

void Application::submit_process_form()
{
    const auto pid = std::string(form.pid.data());

    if (pid.empty()) {
        error_toast("Process ID must not be empty");
        return;
    }
    if (form.arrival_time < 0.0) {
        error_toast("Arrival time must not be negative");
        return;
    }
    if (form.burst_time <= 0.0) {
        error_toast("Burst time must be positive");
        return;
    }
    if (form.has_priority && form.priority < 0) {
        error_toast("Priority must not be negative");
        return;
    }

    const auto& processes = workload->processes;
    for (std::size_t idx = 0; idx < processes.size(); ++idx) {
        if (processes[idx].pid == pid && form.editing != idx) {
            error_toast(std::format("Process {} already exists", pid));
            return;
        }
    }

    auto process = Os::Process {
        .pid          = pid,
        .arrival_time = form.arrival_time,
        .burst_time   = form.burst_time,
        .priority     = form.has_priority ? std::optional(form.priority) : std::nullopt,
    };

    if (form.editing) {
        workload->processes[*form.editing] = std::move(process);
    } else {
        workload->processes.push_back(std::move(process));
    }

    reset_process_form();
}

void Application::reset_process_form() { form = ProcessForm {}; }

void Application::start_run()
{
    if (pending_run.valid()) { return; }

    pending_run = std::async(
      std::launch::async,
      [processes = workload->processes, policy = workload->schedule_policy, quantum = workload->time_quantum] {
          return Simulations::simulate(policy, processes, quantum);
      }
    );
}

void Application::poll_pending_run()
{
    if (!pending_run.valid()) { return; }
    if (pending_run.wait_for(std::chrono::seconds(0)) != std::future_status::ready) { return; }

    auto result = pending_run.get();
    if (!result) {
        error_toast(std::format("{}", result.error()));
        return;
    }

    last_result = std::move(*result);
}

void Application::draw_gantt_chart(const ImVec2& child_size) const
{
    Gui::title("Gantt chart", child_size, [&](const auto& remaining_size) {
        if (!last_result || last_result->schedule.empty()) {
            Gui::text("Run a simulation to see its schedule");
            return;
        }

        const auto& schedule = last_result->schedule;

        std::vector<std::string> rows;
        bool                     has_idle = false;
        for (const auto& entry : schedule) {
            if (entry.idle()) {
                has_idle = true;
            } else if (std::ranges::find(rows, *entry.pid) == rows.end()) {
                rows.push_back(*entry.pid);
            }
        }
        if (has_idle) { rows.emplace_back("IDLE"); }

        std::vector<Gui::Plotting::GanttBar> bars;
        bars.reserve(schedule.size());
        for (const auto& entry : schedule) {
            const auto label = entry.pid.value_or("IDLE");
            const auto row   = static_cast<std::size_t>(std::ranges::find(rows, label) - rows.begin());
            bars.push_back(Gui::Plotting::GanttBar {
              .row     = row,
              .start   = entry.start_time,
              .end     = entry.end_time,
              .tooltip = std::format("{} (duration {:.2f})", entry, entry.duration()),
              .muted   = entry.idle(),
            });
        }

        const auto plot_opts = Gui::Plotting::PlotOpts {
            .x_axis_flags = Gui::Plotting::AxisFlags::None,
            .y_axis_flags = Gui::Plotting::AxisFlags::Invert,
            .x_min        = 0.0,
            .x_max        = schedule.back().end_time,
            .y_min        = -0.5,
            .y_max        = static_cast<double>(rows.size()) - 0.5,
            .x_label      = "time",
            .scrollable   = false,
        };

        Gui::Plotting::plot(std::format("{}##GanttPlot", last_result->algorithm_name), remaining_size, plot_opts, [&] {
            Gui::Plotting::gantt(rows, bars);
        });
    });
}

void Application::draw_metrics(const ImVec2& child_size) const
{
    Gui::title("Metrics", child_size, [&](const auto&) {
        if (!last_result || !last_result->metrics) {
            Gui::text("No metrics available");
            return;
        }

        const auto& metrics = *last_result->metrics;

        constexpr static auto HEADERS = std::array { "Metric", "Value" };
        Gui::draw_table("MetricsTable", HEADERS, TABLE_FLAGS, [&] {
            const auto draw_key_value = [](const std::string_view key, const auto& value) {
                Gui::draw_table_row([&] { Gui::text("{}", key); }, [&] { Gui::text("{}", value); });
            };

            draw_key_value("Algorithm", last_result->algorithm_name);
            draw_key_value("Avg. turnaround time", std::format("{:.2f}", metrics.average_turnaround_time));
            draw_key_value("Avg. waiting time", std::format("{:.2f}", metrics.average_waiting_time));
            draw_key_value("CPU utilization", std::format("{:.2f}%", metrics.cpu_utilization));
            draw_key_value("Total processes", metrics.total_processes);
            draw_key_value("Total time", std::format("{:.2f}", metrics.total_time));
        });
    });
}

void Application::draw_per_process_metrics(const ImVec2& child_size) const
{
    Gui::title("Per-process metrics", child_size, [&](const auto& remaining_size) {
        if (!last_result || !last_result->metrics) {
            Gui::text("No metrics available");
            return;
        }

        constexpr static auto HEADERS = std::array { "PID", "Completion", "Turnaround", "Waiting" };
        Gui::child("##PerProcessTable", remaining_size, Gui::ChildFlags::None, Gui::WindowFlags::None, [&] {
            Gui::draw_table("PerProcessTable", HEADERS, TABLE_FLAGS | Gui::TableFlags::ScrollY, [&] {
                for (const auto& process : last_result->metrics->per_process) {
                    Gui::draw_table_row(
                      [&] { Gui::text("{}", process.pid); },
                      [&] { Gui::text("{:.2f}", process.completion_time); },
                      [&] { Gui::text("{:.2f}", process.turnaround_time); },
                      [&] { Gui::text("{:.2f}", process.waiting_time); }
                    );
                }
            });
        });
    });
}

Application::Application(GLFWwindow* window, const std::shared_ptr<Simulations::Workload>& workload)
  : window { window },
    workload { workload },
    play_texture { Gui::Texture::load_from_file("resources/play.png") },
    save_texture { Gui::Texture::load_from_file("resources/save.png") },
    random_texture { Gui::Texture::load_from_file("resources/random.png") },
    restart_texture { Gui::Texture::load_from_file("resources/restart.png") }
{}

Application::~Application()
{
    if (pending_run.valid()) { pending_run.wait(); }
    Gui::shutdown(window);
}
