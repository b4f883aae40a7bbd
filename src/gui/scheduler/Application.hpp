#pragma once

#include <array>
#include <future>
#include <memory>
#include <optional>

#include <imgui.h>

#include "gui/Gui.hpp"
#include "simulations/Workload.hpp"

class [[nodiscard]] Application final
{
  public:
    [[nodiscard]] static auto create(const std::shared_ptr<Simulations::Workload>& workload)
      -> std::unique_ptr<Application>;

    void render();

    void draw_save_button();
    void draw_run_button();
    void draw_random_processes_controls();
    void draw_schedule_policy_picker();
    void draw_time_quantum_input();

    void draw_processes(const ImVec2& child_size);
    void draw_process_form();
    void draw_gantt_chart(const ImVec2& child_size) const;
    void draw_metrics(const ImVec2& child_size) const;
    void draw_per_process_metrics(const ImVec2& child_size) const;

    ~Application();
    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&)                 = delete;
    Application& operator=(Application&&)      = delete;

  private:
    explicit Application(GLFWwindow* window, const std::shared_ptr<Simulations::Workload>& workload);

    void start_run();
    void poll_pending_run();
    void submit_process_form();
    void reset_process_form();

  private:
    constexpr static auto WINDOW_WIDTH          = 1600;
    constexpr static auto WINDOW_HEIGHT         = 900;
    constexpr static auto BACKGROUND_COLOR      = Gui::hex_colour_to_imvec4(0x181818);
    constexpr static auto BUTTON_SIZE           = ImVec2(16, 16);
    constexpr static auto MAX_RANDOM_PROCESSES  = 1000;
    constexpr static auto PID_CAPACITY          = 32UZ;

    struct [[nodiscard]] ProcessForm final
    {
        std::array<char, PID_CAPACITY> pid {};
        double                          arrival_time = 0.0;
        double                          burst_time   = 1.0;
        bool                            has_priority = false;
        int                             priority     = 0;

        // Index of the process being edited, std::nullopt while adding
        std::optional<std::size_t> editing;
    };

  private:
    GLFWwindow*                                     window = nullptr;
    bool                                            quit   = false;
    std::shared_ptr<Simulations::Workload>          workload;
    std::future<Simulations::Result>                pending_run;
    std::optional<Simulations::SchedulingResult>    last_result;
    ProcessForm                                     form;
    int                                             random_count   = 10;
    bool                                            show_save_path = false;
    Gui::Texture                                    play_texture;
    Gui::Texture                                    save_texture;
    Gui::Texture                                    random_texture;
    Gui::Texture                                    restart_texture;
};
