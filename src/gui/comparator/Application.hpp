#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>

#include <GLFW/glfw3.h>
#include <imgui.h>

#include "gui/Gui.hpp"
#include "simulations/Report.hpp"

class [[nodiscard]] Application final
{
  public:
    [[nodiscard]] static auto create(std::vector<std::string> labels, std::vector<Simulations::MetricSeries> series)
      -> std::unique_ptr<Application>;

    void render();

    void draw_bar_charts() const;

    ~Application();
    Application(const Application&)            = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&)                 = delete;
    Application& operator=(Application&&)      = delete;

  private:
    Application(GLFWwindow* window, std::vector<std::string> labels, std::vector<Simulations::MetricSeries> series);

  private:
    constexpr static auto WINDOW_WIDTH     = 1600;
    constexpr static auto WINDOW_HEIGHT    = 900;
    constexpr static auto BACKGROUND_COLOR = Gui::hex_colour_to_imvec4(0x181818);

  private:
    GLFWwindow* window = nullptr;
    bool        quit   = false;

    std::vector<std::string>               labels;
    std::vector<Simulations::MetricSeries> series;
};
