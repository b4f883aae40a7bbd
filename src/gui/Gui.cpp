#include "Gui.hpp"

#include <algorithm>
#include <array>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

static void glfw_error_callback(int error, const char* description)
{
    std::println(stderr, "[ERROR] (GLFW) error {}: {}", error, description);
}

namespace
{
ImFont* regular_font_handle = nullptr;
ImFont* bold_font_handle    = nullptr;

constexpr auto INFO_COLOUR  = ImVec4(0.2F, 0.6F, 1.0F, 1.0F);
constexpr auto ERROR_COLOUR = ImVec4(1.0F, 0.2F, 0.2F, 1.0F);

constexpr auto GLSL_VERSION      = "#version 330";
constexpr auto REGULAR_FONT_PATH = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
constexpr auto BOLD_FONT_PATH    = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";

auto bold_font() -> ImFont*
{
    return bold_font_handle != nullptr ? bold_font_handle : ImGui::GetFont();
}
} // namespace

namespace Gui
{

auto init_window(const std::string& title, const int width, const int height) -> std::optional<GLFWwindow*>
{
    glfwSetErrorCallback(glfw_error_callback);

    if (glfwInit() == 0) {
        std::println(stderr, "[ERROR] (GLFW) failed to initialize");
        return std::nullopt;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (window == nullptr) {
        std::println(stderr, "[ERROR] (GLFW) failed to create window");
        glfwTerminate();
        return std::nullopt;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(GLSL_VERSION);

    return window;
}

void shutdown(GLFWwindow* window)
{
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
}

void new_frame()
{
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void draw_call(GLFWwindow* window, const ImVec4& clear_color)
{
    ToastManager::render();
    ImGui::Render();
    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(
      clear_color.x * clear_color.w, clear_color.y * clear_color.w, clear_color.z * clear_color.w, clear_color.w
    );
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window);
}

void load_default_fonts(const float regular_size, const float bold_size)
{
    auto& io = ImGui::GetIO();

    if (!std::filesystem::exists(REGULAR_FONT_PATH) || !std::filesystem::exists(BOLD_FONT_PATH)) {
        std::println(stderr, "[NOTE] (gui) DejaVu fonts not found, using the built-in font");
        regular_font_handle = io.Fonts->AddFontDefault();
        bold_font_handle    = regular_font_handle;
        return;
    }

    io.Fonts->Clear();
    regular_font_handle = io.Fonts->AddFontFromFileTTF(REGULAR_FONT_PATH, regular_size);
    io.FontDefault      = regular_font_handle;
    bold_font_handle    = io.Fonts->AddFontFromFileTTF(BOLD_FONT_PATH, bold_size);
}

void black_and_red_style()
{
    constexpr static auto BLACK      = 0x0F0F0FU;
    constexpr static auto DARK_GRAY  = 0x1E1E1EU;
    constexpr static auto GRAY       = 0x2D2D2DU;
    constexpr static auto LIGHT_GRAY = 0x3C3C3CU;
    constexpr static auto DARK_RED   = 0x8B0000U;
    constexpr static auto RED        = 0xB22222U;
    constexpr static auto LIGHT_RED  = 0xDC3C3CU;
    constexpr static auto WHITE      = 0xE6E6E6U;

    auto& style            = ImGui::GetStyle();
    style.WindowRounding   = 4.0F;
    style.ChildRounding    = 4.0F;
    style.FrameRounding    = 3.0F;
    style.GrabRounding     = 3.0F;
    style.PopupRounding    = 3.0F;
    style.ScrollbarRounding = 3.0F;
    style.WindowBorderSize = 1.0F;

    auto& colors                          = style.Colors;
    colors[ImGuiCol_Text]                 = hex_colour_to_imvec4(WHITE);
    colors[ImGuiCol_TextDisabled]         = hex_colour_to_imvec4(WHITE, 0.4F);
    colors[ImGuiCol_WindowBg]             = hex_colour_to_imvec4(BLACK);
    colors[ImGuiCol_ChildBg]              = hex_colour_to_imvec4(DARK_GRAY);
    colors[ImGuiCol_PopupBg]              = hex_colour_to_imvec4(DARK_GRAY);
    colors[ImGuiCol_Border]               = hex_colour_to_imvec4(LIGHT_GRAY);
    colors[ImGuiCol_FrameBg]              = hex_colour_to_imvec4(GRAY);
    colors[ImGuiCol_FrameBgHovered]       = hex_colour_to_imvec4(LIGHT_GRAY);
    colors[ImGuiCol_FrameBgActive]        = hex_colour_to_imvec4(DARK_RED);
    colors[ImGuiCol_TitleBg]              = hex_colour_to_imvec4(DARK_GRAY);
    colors[ImGuiCol_TitleBgActive]        = hex_colour_to_imvec4(DARK_RED);
    colors[ImGuiCol_CheckMark]            = hex_colour_to_imvec4(LIGHT_RED);
    colors[ImGuiCol_SliderGrab]           = hex_colour_to_imvec4(RED);
    colors[ImGuiCol_SliderGrabActive]     = hex_colour_to_imvec4(LIGHT_RED);
    colors[ImGuiCol_Button]               = hex_colour_to_imvec4(DARK_RED);
    colors[ImGuiCol_ButtonHovered]        = hex_colour_to_imvec4(RED);
    colors[ImGuiCol_ButtonActive]         = hex_colour_to_imvec4(LIGHT_RED);
    colors[ImGuiCol_Header]               = hex_colour_to_imvec4(DARK_RED);
    colors[ImGuiCol_HeaderHovered]        = hex_colour_to_imvec4(RED);
    colors[ImGuiCol_HeaderActive]         = hex_colour_to_imvec4(LIGHT_RED);
    colors[ImGuiCol_TableHeaderBg]        = hex_colour_to_imvec4(GRAY);
    colors[ImGuiCol_TableRowBg]           = hex_colour_to_imvec4(DARK_GRAY);
    colors[ImGuiCol_TableRowBgAlt]        = hex_colour_to_imvec4(GRAY);
    colors[ImGuiCol_ModalWindowDimBg]     = hex_colour_to_imvec4(BLACK, 0.6F);
}

auto Texture::load_from_file(const std::filesystem::path& path) -> Texture
{
    int           width    = -1;
    int           height   = -1;
    int           channels = -1;
    std::uint8_t* bytes    = stbi_load(path.string().c_str(), &width, &height, &channels, 4);
    if (bytes == nullptr) {
        std::println(stderr, "[ERROR] (stb) failed to load file: {}", path.string());
        return Texture(std::nullopt);
    }

    GLuint texture_id = 0;
    glGenTextures(1, &texture_id);
    glBindTexture(GL_TEXTURE_2D, texture_id);

    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, bytes);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

    stbi_image_free(bytes);

    return Texture(texture_id);
}

auto grid_layout_calc_size(const std::size_t rows, const std::size_t cols, const ImVec2& available_space) -> ImVec2
{
    const auto spacing = ImGui::GetStyle().ItemSpacing;

    return {
        (available_space.x - (spacing.x * static_cast<float>(cols))) / static_cast<float>(cols),
        (available_space.y - (spacing.y * static_cast<float>(rows))) / static_cast<float>(rows),
    };
}

void ToastManager::render()
{
    const auto delta_time = std::chrono::duration<float>(ImGui::GetIO().DeltaTime);
    const auto spacing    = ImGui::GetStyle().ItemSpacing;
    const auto* viewport  = ImGui::GetMainViewport();

    std::erase_if(toasts, [&](Toast& toast) {
        toast.duration -= delta_time;
        return toast.duration <= std::chrono::seconds(0);
    });

    // Newest toast sits in the bottom right corner, older ones stack above it
    auto bottom = viewport->WorkPos.y + viewport->WorkSize.y - spacing.y;
    for (std::size_t idx = toasts.size(); idx-- > 0;) {
        const auto& toast      = toasts[idx];
        const auto  toast_size = ImVec2(ImGui::CalcTextSize(toast.message.c_str()).x + (spacing.x * 2), 30);

        bottom -= toast_size.y;
        ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x + viewport->WorkSize.x - toast_size.x - spacing.x, bottom));
        ImGui::SetNextWindowSize(toast_size);

        constexpr static auto window_flags = WindowFlags::NoDecoration | WindowFlags::NoSavedSettings;
        Gui::window(std::format("##Toast{}", idx), window_flags, [&] {
            ImGui::PushStyleColor(ImGuiCol_Text, toast.level == ToastLevel::Error ? ERROR_COLOUR : INFO_COLOUR);
            Gui::text("{}", toast.message);
            ImGui::PopStyleColor();
        });

        bottom -= spacing.y;
    }
}

void toast(const std::string& message, const std::chrono::duration<float> duration, const ToastLevel level)
{
    ToastManager::add(Toast { .message = message, .duration = duration, .level = level });
}

auto input_text_popup(const std::string& label, bool& condition) -> std::optional<std::string>
{
    static std::array<char, 256> buffer {};

    const auto center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5F, 0.5F));

    ImGui::OpenPopup("##InputPopup");
    if (ImGui::BeginPopupModal("##InputPopup", &condition, ImGuiWindowFlags_AlwaysAutoResize)) {
        if (ImGui::IsWindowAppearing()) { ImGui::SetKeyboardFocusHere(); }

        if (ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            condition = false;
            buffer.fill('\0');
            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return std::nullopt;
        }

        ImGui::PushFont(bold_font());
        Gui::text("{}: ", label);
        ImGui::PopFont();
        ImGui::SameLine();

        if (ImGui::InputText("##InputText", buffer.data(), buffer.size(), ImGuiInputTextFlags_EnterReturnsTrue)) {
            auto result = std::string(buffer.data());
            condition   = false;
            buffer.fill('\0');

            ImGui::CloseCurrentPopup();
            ImGui::EndPopup();
            return result;
        }

        ImGui::EndPopup();
    }

    return std::nullopt;
}

namespace Plotting
{

void bars(const std::span<const std::string> labels, const std::span<const double> values)
{
    constexpr static auto BAR_WIDTH = 0.5;

    std::vector<const char*> labels_cstr;
    std::vector<double>      positions;
    for (std::size_t idx = 0; idx < labels.size(); ++idx) {
        labels_cstr.push_back(labels[idx].c_str());
        positions.push_back(static_cast<double>(idx));
    }

    ImPlot::SetupAxisTicks(ImAxis_X1, positions.data(), static_cast<int>(positions.size()), labels_cstr.data());

    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        ImPlot::PushStyleColor(
          ImPlotCol_Fill, ImPlot::GetColormapColor(static_cast<int>(idx) % ImPlot::GetColormapSize())
        );
        ImPlot::PlotBars(labels_cstr[idx], &positions[idx], &values[idx], 1, BAR_WIDTH);
        ImPlot::PopStyleColor();
    }

    if (!ImPlot::IsPlotHovered()) { return; }

    const auto mouse_position = ImPlot::GetPlotMousePos();
    for (std::size_t idx = 0; idx < values.size(); ++idx) {
        const auto x_range = ImPlotRange(positions[idx] - (BAR_WIDTH / 2.0), positions[idx] + (BAR_WIDTH / 2.0));
        const auto y_range = ImPlotRange(0, values[idx]);

        if (x_range.Contains(mouse_position.x) && y_range.Contains(mouse_position.y)) {
            Gui::tooltip("{}: {:.2f}", labels[idx], values[idx]);
        }
    }
}

void gantt(const std::span<const std::string> row_labels, const std::span<const GanttBar> bars)
{
    constexpr static auto BAR_HEIGHT = 0.6;
    constexpr static auto MUTED      = 0x5A5A5AU;

    std::vector<const char*> labels_cstr;
    std::vector<double>      positions;
    for (std::size_t idx = 0; idx < row_labels.size(); ++idx) {
        labels_cstr.push_back(row_labels[idx].c_str());
        positions.push_back(static_cast<double>(idx));
    }

    ImPlot::SetupAxisTicks(ImAxis_Y1, positions.data(), static_cast<int>(positions.size()), labels_cstr.data());

    const auto      mouse_position = ImPlot::GetPlotMousePos();
    const GanttBar* hovered        = nullptr;

    ImPlot::PushPlotClipRect();
    auto* draw_list = ImPlot::GetPlotDrawList();
    for (const auto& bar : bars) {
        const auto row    = static_cast<double>(bar.row);
        const auto corner = ImPlot::PlotToPixels(bar.start, row - (BAR_HEIGHT / 2.0));
        const auto other  = ImPlot::PlotToPixels(bar.end, row + (BAR_HEIGHT / 2.0));
        const auto min    = ImVec2(std::min(corner.x, other.x), std::min(corner.y, other.y));
        const auto max    = ImVec2(std::max(corner.x, other.x), std::max(corner.y, other.y));

        const auto colour = bar.muted
                            ? hex_colour_to_imvec4(MUTED)
                            : ImPlot::GetColormapColor(static_cast<int>(bar.row) % ImPlot::GetColormapSize());
        draw_list->AddRectFilled(min, max, ImGui::GetColorU32(colour));
        draw_list->AddRect(min, max, IM_COL32(0, 0, 0, 255));

        const auto inside_x = mouse_position.x >= bar.start && mouse_position.x <= bar.end;
        const auto inside_y = std::abs(mouse_position.y - row) <= BAR_HEIGHT / 2.0;
        if (inside_x && inside_y) { hovered = &bar; }
    }
    ImPlot::PopPlotClipRect();

    if (hovered != nullptr && ImPlot::IsPlotHovered()) { Gui::tooltip("{}", hovered->tooltip); }
}

} // namespace Plotting

} // namespace Gui
