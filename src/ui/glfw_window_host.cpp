#ifdef KESTREL_USE_GLFW

    #include "glfw_window_host.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <kestrel/logger.hpp>
    #include <kestrel/shell.hpp>

namespace kestrel
{

GlfwWindowHost::~GlfwWindowHost()
{
    shutdown();
}

bool GlfwWindowHost::init()
{
    if (initialized_)
        return true;
    if (!glfwInit())
    {
        KESTREL_LOG_ERROR("glfw", "Failed to initialize GLFW");
        return false;
    }
    initialized_ = true;
    return true;
}

WindowId GlfwWindowHost::open(uint32_t width, uint32_t height, const std::string& title)
{
    if (!initialized_)
    {
        KESTREL_LOG_ERROR("glfw", "open: GLFW not initialized");
        return INVALID_WINDOW_ID;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);   // the render engine owns drawing
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(
        static_cast<int>(width), static_cast<int>(height), title.c_str(), nullptr, nullptr);
    if (!window)
    {
        KESTREL_LOG_ERROR("glfw", "Failed to create window '{}'", title);
        return INVALID_WINDOW_ID;
    }

    WindowContext ctx;
    ctx.title  = title;
    ctx.width  = width;
    ctx.height = height;
    glfwGetWindowPos(window, &ctx.x, &ctx.y);

    WindowId id = shell_.open_window(std::move(ctx));
    if (id == INVALID_WINDOW_ID)
    {
        glfwDestroyWindow(window);
        return INVALID_WINDOW_ID;
    }

    windows_[id] = window;

    // Store this pointer for static callbacks
    glfwSetWindowUserPointer(window, this);

    glfwSetWindowCloseCallback(window, close_callback);
    glfwSetWindowFocusCallback(window, focus_callback);
    glfwSetCursorPosCallback(window, cursor_pos_callback);
    glfwSetCursorEnterCallback(window, cursor_enter_callback);
    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetWindowSizeCallback(window, window_size_callback);

    KESTREL_LOG_INFO("glfw", "Opened window {} ({}x{})", id, width, height);
    return id;
}

void GlfwWindowHost::close(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
        return;

    GLFWwindow* window = it->second;
    windows_.erase(it);
    shell_.close_window(id);
    pending_destroy_.push_back(window);
}

void GlfwWindowHost::poll_events()
{
    glfwPollEvents();
    destroy_pending();
}

void GlfwWindowHost::shutdown()
{
    std::vector<WindowId> ids;
    ids.reserve(windows_.size());
    for (const auto& [id, window] : windows_)
        ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    for (WindowId id : ids)
        close(id);
    destroy_pending();

    if (initialized_)
    {
        glfwTerminate();
        initialized_ = false;
    }
}

void* GlfwWindowHost::native_window(WindowId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? static_cast<void*>(it->second) : nullptr;
}

WindowId GlfwWindowHost::id_of(GLFWwindow* window) const
{
    for (const auto& [id, w] : windows_)
    {
        if (w == window)
            return id;
    }
    return INVALID_WINDOW_ID;
}

void GlfwWindowHost::destroy_pending()
{
    // glfwDestroyWindow must not run inside a GLFW callback.
    for (GLFWwindow* window : pending_destroy_)
        glfwDestroyWindow(window);
    pending_destroy_.clear();
}

// ─── Static callback trampolines ────────────────────────────────────────────

void GlfwWindowHost::close_callback(GLFWwindow* window)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    WindowId id = host->id_of(window);
    if (id != INVALID_WINDOW_ID)
        host->close(id);
}

void GlfwWindowHost::focus_callback(GLFWwindow* window, int focused)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (host && focused == GLFW_TRUE)
        host->shell_.focus_window(host->id_of(window));
}

void GlfwWindowHost::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;

    Point pos{static_cast<float>(x), static_cast<float>(y)};
    if (host->shell_.pointer_moved(pos) && host->callbacks_.on_drag_move)
        host->callbacks_.on_drag_move(host->id_of(window), x, y);
}

void GlfwWindowHost::cursor_enter_callback(GLFWwindow* window, int entered)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (host)
        host->shell_.set_drag_outside_window(entered != GLFW_TRUE);
}

void GlfwWindowHost::mouse_button_callback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host || button != GLFW_MOUSE_BUTTON_LEFT)
        return;

    double x, y;
    glfwGetCursorPos(window, &x, &y);
    WindowId id = host->id_of(window);

    if (action == GLFW_PRESS)
    {
        if (host->callbacks_.on_press)
            host->callbacks_.on_press(id, x, y);
    }
    else if (action == GLFW_RELEASE)
    {
        if (auto op = host->shell_.release_pointer(id))
            KESTREL_LOG_DEBUG("glfw", "Drop in window {} moved tab {}", id, op->item);
    }
}

void GlfwWindowHost::window_size_callback(GLFWwindow* window, int width, int height)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;

    WindowId id = host->id_of(window);
    if (auto* ctx = host->shell_.windows().get(id))
    {
        ctx->width  = static_cast<uint32_t>(std::max(0, width));
        ctx->height = static_cast<uint32_t>(std::max(0, height));
    }
    if (host->callbacks_.on_resize)
        host->callbacks_.on_resize(id, width, height);
}

}  // namespace kestrel

#endif  // KESTREL_USE_GLFW
