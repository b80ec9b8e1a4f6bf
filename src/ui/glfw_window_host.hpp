#pragma once

#ifdef KESTREL_USE_GLFW

    #include <cstdint>
    #include <functional>
    #include <kestrel/fwd.hpp>
    #include <string>
    #include <unordered_map>
    #include <vector>

struct GLFWwindow;

namespace kestrel
{

// Hit-testing hooks.  The host knows nothing about tabs: the embedding
// application maps a press to a tab and calls Shell::press_tab() itself.
struct HostCallbacks
{
    std::function<void(WindowId window, double x, double y)> on_press;
    std::function<void(WindowId window, double x, double y)> on_drag_move;
    std::function<void(WindowId window, int width, int height)> on_resize;
};

// Owns the GLFW windows of one Shell and forwards their lifecycle and
// pointer events into it:
//   close button   → Shell::close_window (window destroyed after the poll)
//   focus gained   → Shell::focus_window
//   cursor motion  → Shell::pointer_moved
//   cursor leaves  → Shell::set_drag_outside_window(true)
//   button release → Shell::release_pointer
//
// GLFW windows are created without a client API; the render engine attaches
// to native_window() itself.
class GlfwWindowHost
{
   public:
    explicit GlfwWindowHost(Shell& shell) : shell_(shell) {}
    ~GlfwWindowHost();

    GlfwWindowHost(const GlfwWindowHost&)            = delete;
    GlfwWindowHost& operator=(const GlfwWindowHost&) = delete;

    // Initialize GLFW.  Must be called before open().
    bool init();

    // Create a window and register it with the shell.  Returns
    // INVALID_WINDOW_ID on failure.
    WindowId open(uint32_t width, uint32_t height, const std::string& title);

    // Programmatic close (same path as the close button).
    void close(WindowId id);

    // Poll events, then destroy windows closed during the poll.
    void poll_events();

    // Destroy every window and terminate GLFW.
    void shutdown();

    void set_callbacks(const HostCallbacks& callbacks) { callbacks_ = callbacks; }

    void*  native_window(WindowId id) const;
    bool   any_open() const { return !windows_.empty(); }
    size_t window_count() const { return windows_.size(); }

   private:
    WindowId id_of(GLFWwindow* window) const;
    void     destroy_pending();

    Shell&        shell_;
    HostCallbacks callbacks_;
    bool          initialized_ = false;

    std::unordered_map<WindowId, GLFWwindow*> windows_;
    std::vector<GLFWwindow*>                  pending_destroy_;

    // Static callback trampolines (GLFW uses C callbacks)
    static void close_callback(GLFWwindow* window);
    static void focus_callback(GLFWwindow* window, int focused);
    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void cursor_enter_callback(GLFWwindow* window, int entered);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void window_size_callback(GLFWwindow* window, int width, int height);
};

}  // namespace kestrel

#endif  // KESTREL_USE_GLFW
