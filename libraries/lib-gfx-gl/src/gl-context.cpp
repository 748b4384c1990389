#include "lumina-gfx-gl/gl-context.hpp"

namespace lumina
{
    gl_context::gl_context()
    {
        glfwSetErrorCallback([](int err, const char * desc)
        {
            log::get()->gpu_log->error("glfw error {}: {}", err, desc);
        });

        if (!glfwInit()) throw std::runtime_error("could not initialize glfw");

        glfwWindowHint(GLFW_VISIBLE, 0);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    #if defined(LUMINA_PLATFORM_OSX)
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
    #endif

        hidden_window = glfwCreateWindow(1, 1, "lumina-hidden-window", nullptr, nullptr);
        if (!hidden_window)
        {
            glfwTerminate();
            throw std::runtime_error("glfwCreateWindow(...) failed");
        }

        glfwMakeContextCurrent(hidden_window);

    #if defined(LUMINA_PLATFORM_WINDOWS)
        if (!gladLoadGLLoader((GLADloadproc) glfwGetProcAddress))
        {
            glfwDestroyWindow(hidden_window);
            glfwTerminate();
            throw std::runtime_error("gladLoadGLLoader(...) failed");
        }
    #endif

        auto & gpu = log::get()->gpu_log;
        gpu->info("GL_VERSION = {}", (const char *) glGetString(GL_VERSION));
        gpu->info("GL_SHADING_LANGUAGE_VERSION = {}", (const char *) glGetString(GL_SHADING_LANGUAGE_VERSION));
        gpu->info("GL_VENDOR = {}", (const char *) glGetString(GL_VENDOR));
        gpu->info("GL_RENDERER = {}", (const char *) glGetString(GL_RENDERER));
        gpu->info("GLFW_VERSION = {}", glfwGetVersionString());

        gl_check_error(__FILE__, __LINE__);
    }

    gl_context::~gl_context()
    {
        if (hidden_window) glfwDestroyWindow(hidden_window);
        glfwTerminate();
    }

    void gl_context::make_current()
    {
        glfwMakeContextCurrent(hidden_window);
    }

} // end namespace lumina
