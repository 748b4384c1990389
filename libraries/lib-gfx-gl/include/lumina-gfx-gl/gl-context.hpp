#pragma once

#ifndef lumina_gl_context_hpp
#define lumina_gl_context_hpp

#include "lumina-gfx-gl/gl-api.hpp"

namespace lumina
{
    ////////////////////
    //   gl_context   //
    ////////////////////

    // Hidden 1x1 GLFW window owning an OpenGL 3.3 core context. Offscreen baking needs nothing else.
    class gl_context : public non_copyable
    {
        GLFWwindow * hidden_window{ nullptr };

    public:

        gl_context();
        ~gl_context();

        void make_current();
        GLFWwindow * get_window() const { return hidden_window; }
    };

} // end namespace lumina

#endif // end lumina_gl_context_hpp
