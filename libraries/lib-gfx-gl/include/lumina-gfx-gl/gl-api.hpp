#pragma once

#ifndef lumina_gl_api_hpp
#define lumina_gl_api_hpp

#include "lumina-core/math/math-core.hpp"
#include "lumina-core/util/util.hpp"
#include "lumina-bake/logging.hpp"

#if defined(LUMINA_PLATFORM_WINDOWS)
    #include <glad/glad.h>
#else
    #define GL_GLEXT_PROTOTYPES
    #define GLFW_INCLUDE_GLEXT
#endif

#include <GLFW/glfw3.h>

#include <stdexcept>

namespace lumina
{
    inline const char * gl_error_to_string(const GLenum error)
    {
        switch (error)
        {
        case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
        default: return "unknown GL error";
        }
    }

    // Drains the GL error queue into the gpu log
    inline void gl_check_error(const char * file, const int32_t line)
    {
        GLenum error = glGetError();
        while (error != GL_NO_ERROR)
        {
            log::get()->gpu_log->error("{} (0x{:x}) at {}:{}", gl_error_to_string(error), error, file, line);
            error = glGetError();
        }
    }

    ///////////////////
    //   GL objects  //
    ///////////////////

    struct gl_buffer_factory { static void create(GLuint & x) { glGenBuffers(1, &x); } static void destroy(GLuint x) { glDeleteBuffers(1, &x); } };
    struct gl_texture_factory { static void create(GLuint & x) { glGenTextures(1, &x); } static void destroy(GLuint x) { glDeleteTextures(1, &x); } };
    struct gl_vertex_array_factory { static void create(GLuint & x) { glGenVertexArrays(1, &x); } static void destroy(GLuint x) { glDeleteVertexArrays(1, &x); } };
    struct gl_renderbuffer_factory { static void create(GLuint & x) { glGenRenderbuffers(1, &x); } static void destroy(GLuint x) { glDeleteRenderbuffers(1, &x); } };
    struct gl_framebuffer_factory { static void create(GLuint & x) { glGenFramebuffers(1, &x); } static void destroy(GLuint x) { glDeleteFramebuffers(1, &x); } };

    // Owning GL name, created lazily on first use
    template<class factory_t>
    class GlObject : public non_copyable
    {
        mutable GLuint handle{ 0 };
    public:
        GlObject() {}
        GlObject(GlObject && r) : handle(r.handle) { r.handle = 0; }
        GlObject & operator = (GlObject && r) { std::swap(handle, r.handle); return *this; }
        ~GlObject() { if (handle) factory_t::destroy(handle); }
        operator GLuint () const { if (!handle) factory_t::create(handle); return handle; }
        GLuint id() const { return *this; }
    };

    struct GlBuffer : public GlObject<gl_buffer_factory>
    {
        GLsizeiptr size{ 0 };

        void set_buffer_data(const GLenum target, const GLsizeiptr s, const GLvoid * data, const GLenum usage)
        {
            glBindBuffer(target, *this);
            glBufferData(target, s, data, usage);
            size = s;
        }
    };

    struct GlVertexArray : public GlObject<gl_vertex_array_factory> {};

    struct GlTexture2D : public GlObject<gl_texture_factory>
    {
        int2 size{ 0, 0 };

        void setup(const GLsizei width, const GLsizei height, const GLenum internalFmt, const GLenum format, const GLenum type, const GLvoid * pixels, const GLenum filter = GL_NEAREST)
        {
            glBindTexture(GL_TEXTURE_2D, *this);
            glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
            glTexImage2D(GL_TEXTURE_2D, 0, internalFmt, width, height, 0, format, type, pixels);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_REPEAT);
            glBindTexture(GL_TEXTURE_2D, 0);
            size = { width, height };
        }

        void upload(const GLenum format, const GLenum type, const GLvoid * pixels)
        {
            glBindTexture(GL_TEXTURE_2D, *this);
            glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
            glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, size.x, size.y, format, type, pixels);
            glBindTexture(GL_TEXTURE_2D, 0);
        }

        void set_filter(const GLenum filter)
        {
            glBindTexture(GL_TEXTURE_2D, *this);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, filter);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, filter);
            glBindTexture(GL_TEXTURE_2D, 0);
        }
    };

    // Layered 2D texture, one layer per shadow-casting light
    struct GlTexture3D : public GlObject<gl_texture_factory>
    {
        int3 size{ 0, 0, 0 };

        void setup(const GLenum target, const GLsizei width, const GLsizei height, const GLsizei depth, const GLenum internalFmt, const GLenum format, const GLenum type, const GLvoid * pixels)
        {
            glBindTexture(target, *this);
            glTexImage3D(target, 0, internalFmt, width, height, depth, 0, format, type, pixels);
            glTexParameteri(target, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
            glTexParameteri(target, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
            glTexParameteri(target, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
            glTexParameteri(target, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
            glBindTexture(target, 0);
            size = { width, height, depth };
        }
    };

    struct GlRenderbuffer : public GlObject<gl_renderbuffer_factory>
    {
        void setup(const GLenum internalFmt, const GLsizei width, const GLsizei height)
        {
            glBindRenderbuffer(GL_RENDERBUFFER, *this);
            glRenderbufferStorage(GL_RENDERBUFFER, internalFmt, width, height);
            glBindRenderbuffer(GL_RENDERBUFFER, 0);
        }
    };

    struct GlFramebuffer : public GlObject<gl_framebuffer_factory>
    {
        void check_complete()
        {
            glBindFramebuffer(GL_FRAMEBUFFER, *this);
            const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
            if (status != GL_FRAMEBUFFER_COMPLETE)
            {
                log::get()->gpu_log->error("framebuffer {} incomplete (0x{:x})", id(), status);
                throw std::runtime_error("framebuffer incomplete");
            }
        }
    };

    //////////////////
    //   GlShader   //
    //////////////////

    inline GLuint compile_shader(const GLenum type, const std::string & source)
    {
        const GLuint shader = glCreateShader(type);
        const GLchar * src = source.c_str();
        glShaderSource(shader, 1, &src, nullptr);
        glCompileShader(shader);

        GLint status;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
        if (status == GL_FALSE)
        {
            GLint length;
            glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
            std::vector<GLchar> buffer(std::max(length, 1));
            glGetShaderInfoLog(shader, GLsizei(buffer.size()), nullptr, buffer.data());
            glDeleteShader(shader);
            log::get()->gpu_log->error("shader compile error: {}", buffer.data());
            throw std::runtime_error("GLSL compile error");
        }

        return shader;
    }

    class GlShader : public non_copyable
    {
        GLuint program{ 0 };

        GLint get_uniform_location(const std::string & name) const { return glGetUniformLocation(program, name.c_str()); }

    public:

        GlShader() {}

        GlShader(const std::string & vertexShader, const std::string & fragmentShader)
        {
            const GLuint vs = compile_shader(GL_VERTEX_SHADER, vertexShader);
            GLuint fs = 0;
            try { fs = compile_shader(GL_FRAGMENT_SHADER, fragmentShader); }
            catch (const std::runtime_error &) { glDeleteShader(vs); throw; }

            program = glCreateProgram();
            glAttachShader(program, vs);
            glAttachShader(program, fs);
            glLinkProgram(program);
            glDeleteShader(vs);
            glDeleteShader(fs);

            GLint status;
            glGetProgramiv(program, GL_LINK_STATUS, &status);
            if (status == GL_FALSE)
            {
                GLint length;
                glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
                std::vector<GLchar> buffer(std::max(length, 1));
                glGetProgramInfoLog(program, GLsizei(buffer.size()), nullptr, buffer.data());
                glDeleteProgram(program);
                program = 0;
                log::get()->gpu_log->error("shader link error: {}", buffer.data());
                throw std::runtime_error("GLSL link error");
            }
        }

        GlShader(GlShader && r) : program(r.program) { r.program = 0; }
        GlShader & operator = (GlShader && r) { std::swap(program, r.program); return *this; }
        ~GlShader() { if (program) glDeleteProgram(program); }

        GLuint handle() const { return program; }

        void bind() const { glUseProgram(program); }
        void unbind() const { glUseProgram(0); }

        void uniform(const std::string & name, const int scalar) const { glUniform1i(get_uniform_location(name), scalar); }
        void uniform(const std::string & name, const float scalar) const { glUniform1f(get_uniform_location(name), scalar); }
        void uniform(const std::string & name, const float2 & vec) const { glUniform2fv(get_uniform_location(name), 1, &vec.x); }
        void uniform(const std::string & name, const float3 & vec) const { glUniform3fv(get_uniform_location(name), 1, &vec.x); }
        void uniform(const std::string & name, const float4 & vec) const { glUniform4fv(get_uniform_location(name), 1, &vec.x); }
        void uniform(const std::string & name, const float3x3 & mat) const { glUniformMatrix3fv(get_uniform_location(name), 1, GL_FALSE, &mat.x.x); }
        void uniform(const std::string & name, const float4x4 & mat) const { glUniformMatrix4fv(get_uniform_location(name), 1, GL_FALSE, &mat.x.x); }

        void texture(const std::string & name, const int unit, const GLuint tex, const GLenum target) const
        {
            glActiveTexture(GL_TEXTURE0 + unit);
            glBindTexture(target, tex);
            uniform(name, unit);
        }
    };

} // end namespace lumina

#endif // end lumina_gl_api_hpp
