#pragma once

#ifndef lumina_gl_render_device_hpp
#define lumina_gl_render_device_hpp

#include "lumina-gfx-gl/gl-api.hpp"
#include "lumina-bake/render-device.hpp"
#include "lumina-bake/bake-settings.hpp"

#include <map>
#include <unordered_map>

namespace lumina
{
    //////////////////////////
    //   gl_render_device   //
    //////////////////////////

    // OpenGL 3.3 implementation of the render device. Needs a current context (see gl_context) for its
    // whole lifetime. Scene geometry and shadow maps are rebuilt whenever a light scene with a new uid
    // arrives; lightmap textures are mirrored by uid and re-uploaded when their revision changes.
    class gl_render_device final : public render_device
    {
        struct scene_mesh
        {
            GlVertexArray vao;
            GlBuffer vertexBuffer;
            GlBuffer indexBuffer;
            GLsizei indexCount{ 0 };
        };

        struct device_texture
        {
            uint64_t revision{ 0 };
            GlTexture2D texture;
        };

        texture_filter outputFilter;
        int shadowMapResolution;

        GlShader atlasProgram;
        GlShader sceneProgram;
        GlShader shadowProgram;
        GlShader compositeProgram;
        GlVertexArray emptyVao;

        GlFramebuffer atlasFramebuffer;

        int2 probeSize{ 0, 0 };
        GlFramebuffer probeFramebuffer;
        GlTexture2D probeColor;
        GlRenderbuffer probeDepth;

        uint64_t sceneUid{ 0 };
        std::vector<scene_mesh> sceneMeshes; // parallel to light_scene::items
        std::map<const image_buffer<float> *, GlTexture2D> materialTextures;
        GlTexture3D shadowMaps;
        GlFramebuffer shadowFramebuffer;
        std::vector<int> shadowLayers; // per light, -1 without a shadow map

        std::unordered_map<uint64_t, device_texture> lightmapTextures;

        GlFramebuffer compositeFramebuffer;
        GlTexture2D compositeColor;

        void prepare_scene(const light_scene & scene);
        void render_shadow_maps(const light_scene & scene);
        GLuint get_material_texture(const image_buffer<float> & image);

    public:

        explicit gl_render_device(const texture_filter outputFilter = texture_filter::linear, const int shadowMapResolution = 1024);

        std::string name() const override final { return "opengl"; }

        void rasterize_atlas(const std::vector<atlas_raster_vertex> & triangles, image_buffer<float> & target) override final;
        void begin_probe_target(const int2 & size, const float3 & clearColor) override final;
        void render_light_scene(const light_scene & scene, const probe_view & view) override final;
        void read_probe_target(image_buffer<float> & out) override final;
        void composite_layers(const std::vector<composite_layer> & layers, lightmap_texture & target) override final;

        // Device copy of a lightmap texture, filtered with the output filter for display
        GLuint get_texture(const lightmap_texture & texture);

        // Forgets device copies of textures that no longer exist on the host
        void release_texture(const uint64_t uid) { lightmapTextures.erase(uid); }
    };

} // end namespace lumina

#endif // end lumina_gl_render_device_hpp
