#pragma once

#ifndef lumina_soft_render_device_hpp
#define lumina_soft_render_device_hpp

#include "lumina-bake/render-device.hpp"
#include "lumina-core/math/math-ray.hpp"

namespace lumina
{
    ////////////////////////////
    //   soft_render_device   //
    ////////////////////////////

    // Deterministic CPU implementation of the render device. Triangles are clipped against the
    // near plane in homogeneous space, rasterized at pixel centers with a top-down depth test and
    // back-face culling, and shaded per pixel. Shadows come from rays cast against the scene
    // triangles instead of shadow maps, so results match the GL device only approximately.
    class soft_render_device final : public render_device
    {
        struct occluder
        {
            aabb_3d bounds;
            std::vector<float3> triangles; // world space, 3 per face
        };

        image_buffer<float> color;
        std::vector<float> depth;

        uint64_t occluderSceneUid{ 0 };
        std::vector<occluder> occluders;

        void build_occluders(const light_scene & scene);
        bool is_occluded(const ray & r, const float maxDistance) const;

    public:

        soft_render_device() = default;

        std::string name() const override final { return "software"; }

        void rasterize_atlas(const std::vector<atlas_raster_vertex> & triangles, image_buffer<float> & target) override final;
        void begin_probe_target(const int2 & size, const float3 & clearColor) override final;
        void render_light_scene(const light_scene & scene, const probe_view & view) override final;
        void read_probe_target(image_buffer<float> & out) override final;
        void composite_layers(const std::vector<composite_layer> & layers, lightmap_texture & target) override final;
    };

} // end namespace lumina

#endif // end lumina_soft_render_device_hpp
