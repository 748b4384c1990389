#pragma once

#ifndef lumina_render_device_hpp
#define lumina_render_device_hpp

#include "lumina-bake/light-scene.hpp"
#include "lumina-bake/lightmap-texture.hpp"

namespace lumina
{
    // One corner of an atlas triangle: where it lands in the atlas and what it writes there
    struct atlas_raster_vertex
    {
        float2 atlas_uv;
        float3 payload;     // (faceLocalX, faceLocalY, encodedFaceId)
    };

    // Camera plus the target sub-rectangles for one probe view. Rectangles are (x, y, width, height)
    // in pixels with the origin at the lower-left of the probe target.
    struct probe_view
    {
        float4x4 view{ Identity4x4 };
        float4x4 projection{ Identity4x4 };
        int4 viewport{ 0, 0, 0, 0 };
        int4 scissor{ 0, 0, 0, 0 };
    };

    struct composite_layer
    {
        std::shared_ptr<const lightmap_texture> texture;
        float multiplier{ 1.f };
    };

    ///////////////////////
    //   render_device   //
    ///////////////////////

    // Rasterization backend used by the baker. All calls are synchronous and happen on the thread
    // that owns the device (the GL context thread for the OpenGL device).
    class render_device
    {
    public:

        virtual ~render_device() {}

        virtual std::string name() const = 0;

        // Draws the triangle list (3 vertices per face) double-sided into `target`, which is pre-sized to
        // the atlas resolution with 4 channels. xy of the payload is interpolated, z is flat.
        virtual void rasterize_atlas(const std::vector<atlas_raster_vertex> & triangles, image_buffer<float> & target) = 0;

        // Binds the probe target at `size`, reallocating only when the size changes, and clears
        // color to (clearColor, 0) and depth to the far plane
        virtual void begin_probe_target(const int2 & size, const float3 & clearColor) = 0;

        // Renders the lit scene for one probe view into the bound probe target
        virtual void render_light_scene(const light_scene & scene, const probe_view & view) = 0;

        // Reads the whole probe target back into `out` (RGBA float, row 0 at the bottom)
        virtual void read_probe_target(image_buffer<float> & out) = 0;

        // target = sum of layer.rgb * layer.multiplier, alpha 1
        virtual void composite_layers(const std::vector<composite_layer> & layers, lightmap_texture & target) = 0;
    };

} // end namespace lumina

#endif // end lumina_render_device_hpp
