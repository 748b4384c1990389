#pragma once

#ifndef lumina_light_scene_hpp
#define lumina_light_scene_hpp

#include "lumina-bake/workbench.hpp"
#include "lumina-bake/lightmap-texture.hpp"

namespace lumina
{
    //////////////////////////
    //   light_scene_item   //
    //////////////////////////

    struct light_scene_item
    {
        std::shared_ptr<const runtime_mesh> mesh;
        float4x4 world_matrix{ Identity4x4 };
        float3 albedo{ 1, 1, 1 };
        std::shared_ptr<const image_buffer<float>> albedo_map;
        float3 emissive{ 0, 0, 0 };                             // already scaled by intensity and multiplier
        std::shared_ptr<const image_buffer<float>> emissive_map;
        std::shared_ptr<const lightmap_texture> lightmap;      // indirect input, sampled with texcoord1
    };

    ///////////////////////////
    //   light_scene_light   //
    ///////////////////////////

    struct light_scene_light
    {
        light_kind kind{ light_kind::directional };
        float3 position{ 0, 0, 0 };
        float3 direction{ 0, 0, -1 };   // direction the light travels
        float3 radiance{ 1, 1, 1 };     // color * intensity
        float cone_cos_outer{ 0.f };
        float cone_cos_inner{ 0.f };
        float distance{ 0.f };
        float decay{ 1.f };
        bool cast_shadow{ true };
        float4x4 shadow_view{ Identity4x4 };
        float4x4 shadow_projection{ Identity4x4 };
    };

    /////////////////////
    //   light_scene   //
    /////////////////////

    // Disposable lighting-only view of a workbench for one (factor, time, pass).
    // The uid changes with every build so devices can cache derived data per scene.
    struct light_scene
    {
        uint64_t uid{ 0 };
        uint32_t workbench_id{ 0 };
        factor_name factor;
        float time{ 0.f };
        float3 sky_color{ 0, 0, 0 };
        std::vector<light_scene_item> items;
        std::vector<light_scene_light> lights;
    };

    struct light_scene_params
    {
        factor_name factor;
        float time{ 0.f };
        bool include_lights{ true };
        std::shared_ptr<const lightmap_texture> lightmap;
        float emissive_multiplier{ 32.f };
        float3 sky_color{ 0, 0, 0 };
    };

    std::shared_ptr<const light_scene> build_light_scene(const workbench & wb, const light_scene_params & params);

    // Lambertian response of a scene light at a surface point, before shadowing
    float3 evaluate_direct_light(const light_scene_light & light, const float3 & position, const float3 & normal);

    // Direction from the surface toward the light and the distance to travel (infinite for directional lights)
    void get_light_ray(const light_scene_light & light, const float3 & position, float3 & toLight, float & maxDistance);

} // end namespace lumina

#endif // end lumina_light_scene_hpp
