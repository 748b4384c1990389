#include "lumina-bake/light-scene.hpp"

#include <atomic>
#include <limits>

namespace lumina
{
    static std::atomic<uint64_t> next_light_scene_uid{ 1 };

    static light_scene_light make_scene_light(const workbench_light & src)
    {
        light_scene_light l;
        l.kind = src.kind;
        l.position = src.get_position();
        l.direction = src.get_direction();
        l.radiance = src.color * src.intensity;
        l.distance = src.distance;
        l.decay = src.decay;
        l.cast_shadow = src.cast_shadow;

        const float3 up = safe_normalize(src.world_matrix.y.xyz());
        l.shadow_view = make_lookat_view_matrix(l.position, l.position + l.direction, up);

        if (src.kind == light_kind::spot)
        {
            l.cone_cos_outer = std::cos(src.spot_angle);
            l.cone_cos_inner = std::cos(src.spot_angle * (1.f - clamp(src.spot_penumbra, 0.f, 1.f)));
            const float farClip = src.distance > 0.f ? src.distance : src.shadow.far;
            l.shadow_projection = make_projection_matrix(src.spot_angle * 2.f, 1.f, src.shadow.near, farClip);
        }
        else
        {
            const shadow_frustum & f = src.shadow;
            l.shadow_projection = make_orthographic_matrix(f.left, f.right, f.bottom, f.top, f.near, f.far);
        }

        return l;
    }

    std::shared_ptr<const light_scene> build_light_scene(const workbench & wb, const light_scene_params & params)
    {
        auto scene = std::make_shared<light_scene>();
        scene->uid = next_light_scene_uid++;
        scene->workbench_id = wb.id;
        scene->factor = params.factor;
        scene->time = params.time;
        scene->sky_color = params.sky_color;

        if (params.include_lights)
        {
            for (const auto & light : wb.lights)
            {
                if (light.factor != params.factor) continue;
                scene->lights.push_back(make_scene_light(light));
            }
        }

        for (const auto & item : wb.items)
        {
            light_scene_item s;
            s.mesh = item.mesh;
            s.world_matrix = item.animation ? item.animation->evaluate(params.time) : item.world_matrix;
            s.albedo = item.material.albedo;
            s.albedo_map = item.material.albedo_map;
            s.emissive_map = item.material.emissive_map;

            // emission only counts toward the layer that owns it
            const float emissiveIntensity = (item.factor == params.factor) ? item.material.emissive_intensity : 0.f;
            s.emissive = item.material.emissive * (emissiveIntensity * params.emissive_multiplier);

            if (item.has_atlas_uv()) s.lightmap = params.lightmap;

            scene->items.push_back(std::move(s));
        }

        return scene;
    }

    void get_light_ray(const light_scene_light & light, const float3 & position, float3 & toLight, float & maxDistance)
    {
        if (light.kind == light_kind::spot)
        {
            const float3 delta = light.position - position;
            maxDistance = length(delta);
            toLight = maxDistance > 0.f ? delta / maxDistance : float3(0, 0, 0);
        }
        else
        {
            toLight = -light.direction;
            maxDistance = std::numeric_limits<float>::infinity();
        }
    }

    float3 evaluate_direct_light(const light_scene_light & light, const float3 & position, const float3 & normal)
    {
        float3 toLight;
        float lightDistance;
        get_light_ray(light, position, toLight, lightDistance);

        const float nDotL = dot(normal, toLight);
        if (nDotL <= 0.f) return { 0, 0, 0 };

        if (light.kind != light_kind::spot) return light.radiance * nDotL;

        const float cosTheta = dot(-toLight, light.direction);
        float spot = 0.f;
        if (light.cone_cos_inner - light.cone_cos_outer > 1e-6f) spot = smoothstep(light.cone_cos_outer, light.cone_cos_inner, cosTheta);
        else spot = cosTheta >= light.cone_cos_outer ? 1.f : 0.f;

        float attenuation = 1.f;
        if (light.distance > 0.f && light.decay > 0.f)
        {
            attenuation = std::pow(clamp(1.f - lightDistance / light.distance, 0.f, 1.f), light.decay);
        }

        return light.radiance * (nDotL * spot * attenuation);
    }

} // end namespace lumina
