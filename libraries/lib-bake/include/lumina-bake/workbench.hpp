#pragma once

#ifndef lumina_workbench_hpp
#define lumina_workbench_hpp

#include "lumina-core/math/math-core.hpp"
#include "lumina-core/util/util.hpp"
#include "lumina-core/util/geometry.hpp"
#include "lumina-core/util/image-buffer.hpp"
#include "lumina-core/tools/animation-clip.hpp"

#include "lumina-bake/atlas-map.hpp"

#include <map>
#include <optional>
#include <string>

#undef near
#undef far

namespace lumina
{
    // Independent light group. An empty factor is the base layer.
    typedef std::optional<std::string> factor_name;

    inline std::string to_string(const factor_name & f) { return f ? *f : std::string("(base)"); }

    enum class material_kind : uint32_t
    {
        lambert,
        standard,   // baked as lambert, the specular term is ignored
        unlit
    };

    struct surface_material
    {
        material_kind kind{ material_kind::lambert };
        float3 albedo{ 1, 1, 1 };
        std::shared_ptr<const image_buffer<float>> albedo_map;     // RGBA, sampled with texcoord0
        float3 emissive{ 0, 0, 0 };
        std::shared_ptr<const image_buffer<float>> emissive_map;   // RGBA, sampled with texcoord0
        float emissive_intensity{ 1.f };
    };

    ////////////////////////
    //   workbench_item   //
    ////////////////////////

    struct workbench_item
    {
        std::shared_ptr<const runtime_mesh> mesh;
        float4x4 world_matrix{ Identity4x4 };
        surface_material material;
        bool needs_lightmap{ true };
        factor_name factor;
        std::shared_ptr<const animation_clip> animation; // overrides world_matrix when present

        bool has_atlas_uv() const { return mesh && !mesh->texcoord1.empty(); }
    };

    /////////////////////////
    //   workbench_light   //
    /////////////////////////

    enum class light_kind : uint32_t
    {
        directional,
        spot,
        point,
        ambient
    };

    const char * to_string(const light_kind kind);

    struct shadow_frustum
    {
        float left{ -10.f }, right{ 10.f };
        float bottom{ -10.f }, top{ 10.f };
        float near{ 0.5f }, far{ 500.f };
    };

    // Lights shine along their local -Z axis
    struct workbench_light
    {
        light_kind kind{ light_kind::directional };
        float4x4 world_matrix{ Identity4x4 };
        float3 color{ 1, 1, 1 };
        float intensity{ 1.f };

        float spot_angle{ float(LUMINA_PI) / 3.f }; // half-angle of the cone
        float spot_penumbra{ 0.f };                 // [0, 1] fraction of the cone that fades
        float distance{ 0.f };                      // 0: no range cutoff
        float decay{ 1.f };

        bool cast_shadow{ true };
        shadow_frustum shadow;

        factor_name factor;

        float3 get_position() const { return world_matrix.w.xyz(); }
        float3 get_direction() const { return safe_normalize(-world_matrix.z.xyz()); }
    };

    ///////////////////
    //   workbench   //
    ///////////////////

    // Immutable snapshot of everything a bake reads. A new workbench supersedes all bake state built on an older one.
    struct workbench
    {
        uint32_t id{ 0 };
        std::vector<workbench_item> items;
        std::vector<workbench_light> lights;
        std::vector<std::string> factor_names; // first appearance over items, then lights
        atlas_map atlas;
    };

    /////////////////////////
    //   workbench_stage   //
    /////////////////////////

    typedef uint32_t stage_handle;

    // Explicitly owned registry of scene items and lights. Registration validates everything
    // the baker later relies on so that bad input fails here rather than in the middle of a bake.
    class workbench_stage : public non_copyable
    {
        stage_handle lastHandle{ 0 };
        uint32_t lastWorkbenchId{ 0 };
        std::map<stage_handle, workbench_item> items;   // ordered by handle, i.e. registration order
        std::map<stage_handle, workbench_light> lights;

    public:

        workbench_stage() = default;

        stage_handle register_item(const workbench_item & item);
        void unregister_item(const stage_handle handle);

        stage_handle register_light(const workbench_light & light);
        void unregister_light(const stage_handle handle);

        size_t num_items() const { return items.size(); }
        size_t num_lights() const { return lights.size(); }

        // Copies the staged items and lights into a new workbench with the next id. The atlas is left empty.
        workbench snapshot();
    };

    // Throws std::invalid_argument for any precondition a staged item or light violates
    void validate_workbench_item(const workbench_item & item);
    void validate_workbench_light(const workbench_light & light);

} // end namespace lumina

#endif // end lumina_workbench_hpp
