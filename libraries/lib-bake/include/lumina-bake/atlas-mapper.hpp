#pragma once

#ifndef lumina_atlas_mapper_hpp
#define lumina_atlas_mapper_hpp

#include "lumina-bake/workbench.hpp"
#include "lumina-bake/render-device.hpp"

namespace lumina
{
    // Canonical tangent frame for a face normal: U starts from +X for normals along Z and from +Z otherwise
    void compute_face_tangents(const float3 & normal, float3 & u, float3 & v);

    // Per-face auxiliary buffers for one lightmapped item, see atlas_map_item
    atlas_map_item make_atlas_map_item(const workbench_item & item, const uint32_t atlasItemIndex, const uint32_t workbenchItemIndex);

    //////////////////////
    //   atlas_mapper   //
    //////////////////////

    // Rasterizes every lightmapped face into its atlas UV rectangle once, producing the texel lookup
    // that the irradiance renderers sweep over
    class atlas_mapper
    {
        int width;
        int height;

    public:

        atlas_mapper(const int width, const int height);

        atlas_map build(render_device & device, const std::vector<workbench_item> & items) const;
    };

    // Convenience: maps `wb.items` into `wb.atlas`
    void map_workbench_atlas(render_device & device, workbench & wb, const int width, const int height);

} // end namespace lumina

#endif // end lumina_atlas_mapper_hpp
