#pragma once

#ifndef lumina_auto_uv_hpp
#define lumina_auto_uv_hpp

#include "lumina-core/math/math-core.hpp"
#include "lumina-core/util/geometry.hpp"

namespace lumina
{
    // Axis-aligned box in texels. Width and height are inputs to packing, x and y outputs.
    struct layout_box
    {
        int x{ 0 };
        int y{ 0 };
        int w{ 0 };
        int h{ 0 };
    };

    // Height-sorted free-space packing into a roughly square region. Writes x/y of every box and
    // returns the size of the region actually used.
    int2 pack_layout_boxes(std::vector<layout_box> & boxes);

    // Generates the atlas UV channel (texcoord1) for meshes that lack one. Faces connected through
    // shared vertices form one planar chart, projected onto the plane of its first face at
    // `worldWidth / atlasWidth` world units per texel with a one texel margin, then packed into the atlas.
    // Throws std::invalid_argument if a mesh already has texcoord1 and std::runtime_error if the
    // charts do not fit the atlas.
    void auto_uv2_layout(const std::vector<runtime_mesh *> & meshes, const int atlasWidth, const int atlasHeight, const float worldWidth);

} // end namespace lumina

#endif // end lumina_auto_uv_hpp
