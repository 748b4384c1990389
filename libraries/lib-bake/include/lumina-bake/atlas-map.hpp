#pragma once

#ifndef lumina_atlas_map_hpp
#define lumina_atlas_map_hpp

#include "lumina-core/math/math-core.hpp"
#include "lumina-core/util/geometry.hpp"
#include "lumina-core/util/image-buffer.hpp"

#include <memory>

namespace lumina
{
    // Upper bound on faces per atlas item. Encoded face ids are item * max_item_faces + face + 1.
    constexpr uint32_t max_item_faces = 1000;

    inline float encode_atlas_face(const uint32_t itemIndex, const uint32_t faceIndex)
    {
        return static_cast<float>(itemIndex * max_item_faces + faceIndex + 1);
    }

    struct atlas_face_ref
    {
        uint32_t item_index;
        uint32_t face_index;
    };

    ////////////////////////
    //   atlas_map_item   //
    ////////////////////////

    // Per-face-vertex auxiliary geometry rasterized by the atlas mapper. For face f, entries [3f, 3f + 3)
    // belong to its three corners: positions carry (faceLocalX, faceLocalY, encodedFaceId), normals carry
    // the face normal, the U tangent and the V tangent in that order.
    struct atlas_map_item
    {
        uint32_t face_count{ 0 };
        std::vector<float3> face_positions;
        std::vector<float3> face_normals;
        std::vector<float2> face_atlas_uvs;

        std::shared_ptr<const runtime_mesh> original_mesh;
        uint32_t workbench_item{ 0 }; // index into workbench::items
    };

    ///////////////////
    //   atlas_map   //
    ///////////////////

    // Texel lookup: channel 0-1 face-local (u, v), channel 2 encoded face id (0 = empty), channel 3 unused
    struct atlas_map
    {
        int width{ 0 };
        int height{ 0 };
        image_buffer<float> data;
        std::vector<atlas_map_item> items;

        size_t num_texels() const { return size_t(width) * size_t(height); }

        float4 get_texel(const size_t texelIndex) const
        {
            const float * t = data.data() + texelIndex * 4;
            return { t[0], t[1], t[2], t[3] };
        }

        bool is_empty_texel(const size_t texelIndex) const { return data.data()[texelIndex * 4 + 2] == 0.f; }

        // Resolves a populated texel to its item and face. Throws std::runtime_error when the
        // encoded value points outside the item list or the item's faces.
        atlas_face_ref decode_texel(const size_t texelIndex) const;

        size_t count_populated_texels() const;
    };

} // end namespace lumina

#endif // end lumina_atlas_map_hpp
