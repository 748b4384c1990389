#include "lumina-bake/atlas-map.hpp"

#include <stdexcept>
#include <sstream>

namespace lumina
{
    atlas_face_ref atlas_map::decode_texel(const size_t texelIndex) const
    {
        const float4 texel = get_texel(texelIndex);
        const float faceEnc = texel.z;

        const int64_t combo = static_cast<int64_t>(std::round(faceEnc - 1.f));
        const int64_t faceIndex = combo % max_item_faces;
        const int64_t itemIndex = (combo - faceIndex) / max_item_faces;

        if (combo < 0 || itemIndex < 0 || itemIndex >= static_cast<int64_t>(items.size()))
        {
            std::ostringstream ss;
            ss << "incorrect atlas map item data: " << texel.x << ", " << texel.y << ", " << faceEnc;
            throw std::runtime_error(ss.str());
        }

        if (faceIndex < 0 || faceIndex >= static_cast<int64_t>(items[itemIndex].face_count))
        {
            std::ostringstream ss;
            ss << "incorrect atlas map face data: " << texel.x << ", " << texel.y << ", " << faceEnc;
            throw std::runtime_error(ss.str());
        }

        return { static_cast<uint32_t>(itemIndex), static_cast<uint32_t>(faceIndex) };
    }

    size_t atlas_map::count_populated_texels() const
    {
        size_t count = 0;
        for (size_t i = 0; i < num_texels(); ++i)
        {
            if (!is_empty_texel(i)) ++count;
        }
        return count;
    }

} // end namespace lumina
