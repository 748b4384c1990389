#include "lumina-bake/lightmap-export.hpp"
#include "lumina-bake/logging.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb/stb_image_write.h"

#include <stdexcept>

namespace lumina
{
    void export_lightmap_hdr(const lightmap_texture & texture, const std::string & path)
    {
        const int2 size = texture.size();
        std::vector<float> flipped(size_t(size.x) * size_t(size.y) * 3);

        for (int y = 0; y < size.y; ++y)
        {
            for (int x = 0; x < size.x; ++x)
            {
                const float4 texel = texture.get_texel(size_t(y) * size.x + x);
                float * dst = flipped.data() + (size_t(size.y - y - 1) * size.x + x) * 3;
                dst[0] = texel.x;
                dst[1] = texel.y;
                dst[2] = texel.z;
            }
        }

        if (!stbi_write_hdr(path.c_str(), size.x, size.y, 3, flipped.data()))
        {
            throw std::runtime_error("could not write lightmap " + path);
        }

        log::get()->bake_log->info("wrote {}x{} lightmap to {}", size.x, size.y, path);
    }

    void export_lightmap_png(const lightmap_texture & texture, const std::string & path, const float exposure)
    {
        const int2 size = texture.size();
        std::vector<uint8_t> flipped(size_t(size.x) * size_t(size.y) * 4);

        for (int y = 0; y < size.y; ++y)
        {
            for (int x = 0; x < size.x; ++x)
            {
                const float4 texel = texture.get_texel(size_t(y) * size.x + x);
                const float3 rgb = linalg::clamp(texel.xyz() * exposure, 0.f, 1.f);
                uint8_t * dst = flipped.data() + (size_t(size.y - y - 1) * size.x + x) * 4;
                dst[0] = static_cast<uint8_t>(rgb.x * 255.f + 0.5f);
                dst[1] = static_cast<uint8_t>(rgb.y * 255.f + 0.5f);
                dst[2] = static_cast<uint8_t>(rgb.z * 255.f + 0.5f);
                dst[3] = 255;
            }
        }

        if (!stbi_write_png(path.c_str(), size.x, size.y, 4, flipped.data(), 4 * size.x))
        {
            throw std::runtime_error("could not write lightmap " + path);
        }

        log::get()->bake_log->info("wrote {}x{} lightmap to {} (exposure {})", size.x, size.y, path, exposure);
    }

} // end namespace lumina
