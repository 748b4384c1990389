#include "lumina-bake/lightmap-texture.hpp"

#include <atomic>
#include <stdexcept>

namespace lumina
{
    static std::atomic<uint64_t> next_texture_uid{ 1 };

    float4 test_pattern_texel(const int x, const int y)
    {
        const int tileX = x / 4;
        const int tileY = y / 4;
        const bool on = (tileX % 2) == (tileY % 2);
        return { on ? 0.2f : 0.8f, 0.5f, on ? 0.8f : 0.2f, 0.f };
    }

    static int2 checked_texture_size(const int width, const int height)
    {
        if (width <= 0 || height <= 0) throw std::invalid_argument("lightmap texture must have a positive size");
        return { width, height };
    }

    lightmap_texture::lightmap_texture(const int width, const int height) : buffer(checked_texture_size(width, height), 4), uid(next_texture_uid++)
    {
    }

    float4 lightmap_texture::get_texel(const size_t index) const
    {
        const float * t = buffer.data() + index * 4;
        return { t[0], t[1], t[2], t[3] };
    }

    void lightmap_texture::set_texel(const size_t index, const float4 & rgba)
    {
        float * t = buffer.data() + index * 4;
        t[0] = rgba.x;
        t[1] = rgba.y;
        t[2] = rgba.z;
        t[3] = rgba.w;
    }

    void lightmap_texture::clear()
    {
        buffer.fill(0.f);
        mark_dirty();
    }

    void lightmap_texture::fill_test_pattern()
    {
        for (int y = 0; y < height(); ++y)
        {
            for (int x = 0; x < width(); ++x)
            {
                set_texel(size_t(y) * width() + x, test_pattern_texel(x, y));
            }
        }
        mark_dirty();
    }

    void lightmap_texture::copy_from(const lightmap_texture & other)
    {
        if (other.size() != size()) throw std::invalid_argument("lightmap texture size mismatch");
        std::copy(other.data(), other.data() + other.num_texels() * 4, buffer.data());
        mark_dirty();
    }

} // end namespace lumina
