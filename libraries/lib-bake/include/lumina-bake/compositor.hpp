#pragma once

#ifndef lumina_compositor_hpp
#define lumina_compositor_hpp

#include "lumina-bake/render-device.hpp"

namespace lumina
{
    ////////////////////
    //   compositor   //
    ////////////////////

    // Owns one texture per layer (the base layer plus one per factor) and sums them, each scaled by
    // its live multiplier, into the output texture. Multipliers can change every frame without
    // touching the layer textures.
    class compositor : public non_copyable
    {
        struct layer
        {
            std::string name;
            std::shared_ptr<lightmap_texture> texture;
            float multiplier{ 0.f };
        };

        int width;
        int height;
        layer baseLayer;
        std::vector<layer> factorLayers; // creation order
        std::shared_ptr<lightmap_texture> output;

        layer & find_or_create_layer(const factor_name & factor);

    public:

        compositor(const int width, const int height);

        int2 size() const { return { width, height }; }

        // Texture a renderer for `factor` writes into. Factor layers are created on first use, zero-filled.
        std::shared_ptr<lightmap_texture> get_layer_texture(const factor_name & factor);

        // Base layer defaults to 1, factor layers to 0
        void set_multiplier(const factor_name & factor, const float multiplier);
        float get_multiplier(const factor_name & factor) const;

        std::vector<std::string> get_factor_names() const;

        void render(render_device & device);

        std::shared_ptr<const lightmap_texture> get_output() const { return output; }
    };

} // end namespace lumina

#endif // end lumina_compositor_hpp
