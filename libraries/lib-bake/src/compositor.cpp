#include "lumina-bake/compositor.hpp"

#include <stdexcept>

namespace lumina
{
    compositor::compositor(const int width, const int height) : width(width), height(height)
    {
        baseLayer.texture = std::make_shared<lightmap_texture>(width, height);
        baseLayer.texture->fill_test_pattern();
        baseLayer.multiplier = 1.f;

        output = std::make_shared<lightmap_texture>(width, height);
    }

    compositor::layer & compositor::find_or_create_layer(const factor_name & factor)
    {
        if (!factor) return baseLayer;

        for (auto & l : factorLayers)
        {
            if (l.name == *factor) return l;
        }

        layer l;
        l.name = *factor;
        l.texture = std::make_shared<lightmap_texture>(width, height);
        factorLayers.push_back(std::move(l));
        return factorLayers.back();
    }

    std::shared_ptr<lightmap_texture> compositor::get_layer_texture(const factor_name & factor)
    {
        return find_or_create_layer(factor).texture;
    }

    void compositor::set_multiplier(const factor_name & factor, const float multiplier)
    {
        find_or_create_layer(factor).multiplier = multiplier;
    }

    float compositor::get_multiplier(const factor_name & factor) const
    {
        if (!factor) return baseLayer.multiplier;

        for (const auto & l : factorLayers)
        {
            if (l.name == *factor) return l.multiplier;
        }

        return 0.f;
    }

    std::vector<std::string> compositor::get_factor_names() const
    {
        std::vector<std::string> names;
        for (const auto & l : factorLayers) names.push_back(l.name);
        return names;
    }

    void compositor::render(render_device & device)
    {
        std::vector<composite_layer> layers;
        layers.push_back({ baseLayer.texture, baseLayer.multiplier });
        for (const auto & l : factorLayers) layers.push_back({ l.texture, l.multiplier });

        device.composite_layers(layers, *output);
    }

} // end namespace lumina
