#include "lumina-bake/bake-settings.hpp"
#include "lumina-bake/logging.hpp"

#include <fstream>

namespace lumina
{
    void to_json(json & archive, const bake_settings & s)
    {
        bake_settings copy = s;
        archive = json::object();
        visit_fields(copy, [&archive](const char * name, auto & field, auto... metadata)
        {
            archive[name] = field;
        });
    }

    void from_json(const json & archive, bake_settings & s)
    {
        visit_fields(s, [&archive](const char * name, auto & field, auto... metadata)
        {
            using field_t = std::decay_t<decltype(field)>;
            if (archive.contains(name)) field = archive.at(name).get<field_t>();
        });
    }

    void validate_bake_settings(const bake_settings & s)
    {
        bake_settings copy = s;
        visit_fields(copy, [](const char * name, auto & field, auto... metadata)
        {
            using field_t = std::decay_t<decltype(field)>;

            if constexpr (std::is_arithmetic<field_t>::value)
            {
                if (auto range = unpack<range_metadata<field_t>>(metadata...))
                {
                    if (field < range->min || field > range->max)
                    {
                        throw std::invalid_argument(std::string("bake setting out of range: ") + name + " = " + std::to_string(field));
                    }
                }

                if (unpack<even_metadata>(metadata...) && (static_cast<int64_t>(field) % 2) != 0)
                {
                    throw std::invalid_argument(std::string("bake setting must be even: ") + name + " = " + std::to_string(field));
                }
            }
        });
    }

    bake_settings load_bake_settings(const std::string & path)
    {
        std::ifstream file(path);
        if (!file.is_open()) throw std::runtime_error("could not open bake settings: " + path);

        bake_settings settings;

        try
        {
            const json archive = json::parse(file);
            settings = archive.get<bake_settings>();
        }
        catch (const json::exception & e)
        {
            throw std::runtime_error("could not parse bake settings " + path + ": " + e.what());
        }

        validate_bake_settings(settings);

        log::get()->bake_log->info("loaded bake settings from {} (atlas {}x{}, {} passes)", path, settings.atlas_width, settings.atlas_height, settings.pass_count);

        return settings;
    }

    void save_bake_settings(const std::string & path, const bake_settings & s)
    {
        std::ofstream file(path);
        if (!file.is_open()) throw std::runtime_error("could not write bake settings: " + path);

        const json archive = s;
        file << archive.dump(4);
    }

} // end namespace lumina
