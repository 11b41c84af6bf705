//
// Created by igor on 19/10/2026.
//

#include <hershey_font/render_options.hh>
#include <hershey_font/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace hershey_font {

    namespace {
        // Works for both const and mutable options
        template<typename Options>
        auto* find_field(Options& opts, std::string_view name) {
            decltype(&opts.xofs) result = nullptr;
            if (name == "xofs") result = &opts.xofs;
            else if (name == "yofs") result = &opts.yofs;
            else if (name == "scalex") result = &opts.scalex;
            else if (name == "scaley") result = &opts.scaley;
            else if (name == "spacing") result = &opts.spacing;
            else if (name == "cap_line") result = &opts.cap_line;
            else if (name == "base_line") result = &opts.base_line;
            else if (name == "bottom_line") result = &opts.bottom_line;
            return result;
        }
    }

    bool render_options::has_option(std::string_view name) {
        constexpr auto all = names();
        return std::find(all.begin(), all.end(), name) != all.end();
    }

    double render_options::get(std::string_view name) const {
        const double* value = find_field(*this, name);
        THROW_IF(value == nullptr, invalid_config_key, "Unknown render option: ", name);
        return *value;
    }

    void render_options::update(std::initializer_list<option_value> values) {
        for (const auto& entry : values) {
            THROW_IF(!has_option(entry.first), invalid_config_key,
                     "Unable to set unknown render option: ", entry.first);
        }
        for (const auto& [name, value] : values) {
            *find_field(*this, name) = value;
        }
    }

}  // namespace hershey_font
