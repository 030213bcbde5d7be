#include "config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <stdexcept>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

template <typename Layer>
static Layer& layer_entry(std::vector<Layer>& layers, const std::string& name) {
    auto it = std::find_if(layers.begin(), layers.end(),
                           [&](const Layer& l) { return l.layer == name; });
    if (it != layers.end()) return *it;
    layers.push_back(Layer{name, {}});
    return layers.back();
}

// -----------------------------------------------------------------------
// Color string → uint32_t
// -----------------------------------------------------------------------

bool parse_color(const std::string& s, uint32_t& out) {
    std::string v = trim(s);
    int base = 10;
    if (!v.empty() && v[0] == '#') {
        v = v.substr(1);
        if (v.size() != 6) return false;
        base = 16;
    } else if (v.size() > 2 && v[0] == '0' && (v[1] == 'x' || v[1] == 'X')) {
        base = 16;
    }
    if (v.empty() || v[0] == '-' || v[0] == '+') return false;

    unsigned long value = 0;
    size_t used = 0;
    try {
        value = std::stoul(v, &used, base);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    if (used != v.size() || value > 0xffffff) return false;

    out = static_cast<uint32_t>(value);
    return true;
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Keymap parse_keymap(std::istream& in, const std::string& source) {
    Keymap km;

    enum class Section { None, Colors, Lighting, Keys };
    Section     section = Section::None;
    std::string layer;
    int         lineno  = 0;

    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");
    std::regex re_layer_section(R"(^(keys|lighting)\s*:\s*(\S+)$)", std::regex::icase);

    auto fail = [&](const std::string& msg) {
        throw std::runtime_error(source + ":" + std::to_string(lineno) + ": " + msg);
    };

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        // Section header
        if (std::regex_match(line, m, re_section)) {
            std::string name = trim(m[1].str());
            std::smatch lm;
            if (to_lower(name) == "colors") {
                section = Section::Colors;
            } else if (std::regex_match(name, lm, re_layer_section)) {
                // keys:/lighting: prefix is case-insensitive, layer names are not
                std::string kind = to_lower(lm[1].str());
                layer   = lm[2].str();
                section = (kind == "keys") ? Section::Keys : Section::Lighting;
                if (section == Section::Keys) layer_entry(km.key_layers, layer);
                else                          layer_entry(km.color_layers, layer);
            } else {
                fail("unknown section [" + name + "]");
            }
            continue;
        }

        // Key=value pair
        if (!std::regex_match(line, m, re_kv))
            fail("expected 'name = value', got '" + line + "'");

        std::string key   = trim(m[1].str());
        std::string value = trim(m[2].str());
        if (key.empty() || value.empty())
            fail("empty name or value");

        switch (section) {
        case Section::None:
            fail("'" + key + "' outside of any section");
            break;

        case Section::Colors: {
            uint32_t color = 0;
            if (!parse_color(value, color))
                fail("invalid color '" + value + "' for " + key);
            km.color_definitions[key] = color;
            break;
        }

        case Section::Lighting:
            layer_entry(km.color_layers, layer).colors[key] = value;
            break;

        case Section::Keys:
            layer_entry(km.key_layers, layer).keys[key] = value;
            break;
        }
    }

    return km;
}

Keymap parse_keymap_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open keymap file: " + path);
    return parse_keymap(f, path);
}
