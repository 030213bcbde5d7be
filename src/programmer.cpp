#include "programmer.h"

#include "errors.h"

static const char* const DEFAULT_COLOR_NAME = "default";

const LayerInfo& resolve_layer(const KeyboardModel& model, const std::string& name) {
    const LayerInfo* info = find_layer(model, name);
    if (!info)
        throw LookupError("Unknown layer name: " + name);
    return *info;
}

const LayerInfo& resolve_key_layer(const KeyboardModel& model, const std::string& name) {
    const LayerInfo& info = resolve_layer(model, name);
    if (!info.has_key_set)
        throw LookupError("Layer " + name + " has no writable key set");
    return info;
}

// -----------------------------------------------------------------------
// Key layers
// -----------------------------------------------------------------------

std::vector<uint32_t> build_key_codes(const KeyboardModel& model, const LayerKeys& layer) {
    // Validate the whole layer before anything is built. Sources that are
    // known key names but not keys of this model are ignored.
    for (const auto& [src, dst] : layer.keys) {
        uint32_t code;
        if (!lookup_key_code(model, src, code))
            throw LookupError("Source key name is wrong: " + src + " inside " + layer.layer);
        if (!lookup_key_code(model, dst, code))
            throw LookupError("Destination key name is wrong: " + dst + " inside " + layer.layer);
    }

    std::vector<uint32_t> codes;
    codes.reserve(model.keys.size());
    for (const auto& key : model.keys) {
        uint32_t code = model.unused_key;
        auto it = layer.keys.find(key.name);
        if (it != layer.keys.end())
            lookup_key_code(model, it->second, code);
        codes.push_back(code);
    }
    return codes;
}

void program_key_layers(KeyboardCommands& kb, const Keymap& keymap) {
    const KeyboardModel& model = kb.model();

    for (const auto& layer : keymap.key_layers) {
        const LayerInfo& info = resolve_key_layer(model, layer.layer);
        std::vector<uint32_t> codes = build_key_codes(model, layer);

        kb.trace().info("=== Keys: " + layer.layer + " (" + std::to_string(layer.keys.size()) +
                        " remapped, layer code " + std::to_string(static_cast<int>(info.code)) +
                        (info.is_fn ? ", Fn" : "") + ") ===");
        if (info.is_fn) {
            kb.reset_layer_data(info.code, LayerDataType::FnKeySet);
            kb.set_fn_key_values(info.code, codes);
        } else {
            kb.reset_layer_data(info.code, LayerDataType::KeySet);
            kb.set_key_values(info.code, codes);
        }
    }
}

// -----------------------------------------------------------------------
// Lighting layers
// -----------------------------------------------------------------------

uint32_t layer_default_color(const LayerColors& layer,
                             const std::map<std::string, uint32_t>& definitions) {
    auto it = layer.colors.find(DEFAULT_COLOR_NAME);
    if (it != layer.colors.end()) {
        auto def = definitions.find(it->second);
        if (def != definitions.end()) return def->second;
    }
    auto global = definitions.find(DEFAULT_COLOR_NAME);
    if (global != definitions.end()) return global->second;
    return 0x000000;
}

std::vector<uint32_t> build_color_table(const KeyboardModel& model, const LayerColors& layer,
                                        const std::map<std::string, uint32_t>& definitions) {
    const uint32_t fallback = layer_default_color(layer, definitions);
    std::vector<uint32_t> colors(model.led_count, fallback);

    for (const auto& [key_name, color_name] : layer.colors) {
        if (key_name == DEFAULT_COLOR_NAME) continue;

        const PhysicalKey* key = find_physical_key(model, key_name);
        if (!key)
            throw LookupError("Key name is wrong: " + key_name + " inside " + layer.layer);
        if (key->led >= colors.size())
            throw LookupError("LED index of " + key_name + " is outside the color table");

        uint32_t color = fallback;
        if (color_name != DEFAULT_COLOR_NAME) {
            auto def = definitions.find(color_name);
            if (def != definitions.end()) color = def->second;
        }
        colors[key->led] = color;
    }
    return colors;
}

void program_lighting_layers(KeyboardCommands& kb, const Keymap& keymap) {
    const KeyboardModel& model = kb.model();

    for (const auto& layer : keymap.color_layers) {
        const LayerInfo& info = resolve_layer(model, layer.layer);
        std::vector<uint32_t> colors = build_color_table(model, layer, keymap.color_definitions);

        kb.trace().info("=== Static lighting: " + layer.layer + " (layer code " +
                        std::to_string(static_cast<int>(info.code)) + ", " +
                        std::to_string(colors.size()) + " LEDs) ===");

        // The firmware does not always acknowledge this reset.
        try {
            kb.reset_layer_data(info.code, LayerDataType::Lighting);
        } catch (const TransportError& e) {
            kb.trace().debug(std::string("ignoring missing reset reply: ") + e.what());
        }
        kb.set_static_lighting(info.code, colors);
    }
}

void program_keymap(KeyboardCommands& kb, const Keymap& keymap) {
    program_lighting_layers(kb, keymap);
    program_key_layers(kb, keymap);
}

void validate_keymap(const KeyboardModel& model, const Keymap& keymap) {
    for (const auto& layer : keymap.color_layers) {
        resolve_layer(model, layer.layer);
        build_color_table(model, layer, keymap.color_definitions);
    }
    for (const auto& layer : keymap.key_layers) {
        resolve_key_layer(model, layer.layer);
        build_key_codes(model, layer);
    }
}
