#pragma once

#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

// Parsed representation of an INI keymap file:
//
//   [colors]            color name → 0xRRGGBB  (plus "default")
//   [lighting:LAYER]    key name → color name  (plus "default")
//   [keys:LAYER]        source key name → destination key name
//
// Layers keep the order in which they first appear in the file.
// Names are not checked against any keyboard here; see programmer.h.

struct LayerKeys {
    std::string                        layer;
    std::map<std::string, std::string> keys;     // source key → destination key
};

struct LayerColors {
    std::string                        layer;
    std::map<std::string, std::string> colors;   // key name → color name
};

struct Keymap {
    std::vector<LayerKeys>          key_layers;
    std::vector<LayerColors>        color_layers;
    std::map<std::string, uint32_t> color_definitions;
};

// Parse an INI keymap file from disk.
// Throws std::runtime_error if the file cannot be read or has syntax errors.
Keymap parse_keymap_file(const std::string& path);

// Same, from an already open stream; `source` only appears in messages.
Keymap parse_keymap(std::istream& in, const std::string& source = "<input>");

// "#RRGGBB", "0xRRGGBB" or a decimal value no larger than 0xffffff.
// Returns false if the string is not a color.
bool parse_color(const std::string& s, uint32_t& out);
