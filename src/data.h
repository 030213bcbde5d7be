#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// Key codes
//
// 32-bit driver values, written little-endian into key-value frames:
//   bits 24-31: type (0x01 unused, 0x02 keyboard, 0x03 consumer,
//               0x0a special function)
//   bits 16-23: modifier bits (keyboard) / usage high byte (consumer)
//   bits  8-15: USB HID usage
//   bits  0- 7: extra / reserved
// -----------------------------------------------------------------------

static constexpr uint32_t GK6X_UNUSED_KEY = 0x01000000;

// Name used in keymap files for the sentinel above
static constexpr const char* GK6X_UNUSED_KEY_NAME = "UnusedKey";

// Layer data types understood by the reset-layer-data command
enum class LayerDataType : uint8_t {
    Invalid                = 0,
    KeySet                 = 1,
    LEData                 = 3,
    Macros                 = 4,
    KeyPressLightingEffect = 5,
    Lighting               = 6,
    FnKeySet               = 7,
};

// Numeric layer codes as the firmware addresses them
enum class LayerCode : uint8_t {
    Invalid = 0,
    Base    = 1,
    Layer1  = 2,
    Layer2  = 3,
    Layer3  = 4,
    Driver  = 5,
};

// One programmable layer. Fn layers share the code of their numbered
// layer and are written with the Fn key-value opcode instead.
// The driver layer has its own key-value command, which is not
// implemented; its key set cannot be written.
struct LayerInfo {
    std::string name;
    LayerCode   code;
    bool        is_fn;
    bool        has_key_set;
};

// One physical key: its keymap-file name and its index into the
// per-LED color array.
struct PhysicalKey {
    std::string name;
    uint16_t    led;
};

// Command opcodes (byte 0 of a frame)
struct OpCodeSet {
    uint8_t info;
    uint8_t restart;
    uint8_t set_layer;
    uint8_t ping;
    uint8_t layer_reset_data_type;
    uint8_t layer_set_key_values;
    uint8_t layer_set_light_values;
    uint8_t layer_fn_set_key_values;
};

// Everything that differs between keyboards of the GK6x family.
// Selected once per session with find_model().
struct KeyboardModel {
    std::string name;
    std::string description;

    uint16_t vid;
    uint16_t pid;
    int      interface_number;
    uint8_t  ep_out;
    uint8_t  ep_in;

    size_t   led_count;      // size of the per-LED color array
    uint32_t unused_key;     // code for positions without a mapping

    std::vector<PhysicalKey>        keys;       // physical key order
    std::map<std::string, uint32_t> key_codes;  // key name → driver value
    std::vector<LayerInfo>          layers;
    OpCodeSet                       opcodes;
};

// -----------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------

// Throws LookupError for unknown model names (case-insensitive).
const KeyboardModel& find_model(const std::string& name);

// Names accepted by find_model(), in display order.
std::vector<std::string> model_names();

// Returns false if the name is not in the model's key-name table.
bool lookup_key_code(const KeyboardModel& model, const std::string& name, uint32_t& out);

// Returns nullptr if the layer name is unknown.
const LayerInfo* find_layer(const KeyboardModel& model, const std::string& name);

// Returns nullptr if the model has no physical key with that name.
const PhysicalKey* find_physical_key(const KeyboardModel& model, const std::string& name);

// Print the key-name table / layer table to stdout (--list-keys, --list-layers)
void list_keys(const KeyboardModel& model);
void list_layers(const KeyboardModel& model);
