#include "data.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>

#include "errors.h"

// -----------------------------------------------------------------------
// Driver values shared by the GK6x family
// -----------------------------------------------------------------------
static const std::map<std::string, uint32_t> gk6x_key_codes = {
    // Keyboard keys (type 0x02, HID usage in bits 8-15)
    {"A",           0x02000400},
    {"B",           0x02000500},
    {"C",           0x02000600},
    {"D",           0x02000700},
    {"E",           0x02000800},
    {"F",           0x02000900},
    {"G",           0x02000a00},
    {"H",           0x02000b00},
    {"I",           0x02000c00},
    {"J",           0x02000d00},
    {"K",           0x02000e00},
    {"L",           0x02000f00},
    {"M",           0x02001000},
    {"N",           0x02001100},
    {"O",           0x02001200},
    {"P",           0x02001300},
    {"Q",           0x02001400},
    {"R",           0x02001500},
    {"S",           0x02001600},
    {"T",           0x02001700},
    {"U",           0x02001800},
    {"V",           0x02001900},
    {"W",           0x02001a00},
    {"X",           0x02001b00},
    {"Y",           0x02001c00},
    {"Z",           0x02001d00},
    {"D1",          0x02001e00},
    {"D2",          0x02001f00},
    {"D3",          0x02002000},
    {"D4",          0x02002100},
    {"D5",          0x02002200},
    {"D6",          0x02002300},
    {"D7",          0x02002400},
    {"D8",          0x02002500},
    {"D9",          0x02002600},
    {"D0",          0x02002700},
    {"Enter",       0x02002800},
    {"Esc",         0x02002900},
    {"Backspace",   0x02002a00},
    {"Tab",         0x02002b00},
    {"Space",       0x02002c00},
    {"Minus",       0x02002d00},
    {"Equals",      0x02002e00},
    {"LBracket",    0x02002f00},
    {"RBracket",    0x02003000},
    {"Backslash",   0x02003100},
    {"Semicolon",   0x02003300},
    {"Quote",       0x02003400},
    {"Grave",       0x02003500},
    {"Comma",       0x02003600},
    {"Period",      0x02003700},
    {"Slash",       0x02003800},
    {"CapsLock",    0x02003900},
    {"F1",          0x02003a00},
    {"F2",          0x02003b00},
    {"F3",          0x02003c00},
    {"F4",          0x02003d00},
    {"F5",          0x02003e00},
    {"F6",          0x02003f00},
    {"F7",          0x02004000},
    {"F8",          0x02004100},
    {"F9",          0x02004200},
    {"F10",         0x02004300},
    {"F11",         0x02004400},
    {"F12",         0x02004500},
    {"PrintScreen", 0x02004600},
    {"ScrollLock",  0x02004700},
    {"Pause",       0x02004800},
    {"Insert",      0x02004900},
    {"Home",        0x02004a00},
    {"PageUp",      0x02004b00},
    {"Delete",      0x02004c00},
    {"End",         0x02004d00},
    {"PageDown",    0x02004e00},
    {"Right",       0x02004f00},
    {"Left",        0x02005000},
    {"Down",        0x02005100},
    {"Up",          0x02005200},
    {"Menu",        0x02006500},

    // Modifiers (type 0x02, modifier bit in bits 16-23)
    {"LCtrl",       0x02010000},
    {"LShift",      0x02020000},
    {"LAlt",        0x02040000},
    {"LWin",        0x02080000},
    {"RCtrl",       0x02100000},
    {"RShift",      0x02200000},
    {"RAlt",        0x02400000},
    {"RWin",        0x02800000},

    // Consumer controls (type 0x03)
    {"Mute",        0x0300e200},
    {"VolumeUp",    0x0300e900},
    {"VolumeDown",  0x0300ea00},
    {"PlayPause",   0x0300cd00},
    {"NextTrack",   0x0300b500},
    {"PrevTrack",   0x0300b600},
    {"Stop",        0x0300b700},

    // Special
    {"Fn",          0x0a070001},
    {"UnusedKey",   0x01000000},
};

// -----------------------------------------------------------------------
// Kemove DK61 (60%, 61 keys)
//
// Keys are listed in the order the firmware expects their driver values.
// LED indices address a 6 x 22 matrix (132 entries); row r, column c
// sits at r * 22 + c.
// -----------------------------------------------------------------------
static const std::vector<PhysicalKey> dk61_keys = {
    // Row 0
    {"Esc",          0},
    {"D1",           1},
    {"D2",           2},
    {"D3",           3},
    {"D4",           4},
    {"D5",           5},
    {"D6",           6},
    {"D7",           7},
    {"D8",           8},
    {"D9",           9},
    {"D0",          10},
    {"Minus",       11},
    {"Equals",      12},
    {"Backspace",   13},
    // Row 1
    {"Tab",         22},
    {"Q",           23},
    {"W",           24},
    {"E",           25},
    {"R",           26},
    {"T",           27},
    {"Y",           28},
    {"U",           29},
    {"I",           30},
    {"O",           31},
    {"P",           32},
    {"LBracket",    33},
    {"RBracket",    34},
    {"Backslash",   35},
    // Row 2
    {"CapsLock",    44},
    {"A",           45},
    {"S",           46},
    {"D",           47},
    {"F",           48},
    {"G",           49},
    {"H",           50},
    {"J",           51},
    {"K",           52},
    {"L",           53},
    {"Semicolon",   54},
    {"Quote",       55},
    {"Enter",       56},
    // Row 3
    {"LShift",      66},
    {"Z",           67},
    {"X",           68},
    {"C",           69},
    {"V",           70},
    {"B",           71},
    {"N",           72},
    {"M",           73},
    {"Comma",       74},
    {"Period",      75},
    {"Slash",       76},
    {"RShift",      77},
    // Row 4
    {"LCtrl",       88},
    {"LWin",        89},
    {"LAlt",        90},
    {"Space",       91},
    {"RAlt",        92},
    {"Fn",          93},
    {"Menu",        94},
    {"RCtrl",       95},
};

static const std::vector<LayerInfo> gk6x_layers = {
    {"Base",     LayerCode::Base,   false, true },
    {"Layer1",   LayerCode::Layer1, false, true },
    {"Layer2",   LayerCode::Layer2, false, true },
    {"Layer3",   LayerCode::Layer3, false, true },
    {"FnLayer1", LayerCode::Layer1, true,  true },
    {"FnLayer2", LayerCode::Layer2, true,  true },
    {"FnLayer3", LayerCode::Layer3, true,  true },
    {"Driver",   LayerCode::Driver, false, false},
};

static const OpCodeSet gk6x_opcodes = {
    0x01,  // info
    0x03,  // restart
    0x0b,  // set_layer
    0x0c,  // ping
    0x21,  // layer_reset_data_type
    0x22,  // layer_set_key_values
    0x27,  // layer_set_light_values
    0x31,  // layer_fn_set_key_values
};

static const KeyboardModel dk61 = {
    "dk61",
    "Kemove DK61",
    0x1ea7,   // vid
    0x0907,   // pid
    1,        // control interface
    0x04,     // interrupt OUT
    0x83,     // interrupt IN
    132,      // LEDs
    GK6X_UNUSED_KEY,
    dk61_keys,
    gk6x_key_codes,
    gk6x_layers,
    gk6x_opcodes,
};

static const KeyboardModel* const all_models[] = {
    &dk61,
};

// -----------------------------------------------------------------------
// Lookups
// -----------------------------------------------------------------------

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

const KeyboardModel& find_model(const std::string& name) {
    for (const KeyboardModel* m : all_models)
        if (m->name == to_lower(name)) return *m;
    throw LookupError("Unknown keyboard model: " + name);
}

std::vector<std::string> model_names() {
    std::vector<std::string> names;
    for (const KeyboardModel* m : all_models)
        names.push_back(m->name);
    return names;
}

bool lookup_key_code(const KeyboardModel& model, const std::string& name, uint32_t& out) {
    auto it = model.key_codes.find(name);
    if (it == model.key_codes.end()) return false;
    out = it->second;
    return true;
}

const LayerInfo* find_layer(const KeyboardModel& model, const std::string& name) {
    for (const auto& l : model.layers)
        if (l.name == name) return &l;
    return nullptr;
}

const PhysicalKey* find_physical_key(const KeyboardModel& model, const std::string& name) {
    auto it = std::find_if(model.keys.begin(), model.keys.end(),
                           [&](const PhysicalKey& k) { return k.name == name; });
    return it == model.keys.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------------
// Listings
// -----------------------------------------------------------------------

void list_keys(const KeyboardModel& model) {
    std::cout << "Physical keys (" << model.description << ", "
              << model.keys.size() << " keys):\n";
    for (const auto& k : model.keys)
        std::cout << "  " << std::left << std::setw(14) << k.name << std::right
                  << " led " << k.led << "\n";

    std::cout << "\nKey names:\n";
    for (const auto& [name, code] : model.key_codes)
        std::cout << "  " << std::left << std::setw(14) << name << std::right
                  << " 0x" << std::hex << std::setw(8) << std::setfill('0') << code
                  << std::dec << std::setfill(' ') << "\n";
}

void list_layers(const KeyboardModel& model) {
    std::cout << "Layers (" << model.description << "):\n";
    for (const auto& l : model.layers)
        std::cout << "  " << std::left << std::setw(10) << l.name << std::right
                  << " code " << static_cast<int>(l.code)
                  << (l.is_fn ? "  (Fn key set)" : "")
                  << (l.has_key_set ? "" : "  (no key set)") << "\n";
}
