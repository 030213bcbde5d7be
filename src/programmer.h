#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config.h"
#include "data.h"
#include "protocol.h"

// -----------------------------------------------------------------------
// Keymap → command sequences
//
// Every layer is resolved and validated completely before its first
// frame goes out. Layers are otherwise independent: a failure stops the
// current layer and propagates, layers already written stay written.
// -----------------------------------------------------------------------

// Layer name → layer descriptor. Throws LookupError if unknown.
const LayerInfo& resolve_layer(const KeyboardModel& model, const std::string& name);

// Same, for a [keys:*] layer. Also throws LookupError for layers whose
// key set cannot be written (the driver layer).
const LayerInfo& resolve_key_layer(const KeyboardModel& model, const std::string& name);

// Full driver-value sequence for one key layer, in physical key order.
// Keys without a mapping get the model's unused-key code.
// Throws LookupError naming the key and layer for source or destination
// names missing from the key-name table. Known sources that are not
// physical keys of the model are skipped.
std::vector<uint32_t> build_key_codes(const KeyboardModel& model, const LayerKeys& layer);

// Layer default color: the layer's "default" entry resolved through the
// color definitions, else the global "default" definition, else black.
uint32_t layer_default_color(const LayerColors& layer,
                             const std::map<std::string, uint32_t>& definitions);

// Per-LED color table (model.led_count entries) for one lighting layer.
// Unknown or "default" color names fall back to layer_default_color().
// Throws LookupError for key names that are not physical keys.
std::vector<uint32_t> build_color_table(const KeyboardModel& model, const LayerColors& layer,
                                        const std::map<std::string, uint32_t>& definitions);

// Reset + write the key set of every [keys:*] layer.
void program_key_layers(KeyboardCommands& kb, const Keymap& keymap);

// Best-effort reset + static lighting upload for every [lighting:*] layer.
void program_lighting_layers(KeyboardCommands& kb, const Keymap& keymap);

// Lighting layers first, then key layers.
void program_keymap(KeyboardCommands& kb, const Keymap& keymap);

// Resolve every layer without touching the device (--check).
// Throws LookupError on the first problem found.
void validate_keymap(const KeyboardModel& model, const Keymap& keymap);
