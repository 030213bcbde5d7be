#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config.h"
#include "data.h"
#include "errors.h"
#include "programmer.h"
#include "protocol.h"
#include "trace.h"
#include "usb.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS]

Key map and static lighting programmer for GK6x keyboards (Kemove DK61).

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit
  -v, --verbose            Hexdump every frame sent and received

  -m, --model NAME         Keyboard model (default: dk61)
  -k, --keymap FILE        Program key layers and static lighting from
                           an INI keymap file
  --check                  Parse and validate the keymap, do not touch
                           the keyboard

  --layer NAME             Switch the active layer, e.g. --layer Layer2
  --info                   Query firmware and buffer-size information
  --ping                   Send a ping and wait for the answer
  --restart                Restart the keyboard
  --probe                  Show USB interfaces and endpoints

  --list-keys              Print physical keys and key names, then exit
  --list-layers            Print layer names, then exit

Examples:
  dk61-ctl --keymap examples/keymap.ini
  dk61-ctl --keymap examples/keymap.ini --check
  dk61-ctl --keymap examples/keymap.ini --layer Layer1 -v

Note: Run as root or install the udev rule for non-root access:
  sudo cp udev/99-dk61.rules /etc/udev/rules.d/
  sudo udevadm control --reload-rules && sudo udevadm trigger
)";
}

static void print_info_reply(const std::string& label, const ReplyFrame& r) {
    std::cout << label << ": result 0x" << std::hex << std::setw(2) << std::setfill('0')
              << static_cast<int>(r.result()) << std::dec << std::setfill(' ') << "\n";
    hexdump(std::cout, r.data().data(), 16);
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",         no_argument,       nullptr, 'h'},
        {"version",      no_argument,       nullptr, 'V'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {"model",        required_argument, nullptr, 'm'},
        {"keymap",       required_argument, nullptr, 'k'},
        {"check",        no_argument,       nullptr, 1001},
        {"layer",        required_argument, nullptr, 1002},
        {"info",         no_argument,       nullptr, 1003},
        {"ping",         no_argument,       nullptr, 1004},
        {"restart",      no_argument,       nullptr, 1005},
        {"probe",        no_argument,       nullptr, 1006},
        {"list-keys",    no_argument,       nullptr, 1007},
        {"list-layers",  no_argument,       nullptr, 1008},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    bool        verbose      = false;
    bool        do_check     = false;
    bool        do_info      = false;
    bool        do_ping      = false;
    bool        do_restart   = false;
    bool        do_probe     = false;
    bool        do_list_keys   = false;
    bool        do_list_layers = false;
    std::string model_name   = "dk61";
    std::string keymap_file;
    std::string layer_arg;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVvm:k:", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "dk61-ctl " << VERSION << "\n";
            return 0;

        case 'v':
            verbose = true;
            break;

        case 'm':
            model_name = optarg;
            break;

        case 'k':
            keymap_file = optarg;
            break;

        case 1001: do_check       = true;   break;
        case 1002: layer_arg      = optarg; break;
        case 1003: do_info        = true;   break;
        case 1004: do_ping        = true;   break;
        case 1005: do_restart     = true;   break;
        case 1006: do_probe       = true;   break;
        case 1007: do_list_keys   = true;   break;
        case 1008: do_list_layers = true;   break;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    // ---- model and keymap are resolved before the device is opened ----
    const KeyboardModel* model = nullptr;
    Keymap keymap;
    const LayerInfo* active_layer = nullptr;
    try {
        model = &find_model(model_name);

        if (do_list_keys || do_list_layers) {
            if (do_list_keys)   list_keys(*model);
            if (do_list_layers) list_layers(*model);
            return 0;
        }

        if (!keymap_file.empty()) {
            keymap = parse_keymap_file(keymap_file);
            validate_keymap(*model, keymap);
        }
        if (!layer_arg.empty())
            active_layer = &resolve_layer(*model, layer_arg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (do_check) {
        if (keymap_file.empty()) {
            std::cerr << "Error: --check needs --keymap FILE\n";
            return 1;
        }
        std::cout << keymap_file << ": " << keymap.key_layers.size() << " key layer(s), "
                  << keymap.color_layers.size() << " lighting layer(s), "
                  << keymap.color_definitions.size() << " color(s) - OK\n";
        return 0;
    }

    // ---- validate that there's something to do ----
    bool has_work = do_info || do_ping || do_restart || do_probe ||
                    !keymap_file.empty() || active_layer != nullptr;
    if (!has_work) {
        print_help(argv[0]);
        return 0;
    }

    int exit_code = 0;

    try {
        // ---- open keyboard; closed by the destructor on every path ----
        UsbKeyboard device;
        std::cout << "Opening " << model->description << " (" << std::hex
                  << std::setfill('0') << std::setw(4) << model->vid << ":"
                  << std::setw(4) << model->pid << std::dec << std::setfill(' ')
                  << ", interface " << model->interface_number << ")...\n";
        device.open({model->vid, model->pid, model->interface_number,
                     model->ep_out, model->ep_in});
        std::cout << "Connected.\n\n";

        Trace trace(std::cout, verbose, &std::cerr);
        KeyboardCommands kb(*model, device, trace);

        // ---- --probe ----
        if (do_probe) {
            std::cout << "=== USB endpoint probe ===\n";
            device.probe();
        }

        // ---- --ping ----
        if (do_ping) {
            kb.ping();
            std::cout << "Ping answered.\n";
        }

        // ---- --info ----
        if (do_info) {
            std::cout << "=== Device info ===\n";
            print_info_reply("Firmware", kb.query_info(GK6X_INFO_FIRMWARE));
            ReplyFrame size = kb.query_info(GK6X_INFO_BUFFER_SIZE);
            print_info_reply("Buffer size", size);
            std::cout << "Buffer size bytes: " << static_cast<int>(size.data()[0])
                      << ", " << static_cast<int>(size.data()[1]) << "\n";
        }

        // ---- --keymap FILE ----
        if (!keymap_file.empty()) {
            std::cout << "=== Applying keymap: " << keymap_file << " ===\n";
            program_keymap(kb, keymap);
            std::cout << "Keymap written.\n";
        }

        // ---- --layer NAME ----
        if (active_layer) {
            std::cout << "=== Activating " << active_layer->name << " ===\n";
            kb.set_active_layer(active_layer->code);
        }

        // ---- --restart ----
        if (do_restart) {
            std::cout << "=== Restarting keyboard ===\n";
            kb.restart();
        }

    } catch (const ProtocolError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Packet raw = encode(e.reply());
        hexdump(std::cerr, raw.data(), raw.size());
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    return exit_code;
}
