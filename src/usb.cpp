#include "usb.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#include "errors.h"

static std::string usb_error(const std::string& what, int r) {
    return what + ": " + libusb_strerror(static_cast<libusb_error>(r));
}

UsbKeyboard::UsbKeyboard() {
    int r = libusb_init(&_ctx);
    if (r < 0)
        throw TransportError(usb_error("libusb_init failed", r));
}

UsbKeyboard::~UsbKeyboard() {
    close();
    if (_ctx) {
        libusb_exit(_ctx);
        _ctx = nullptr;
    }
}

void UsbKeyboard::open(const UsbTarget& target) {
    _target = target;
    _handle = libusb_open_device_with_vid_pid(_ctx, target.vid, target.pid);
    if (!_handle) {
        std::ostringstream ss;
        ss << "Could not find or open device " << std::hex << std::setfill('0')
           << std::setw(4) << target.vid << ":" << std::setw(4) << target.pid
           << " - is the keyboard plugged in? Try running with sudo or install the udev rule.";
        throw TransportError(ss.str());
    }

    // Only the vendor control interface is claimed; typing keeps working
    // through the other interfaces while we program the keyboard.
    const int iface = target.interface_number;
    if (libusb_kernel_driver_active(_handle, iface) == 1) {
        int r = libusb_detach_kernel_driver(_handle, iface);
        if (r < 0) {
            close();
            throw TransportError(usb_error(
                "Failed to detach kernel driver from interface " + std::to_string(iface), r));
        }
        _detached = true;
    }

    int r = libusb_claim_interface(_handle, iface);
    if (r < 0) {
        close();
        throw TransportError(usb_error("Failed to claim interface " + std::to_string(iface), r));
    }
    _claimed = true;
}

void UsbKeyboard::close() {
    if (!_handle) return;

    if (_claimed)
        libusb_release_interface(_handle, _target.interface_number);
    if (_detached)
        libusb_attach_kernel_driver(_handle, _target.interface_number);
    _claimed  = false;
    _detached = false;

    libusb_close(_handle);
    _handle = nullptr;
}

void UsbKeyboard::write(const uint8_t* data, size_t len) {
    if (!_handle)
        throw TransportError("write on a closed device");

    // libusb_interrupt_transfer takes a non-const buffer even for OUT
    // transfers (it won't modify it, but the API isn't const-correct)
    std::vector<uint8_t> buf(data, data + len);
    int transferred = 0;
    int r = libusb_interrupt_transfer(
        _handle,
        _target.ep_out,
        buf.data(),
        static_cast<int>(len),
        &transferred,
        USB_WRITE_TIMEOUT_MS);

    if (r < 0)
        throw TransportError(usb_error("Interrupt transfer (send) failed", r));
    if (transferred != static_cast<int>(len)) {
        throw TransportError("Incomplete send: wrote " + std::to_string(transferred) +
                             " bytes, expected " + std::to_string(len));
    }
}

int UsbKeyboard::read(uint8_t* buf, size_t len, unsigned int timeout_ms) {
    if (!_handle)
        throw TransportError("read on a closed device");

    int transferred = 0;
    int r = libusb_interrupt_transfer(
        _handle,
        _target.ep_in,
        buf,
        static_cast<int>(len),
        &transferred,
        timeout_ms);

    if (r == LIBUSB_ERROR_TIMEOUT) return 0;
    if (r < 0) {
        std::ostringstream ss;
        ss << "Interrupt transfer (recv) failed on EP 0x" << std::hex
           << static_cast<int>(_target.ep_in);
        throw TransportError(usb_error(ss.str(), r));
    }
    return transferred;
}

void UsbKeyboard::probe() {
    if (!_handle)
        throw TransportError("probe: keyboard is not open");

    libusb_config_descriptor* cfg = nullptr;
    int r = libusb_get_active_config_descriptor(libusb_get_device(_handle), &cfg);
    if (r < 0)
        throw TransportError(usb_error("Cannot read config descriptor", r));

    bool out_ok = false;
    bool in_ok  = false;

    for (int i = 0; i < cfg->bNumInterfaces; ++i) {
        for (int a = 0; a < cfg->interface[i].num_altsetting; ++a) {
            const libusb_interface_descriptor& alt = cfg->interface[i].altsetting[a];
            const bool control = alt.bInterfaceNumber == _target.interface_number;

            std::cout << (control ? "* " : "  ") << "interface " << static_cast<int>(alt.bInterfaceNumber)
                      << " alt " << static_cast<int>(alt.bAlternateSetting)
                      << (alt.bInterfaceClass == LIBUSB_CLASS_HID ? " HID" : " non-HID")
                      << " protocol " << static_cast<int>(alt.bInterfaceProtocol) << "\n";

            for (int e = 0; e < alt.bNumEndpoints; ++e) {
                const libusb_endpoint_descriptor& ep = alt.endpoint[e];
                const bool interrupt = (ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) ==
                                       LIBUSB_TRANSFER_TYPE_INTERRUPT;
                const bool frame_sized = ep.wMaxPacketSize >= GK6X_PACKET_SIZE;

                std::ostringstream addr;
                addr << "0x" << std::hex << std::setw(2) << std::setfill('0')
                     << static_cast<int>(ep.bEndpointAddress);
                std::cout << "      ep " << addr.str()
                          << ((ep.bEndpointAddress & LIBUSB_ENDPOINT_IN) ? " in " : " out")
                          << (interrupt ? " interrupt" : " other")
                          << " max " << ep.wMaxPacketSize << "\n";

                if (control && interrupt && frame_sized) {
                    if (ep.bEndpointAddress == _target.ep_out) out_ok = true;
                    if (ep.bEndpointAddress == _target.ep_in)  in_ok  = true;
                }
            }
        }
    }
    libusb_free_config_descriptor(cfg);

    std::cout << "Control channel: OUT endpoint " << (out_ok ? "ok" : "MISSING")
              << ", IN endpoint " << (in_ok ? "ok" : "MISSING") << "\n";
}
