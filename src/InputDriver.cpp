// InputDriver.cpp
#include "input_driver.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/XKBlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

#include <cctype>
#include <iostream>
#include <unordered_map>

namespace PMACRO {

std::string x11KeysymName(const std::string &key) {
    static const std::unordered_map<std::string, std::string> names = {
        {"enter", "Return"}, {"return", "Return"}, {"tab", "Tab"}, {"space", "space"},
        {"backspace", "BackSpace"}, {"delete", "Delete"}, {"del", "Delete"}, {"insert", "Insert"},
        {"esc", "Escape"}, {"escape", "Escape"},
        {"up", "Up"}, {"down", "Down"}, {"left", "Left"}, {"right", "Right"},
        {"home", "Home"}, {"end", "End"},
        {"pageup", "Prior"}, {"pgup", "Prior"}, {"pagedown", "Next"}, {"pgdn", "Next"},
        {"shift", "Shift_L"}, {"shiftleft", "Shift_L"}, {"shiftright", "Shift_R"},
        {"ctrl", "Control_L"}, {"ctrlleft", "Control_L"}, {"ctrlright", "Control_R"},
        {"alt", "Alt_L"}, {"altleft", "Alt_L"}, {"altright", "Alt_R"},
        {"win", "Super_L"}, {"winleft", "Super_L"}, {"winright", "Super_R"},
        {"super", "Super_L"}, {"command", "Super_L"},
        {"capslock", "Caps_Lock"}, {"numlock", "Num_Lock"}, {"scrolllock", "Scroll_Lock"},
        {"printscreen", "Print"}, {"prtsc", "Print"}, {"pause", "Pause"}, {"menu", "Menu"}
    };
    std::string lower;
    for (char c : key) lower.push_back((char)std::tolower((unsigned char)c));

    auto it = names.find(lower);
    if (it != names.end()) return it->second;

    // f1 .. f24
    if (lower.size() >= 2 && lower.size() <= 3 && lower[0] == 'f') {
        bool digits = true;
        for (size_t i = 1; i < lower.size(); ++i) digits = digits && std::isdigit((unsigned char)lower[i]);
        if (digits) {
            int n = std::stoi(lower.substr(1));
            if (n >= 1 && n <= 24) return "F" + std::to_string(n);
        }
    }
    return "";
}

// Latin-1 keysyms equal their character codes
static KeySym charKeysym(char c) {
    if (c == '\n') return XK_Return;
    if (c == '\t') return XK_Tab;
    return (KeySym)(unsigned char)c;
}

InputDriver::InputDriver() {}
InputDriver::~InputDriver() { shutdown(); }

bool InputDriver::init() {
    if (display_) return true;
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        std::cerr << "XOpenDisplay failed: cannot open display" << std::endl;
        return false;
    }
    int event = 0, error = 0, major = 0, minor = 0;
    if (!XTestQueryExtension(display_, &event, &error, &major, &minor)) {
        std::cerr << "XTest extension is not available on this display" << std::endl;
        XCloseDisplay(display_);
        display_ = nullptr;
        return false;
    }
    return true;
}

void InputDriver::shutdown() {
    if (display_) {
        XCloseDisplay(display_);
        display_ = nullptr;
    }
}

bool InputDriver::moveMouse(int x, int y) {
    if (!init()) return false;
    if (!XTestFakeMotionEvent(display_, -1, x, y, CurrentTime)) {
        std::cerr << "XTestFakeMotionEvent failed" << std::endl;
        return false;
    }
    XFlush(display_);
    return true;
}

bool InputDriver::mouseButton(MouseButton button, bool down) {
    if (!init()) return false;
    unsigned int b = button == MouseButton::Left ? 1 : 3;
    if (!XTestFakeButtonEvent(display_, b, down ? True : False, CurrentTime)) {
        std::cerr << "XTestFakeButtonEvent failed" << std::endl;
        return false;
    }
    XFlush(display_);
    return true;
}

bool InputDriver::mousePosition(int &x, int &y) {
    x = y = -1;
    if (!init()) return false;
    Window root, child;
    int winX, winY;
    unsigned int mask;
    if (!XQueryPointer(display_, DefaultRootWindow(display_), &root, &child, &x, &y, &winX, &winY, &mask)) {
        std::cerr << "XQueryPointer: pointer is on another screen" << std::endl;
        return false;
    }
    return true;
}

bool InputDriver::sendKeysym(unsigned long sym, bool down) {
    KeyCode code = XKeysymToKeycode(display_, sym);
    if (code == 0) {
        const char* name = XKeysymToString(sym);
        std::cerr << "No keycode for keysym '" << (name ? name : "?") << "'" << std::endl;
        return false;
    }
    // symbols on the shifted level need Shift held around them
    bool shifted = XkbKeycodeToKeysym(display_, code, 0, 0) != sym &&
                   XkbKeycodeToKeysym(display_, code, 0, 1) == sym;
    KeyCode shift = XKeysymToKeycode(display_, XK_Shift_L);

    if (down) {
        if (shifted && shift) XTestFakeKeyEvent(display_, shift, True, CurrentTime);
        XTestFakeKeyEvent(display_, code, True, CurrentTime);
    } else {
        XTestFakeKeyEvent(display_, code, False, CurrentTime);
        if (shifted && shift) XTestFakeKeyEvent(display_, shift, False, CurrentTime);
    }
    XFlush(display_);
    return true;
}

bool InputDriver::key(const std::string &key, bool down) {
    if (!init()) return false;
    if (key.empty()) {
        std::cerr << "Empty key name" << std::endl;
        return false;
    }
    KeySym sym;
    if (key.size() == 1) {
        sym = charKeysym(key[0]);
    } else {
        std::string name = x11KeysymName(key);
        if (name.empty()) {
            std::cerr << "Unknown key name '" << key << "'" << std::endl;
            return false;
        }
        sym = XStringToKeysym(name.c_str());
        if (sym == NoSymbol) {
            std::cerr << "XStringToKeysym failed for '" << name << "'" << std::endl;
            return false;
        }
    }
    return sendKeysym(sym, down);
}

bool InputDriver::typeChar(char c) {
    if (!init()) return false;
    KeySym sym = charKeysym(c);
    return sendKeysym(sym, true) && sendKeysym(sym, false);
}

namespace {

struct MaskChannel {
    int shift = 0;
    unsigned long max = 0;

    explicit MaskChannel(unsigned long mask) {
        if (!mask) return;
        while (!((mask >> shift) & 1)) ++shift;
        max = mask >> shift;
    }

    uint8_t operator()(unsigned long pixel, unsigned long mask) const {
        if (!max) return 0;
        return (uint8_t)(((pixel & mask) >> shift) * 255 / max);
    }
};

} // namespace

bool InputDriver::captureRoot(Image &out) {
    if (!init()) return false;
    Window root = DefaultRootWindow(display_);
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display_, root, &attrs)) {
        std::cerr << "XGetWindowAttributes failed for the root window" << std::endl;
        return false;
    }
    XImage* ximg = XGetImage(display_, root, 0, 0, attrs.width, attrs.height, AllPlanes, ZPixmap);
    if (!ximg) {
        std::cerr << "XGetImage failed for the root window" << std::endl;
        return false;
    }

    out.w = ximg->width;
    out.h = ximg->height;
    out.channels = 4;
    out.path = "<screen>";
    out.pixels.resize((size_t)out.w * out.h * 4);

    const MaskChannel red(ximg->red_mask), green(ximg->green_mask), blue(ximg->blue_mask);
    const bool bgrx = ximg->bits_per_pixel == 32 && ximg->byte_order == LSBFirst &&
                      ximg->red_mask == 0xff0000 && ximg->green_mask == 0xff00 && ximg->blue_mask == 0xff;

    for (int y = 0; y < out.h; ++y) {
        uint8_t* dst = &out.pixels[(size_t)y * out.w * 4];
        const uint8_t* row = reinterpret_cast<const uint8_t*>(ximg->data) + (size_t)y * ximg->bytes_per_line;
        for (int x = 0; x < out.w; ++x, dst += 4) {
            if (bgrx) {
                dst[0] = row[x * 4 + 2];
                dst[1] = row[x * 4 + 1];
                dst[2] = row[x * 4 + 0];
            } else {
                unsigned long pixel = XGetPixel(ximg, x, y);
                dst[0] = red(pixel, ximg->red_mask);
                dst[1] = green(pixel, ximg->green_mask);
                dst[2] = blue(pixel, ximg->blue_mask);
            }
            dst[3] = 255;
        }
    }
    XDestroyImage(ximg);
    return true;
}

} // namespace PMACRO
