// InputDriver.h
#pragma once

#include <string>

#include "action_adapter.hpp"
#include "image.hpp"

struct _XDisplay;

namespace PMACRO {

// X11 / XTest layer: synthetic pointer and keyboard events, pointer queries
// and root-window capture. Xlib headers stay inside InputDriver.cpp.
class InputDriver {
public:
    InputDriver();
    ~InputDriver();

    InputDriver(const InputDriver&) = delete;
    InputDriver& operator=(const InputDriver&) = delete;

    // Initialize/Shutdown
    bool init();              // opens the default display, checks for XTest
    void shutdown();

    bool moveMouse(int x, int y);
    bool mouseButton(MouseButton button, bool down);
    bool mousePosition(int &x, int &y);

    // `key` is a single character or a key name ("enter", "ctrl", "f5", ...)
    bool key(const std::string &key, bool down);
    bool typeChar(char c);

    // Whole root window as RGBA
    bool captureRoot(Image &out);

private:
    _XDisplay* display_ = nullptr;

    bool sendKeysym(unsigned long sym, bool down);
};

// X keysym name for a key name: "enter" -> "Return", "f5" -> "F5".
// Empty when the name is unknown. Single characters are not handled here.
std::string x11KeysymName(const std::string &key);

} // namespace PMACRO
