#include "desktop_adapter.hpp"

#include <limits>

namespace PMACRO {

DesktopAdapter::DesktopAdapter(ImageDriver& images, InputDriver& input, bool failSafe)
    : images_(images), input_(input), failSafe_(failSafe) {}

// Parking the pointer in the top-left corner stops the macro
void DesktopAdapter::checkFailSafe() {
    if(!failSafe_) return;
    int x = -1, y = -1;
    if(!input_.mousePosition(x, y)) throw AdapterError("could not read the pointer position");
    if(x == 0 && y == 0){
        throw FailSafeError("Fail-safe triggered: mouse moved to the top-left corner");
    }
}

void DesktopAdapter::button(MouseButton button, bool down) {
    if(!input_.mouseButton(button, down)){
        throw AdapterError(std::string(buttonName(button)) + " button " + (down ? "press" : "release") + " failed");
    }
}

void DesktopAdapter::key(const std::string& key, bool down) {
    if(!input_.key(key, down)){
        throw AdapterError("key " + std::string(down ? "down" : "up") + " failed for '" + key + "'");
    }
}

void DesktopAdapter::moveTo(int64_t x, int64_t y) {
    checkFailSafe();
    if(x < std::numeric_limits<int>::min() || x > std::numeric_limits<int>::max() ||
       y < std::numeric_limits<int>::min() || y > std::numeric_limits<int>::max()){
        throw AdapterError("coordinates out of range");
    }
    if(!input_.moveMouse((int)x, (int)y)){
        throw AdapterError("mouse move failed");
    }
}

void DesktopAdapter::click(MouseButton b) {
    checkFailSafe();
    button(b, true);
    button(b, false);
}

void DesktopAdapter::buttonDown(MouseButton b) {
    checkFailSafe();
    button(b, true);
}

void DesktopAdapter::buttonUp(MouseButton b) {
    checkFailSafe();
    button(b, false);
}

void DesktopAdapter::keyDown(const std::string& k) {
    checkFailSafe();
    key(k, true);
}

void DesktopAdapter::keyUp(const std::string& k) {
    checkFailSafe();
    key(k, false);
}

void DesktopAdapter::keyPress(const std::string& k) {
    checkFailSafe();
    key(k, true);
    key(k, false);
}

void DesktopAdapter::typeText(const std::string& text) {
    checkFailSafe();
    for(char c : text){
        if(!input_.typeChar(c)){
            throw AdapterError(std::string("typing failed at '") + c + "'");
        }
    }
}

Image DesktopAdapter::captureScreen() {
    Image shot;
    if(!input_.captureRoot(shot)) throw AdapterError("desktop capture failed");
    return shot;
}

ScreenSize DesktopAdapter::logicalScreenSize() {
    ScreenSize size;
    if(!images_.displaySize(size)){
        throw AdapterError(std::string("could not query the display size: ") + SDL_GetError());
    }
    return size;
}

std::optional<Image> DesktopAdapter::loadImage(const std::string& path) {
    return images_.loadImage(path);
}

} // namespace PMACRO
