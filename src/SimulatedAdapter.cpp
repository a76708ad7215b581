#include "action_adapter.hpp"
#include "pmacro_errors.hpp"

namespace PMACRO {

SimulatedAdapter::SimulatedAdapter() : logical_{ 1920, 1080 } {}

SimulatedAdapter::SimulatedAdapter(ScreenSize logical) : logical_(logical) {}

void SimulatedAdapter::moveTo(int64_t x, int64_t y) {
    actions_.push_back("mouse move " + std::to_string(x) + "," + std::to_string(y));
}

void SimulatedAdapter::click(MouseButton button) {
    actions_.push_back(std::string("mouse ") + buttonName(button) + " click");
}

void SimulatedAdapter::buttonDown(MouseButton button) {
    actions_.push_back(std::string("mouse ") + buttonName(button) + " down");
}

void SimulatedAdapter::buttonUp(MouseButton button) {
    actions_.push_back(std::string("mouse ") + buttonName(button) + " up");
}

void SimulatedAdapter::keyDown(const std::string& key) { actions_.push_back("key down " + key); }
void SimulatedAdapter::keyUp(const std::string& key) { actions_.push_back("key up " + key); }
void SimulatedAdapter::keyPress(const std::string& key) { actions_.push_back("key press " + key); }
void SimulatedAdapter::typeText(const std::string& text) { actions_.push_back("key type " + text); }

Image SimulatedAdapter::captureScreen() {
    ++captures_;
    if(captureFails_) throw AdapterError("screen capture failed");
    if(screen_) return *screen_;
    return blankImage(logical_.width, logical_.height);
}

std::optional<Image> SimulatedAdapter::loadImage(const std::string& path) {
    auto it = images_.find(path);
    if(it != images_.end()) return it->second;
    if(loader_) return loader_(path);
    return std::nullopt;
}

} // namespace PMACRO
