#pragma once

#include "action_adapter.hpp"
#include "image_driver.hpp"
#include "input_driver.hpp"
#include "pmacro_errors.hpp"

namespace PMACRO {

// Live provider. Template decoding and display geometry go through the SDL
// image driver; pointer and keyboard events and desktop capture go through
// the X11 input driver.
class DesktopAdapter : public ActionAdapter {
public:
    DesktopAdapter(ImageDriver& images, InputDriver& input, bool failSafe = true);

    void moveTo(int64_t x, int64_t y) override;
    void click(MouseButton button) override;
    void buttonDown(MouseButton button) override;
    void buttonUp(MouseButton button) override;

    void keyDown(const std::string& key) override;
    void keyUp(const std::string& key) override;
    void keyPress(const std::string& key) override;
    void typeText(const std::string& text) override;

    Image captureScreen() override;
    ScreenSize logicalScreenSize() override;
    std::optional<Image> loadImage(const std::string& path) override;

private:
    void checkFailSafe();
    void button(MouseButton button, bool down);
    void key(const std::string& key, bool down);

    ImageDriver& images_;
    InputDriver& input_;
    bool failSafe_;
};

} // namespace PMACRO
