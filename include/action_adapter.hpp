#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "image.hpp"

namespace PMACRO {

enum class MouseButton { Left, Right };

inline const char* buttonName(MouseButton b) { return b == MouseButton::Left ? "left" : "right"; }

// Everything the interpreter asks of the desktop. Providers report failures
// by throwing AdapterError.
class ActionAdapter {
public:
    virtual ~ActionAdapter() = default;

    virtual void moveTo(int64_t x, int64_t y) = 0;
    virtual void click(MouseButton button) = 0;
    virtual void buttonDown(MouseButton button) = 0;
    virtual void buttonUp(MouseButton button) = 0;

    virtual void keyDown(const std::string& key) = 0;
    virtual void keyUp(const std::string& key) = 0;
    virtual void keyPress(const std::string& key) = 0;
    virtual void typeText(const std::string& text) = 0;

    virtual Image captureScreen() = 0;
    virtual ScreenSize logicalScreenSize() = 0;
    // Empty optional when the file is missing or cannot be decoded
    virtual std::optional<Image> loadImage(const std::string& path) = 0;
};

// No-op provider used by --simulate and the tests. Actuation calls are
// recorded as text ("mouse move 10,20", "key press a", ...).
class SimulatedAdapter : public ActionAdapter {
public:
    using ImageLoader = std::function<std::optional<Image>(const std::string&)>;

    SimulatedAdapter();
    explicit SimulatedAdapter(ScreenSize logical);

    void moveTo(int64_t x, int64_t y) override;
    void click(MouseButton button) override;
    void buttonDown(MouseButton button) override;
    void buttonUp(MouseButton button) override;

    void keyDown(const std::string& key) override;
    void keyUp(const std::string& key) override;
    void keyPress(const std::string& key) override;
    void typeText(const std::string& text) override;

    // Returns the configured screen, or a blank image of the logical size
    Image captureScreen() override;
    ScreenSize logicalScreenSize() override { return logical_; }
    // Registered images first, then the loader callback if one is set
    std::optional<Image> loadImage(const std::string& path) override;

    void setScreen(const Image& screen) { screen_ = screen; }
    void setCaptureFails(bool fails) { captureFails_ = fails; }
    void addImage(const std::string& path, const Image& img) { images_[path] = img; }
    void setImageLoader(ImageLoader loader) { loader_ = std::move(loader); }

    const std::vector<std::string>& actions() const { return actions_; }
    size_t captureCount() const { return captures_; }

private:
    ScreenSize logical_;
    std::optional<Image> screen_;
    bool captureFails_ = false;
    std::unordered_map<std::string, Image> images_;
    ImageLoader loader_;
    std::vector<std::string> actions_;
    size_t captures_ = 0;
};

} // namespace PMACRO
