#pragma once

#include <atomic>
#include <chrono>
#include <fcntl.h>
#include <functional>
#include <iostream>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace voxcall {

// Raw single-key input on a polling thread. The callback runs on that
// thread; callers hand keys over to the event loop themselves.
class KeyboardHandler {
public:
    using KeyCallback = std::function<void(char key)>;

    static constexpr char CTRL_C = 0x03;

    KeyboardHandler() : running_(false), usable_(false) {
        // Save terminal settings
        if (tcgetattr(STDIN_FILENO, &oldSettings_) < 0) {
            std::cerr << "Warning: failed to get terminal attributes, keyboard disabled\n";
            return;
        }

        newSettings_ = oldSettings_;
        newSettings_.c_lflag &= ~(ICANON | ECHO | ISIG);  // Ctrl-C arrives as a key
        newSettings_.c_cc[VMIN] = 1;
        newSettings_.c_cc[VTIME] = 0;

        oldFlags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
        if (oldFlags_ < 0 || fcntl(STDIN_FILENO, F_SETFL, oldFlags_ | O_NONBLOCK) < 0) {
            std::cerr << "Warning: failed to set non-blocking mode, keyboard disabled\n";
            return;
        }
        usable_ = true;
    }

    ~KeyboardHandler() {
        stop();
        if (usable_) {
            tcsetattr(STDIN_FILENO, TCSANOW, &oldSettings_);
            fcntl(STDIN_FILENO, F_SETFL, oldFlags_);
        }
    }

    KeyboardHandler(const KeyboardHandler&) = delete;
    KeyboardHandler& operator=(const KeyboardHandler&) = delete;

    bool start() {
        if (running_ || !usable_) return false;

        if (tcsetattr(STDIN_FILENO, TCSANOW, &newSettings_) < 0) {
            std::cerr << "Warning: failed to set terminal attributes\n";
            return false;
        }

        running_ = true;
        thread_ = std::thread([this]() {
            char c;
            auto lastSpaceTime = std::chrono::steady_clock::now() - debounceTime_;
            const auto pollInterval = std::chrono::milliseconds(5);

            while (running_) {
                if (read(STDIN_FILENO, &c, 1) > 0) {
                    // Key repeat on a held space bar would toggle the turn.
                    if (c == ' ') {
                        auto now = std::chrono::steady_clock::now();
                        if (now - lastSpaceTime < debounceTime_) continue;
                        lastSpaceTime = now;
                    }
                    if (keyCallback_) keyCallback_(c);
                }
                std::this_thread::sleep_for(pollInterval);
            }
        });
        return true;
    }

    void stop() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Set before start().
    void setKeyCallback(KeyCallback callback) {
        keyCallback_ = std::move(callback);
    }

private:
    const std::chrono::milliseconds debounceTime_{250};
    std::atomic<bool> running_;
    bool usable_;
    int oldFlags_{0};
    std::thread thread_;
    KeyCallback keyCallback_;
    struct termios oldSettings_;
    struct termios newSettings_;
};

} // namespace voxcall
