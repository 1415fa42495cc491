#include "call/error_slot.hpp"
#include <iostream>

namespace voxcall {

ErrorSlot::~ErrorSlot() {
    cancelTimer();
}

void ErrorSlot::show(const std::string& message) {
    cancelTimer();
    message_ = message;
    std::cerr << "Error: " << message << std::endl;
    timer_ = loop_.schedule(DISPLAY_TIME, [this]() {
        timer_.reset();
        message_.clear();
        if (changeCallback_) changeCallback_(message_);
    });
    if (changeCallback_) changeCallback_(message_);
}

void ErrorSlot::clear() {
    cancelTimer();
    if (message_.empty()) return;
    message_.clear();
    if (changeCallback_) changeCallback_(message_);
}

void ErrorSlot::cancelTimer() {
    if (timer_) {
        timer_->cancel();
        timer_.reset();
    }
}

} // namespace voxcall
