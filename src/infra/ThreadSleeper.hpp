#pragma once

#include "domain/Sleeper.hpp"

#include <chrono>
#include <thread>

class ThreadSleeper : public Sleeper {
public:
    void sleepSeconds(int seconds) override {
        if (seconds > 0) std::this_thread::sleep_for(std::chrono::seconds(seconds));
    }
};
