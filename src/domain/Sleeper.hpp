#pragma once

struct Sleeper {
    virtual ~Sleeper() = default;
    virtual void sleepSeconds(int seconds) = 0;
};
