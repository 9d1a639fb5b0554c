#pragma once

#include <string>

enum class LinkStatus { Up, Down, Other };

struct Adapter {
    std::string name;
    int index = 0;
    LinkStatus status = LinkStatus::Other;
    bool physical = false;
};
