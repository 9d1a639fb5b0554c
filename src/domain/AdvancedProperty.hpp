#pragma once

#include <string>

// Uma feature do driver, como o ethtool a exibe ("on"/"off").
struct AdvancedProperty {
    std::string adapter;
    std::string name;
    std::string value;
    bool fixed = false;  // "[fixed]": o driver não aceita alteração
};
