#pragma once

#include <string>

struct EmailSender {
    virtual ~EmailSender() = default;
    virtual bool send(const std::string& subject, const std::string& body) = 0;
};
