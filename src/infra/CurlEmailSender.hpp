#pragma once

#include "domain/EmailSender.hpp"

#include <memory>
#include <string>

struct EmailSettings {
    std::string user;
    std::string pass;
    std::string to;
    std::string server = "smtp.gmail.com";
    std::string port = "587";
    bool useSsl = false;
};

class CurlEmailSender : public EmailSender {
public:
    explicit CurlEmailSender(EmailSettings settings) : settings_(std::move(settings)) {}

    // nullptr quando EMAIL_USER/EMAIL_PASS/EMAIL_TO não estão definidos.
    static std::shared_ptr<CurlEmailSender> fromEnv();

    bool send(const std::string& subject, const std::string& body) override;

private:
    EmailSettings settings_;
};
