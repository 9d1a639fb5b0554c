#include "infra/CurlEmailSender.hpp"

#include "util/Env.hpp"
#include "util/Time.hpp"

#include <curl/curl.h>
#include <iostream>

namespace {
struct UploadState {
    std::string data;
    size_t offset = 0;
};

size_t readPayload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* st = static_cast<UploadState*>(userdata);
    size_t room = size * nitems;
    size_t left = st->data.size() - st->offset;
    size_t n = left < room ? left : room;
    if (n == 0) return 0;
    st->data.copy(buffer, n, st->offset);
    st->offset += n;
    return n;
}

std::string buildMessage(const EmailSettings& s, const std::string& subject, const std::string& body) {
    std::string msg;
    msg += "Date: " + nowMailDateStr() + "\r\n";
    msg += "To: " + s.to + "\r\n";
    msg += "From: " + s.user + "\r\n";
    msg += "Subject: " + subject + "\r\n";
    msg += "MIME-Version: 1.0\r\n";
    msg += "Content-Type: text/plain; charset=utf-8\r\n";
    msg += "\r\n";
    for (char c : body) {
        if (c == '\n')
            msg += "\r\n";
        else
            msg += c;
    }
    msg += "\r\n";
    return msg;
}
}  // namespace

std::shared_ptr<CurlEmailSender> CurlEmailSender::fromEnv() {
    EmailSettings s;
    s.user = getenvOr("EMAIL_USER", "");
    s.pass = getenvOr("EMAIL_PASS", "");
    s.to = getenvOr("EMAIL_TO", "");
    s.server = getenvOr("SMTP_SERVER", s.server);
    s.port = getenvOr("SMTP_PORT", s.port);
    std::string ssl = getenvOr("EMAIL_USE_SSL", "0");
    s.useSsl = (ssl == "1" || ssl == "true" || ssl == "True");

    if (s.user.empty() || s.pass.empty() || s.to.empty()) return nullptr;
    return std::make_shared<CurlEmailSender>(s);
}

bool CurlEmailSender::send(const std::string& subject, const std::string& body) {
    std::string url = std::string(settings_.useSsl ? "smtps://" : "smtp://") + settings_.server + ":" + settings_.port;

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::cerr << "❌ curl_easy_init falhou\n";
        return false;
    }

    UploadState payload{buildMessage(settings_, subject, body), 0};

    curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.user.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.pass.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (!settings_.useSsl) curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, settings_.user.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);

    struct curl_slist* recipients = curl_slist_append(nullptr, settings_.to.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);

    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readPayload);
    curl_easy_setopt(curl, CURLOPT_READDATA, &payload);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);

    CURLcode res = curl_easy_perform(curl);

    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "❌ Falha enviando email: " << curl_easy_strerror(res) << "\n";
        return false;
    }

    std::cout << "✉️  Email enviado para " << settings_.to << ".\n";
    return true;
}
