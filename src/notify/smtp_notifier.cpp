#include "smtp_notifier.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

struct UploadState {
    const std::string* data;
    size_t offset;
};

size_t read_payload(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* state = static_cast<UploadState*>(userp);
    size_t room = size * nitems;
    size_t left = state->data->size() - state->offset;
    size_t n = left < room ? left : room;
    std::memcpy(buffer, state->data->data() + state->offset, n);
    state->offset += n;
    return n;
}

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // namespace

SmtpNotifier::SmtpNotifier(SmtpConfig smtp, std::string from)
    : smtp_(std::move(smtp)), from_(std::move(from)) {
    connect();
}

SmtpNotifier::~SmtpNotifier() {
    disconnect();
}

void SmtpNotifier::connect() {
    autocopy_log("Connecting to mail server...");
    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("Failed to create CURL easy handle for SMTP");

    std::string url = fmt::format("smtp://{}:{}", smtp_.server, smtp_.port);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, SMTP_TIMEOUT_SECS);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    if (!smtp_.username.empty() && !smtp_.token.empty()) {
        curl_easy_setopt(curl_, CURLOPT_USERNAME, smtp_.username.c_str());
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, smtp_.token.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_MAIL_FROM, ("<" + from_ + ">").c_str());
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, read_payload);
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
}

void SmtpNotifier::disconnect() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

std::vector<std::string> SmtpNotifier::split_recipients(const std::string& to) {
    std::vector<std::string> rcpts;
    std::istringstream ss(to);
    std::string addr;
    while (std::getline(ss, addr, ',')) {
        trim(addr);
        if (!addr.empty()) rcpts.push_back(addr);
    }
    return rcpts;
}

std::string SmtpNotifier::format_message(const std::string& from, const std::string& to,
                                         const std::string& subject, const std::string& body) {
    std::string msg;
    msg += "Date: " + format_local_time(std::chrono::system_clock::now(),
                                        "%a, %d %b %Y %H:%M:%S %z") + "\r\n";
    msg += "From: " + from + "\r\n";
    msg += "To: " + to + "\r\n";
    msg += "Subject: " + subject + "\r\n";
    msg += "MIME-Version: 1.0\r\n";
    msg += "Content-Type: text/plain; charset=\"us-ascii\"\r\n";
    msg += "\r\n";
    msg += replace_all(replace_all(body, "\r\n", "\n"), "\n", "\r\n");
    if (msg.size() < 2 || msg.compare(msg.size() - 2, 2, "\r\n") != 0) msg += "\r\n";
    return msg;
}

std::string SmtpNotifier::try_send(const std::vector<std::string>& rcpts,
                                   const std::string& payload) {
    if (!curl_) connect();

    curl_slist* list = nullptr;
    for (const auto& r : rcpts) list = curl_slist_append(list, ("<" + r + ">").c_str());
    std::unique_ptr<curl_slist, SlistDeleter> recipients(list);

    UploadState state{&payload, 0};
    curl_easy_setopt(curl_, CURLOPT_MAIL_RCPT, recipients.get());
    curl_easy_setopt(curl_, CURLOPT_READDATA, static_cast<void*>(&state));
    curl_easy_setopt(curl_, CURLOPT_INFILESIZE, static_cast<long>(payload.size()));

    CURLcode cc = curl_easy_perform(curl_);
    curl_easy_setopt(curl_, CURLOPT_MAIL_RCPT, static_cast<curl_slist*>(nullptr));
    return cc == CURLE_OK ? "" : curl_easy_strerror(cc);
}

void SmtpNotifier::send(const std::string& to, const std::string& subject,
                        const std::string& body) {
    auto rcpts = split_recipients(to);
    if (rcpts.empty()) {
        autocopy_log("No email recipients configured; not sending: " + subject);
        return;
    }
    std::string payload = format_message(from_, to, subject, body);

    std::string err = try_send(rcpts, payload);
    if (err.empty()) return;

    autocopy_log("Lost SMTP connection. Attempting to reconnect. (" + err + ")");
    disconnect();
    connect();
    err = try_send(rcpts, payload);
    if (!err.empty()) {
        throw std::runtime_error("SMTP send failed after reconnect: " + err);
    }
}
