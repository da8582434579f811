#pragma once

#include "notifier.hpp"
#include <core/types.hpp>
#include <string>
#include <vector>
#include <curl/curl.h>

// Notifier over SMTP with STARTTLS, via libcurl. One connection is kept
// open between messages; a failed send reconnects and retries once.
class SmtpNotifier : public Notifier {
public:
    SmtpNotifier(SmtpConfig smtp, std::string from);
    ~SmtpNotifier() override;

    SmtpNotifier(const SmtpNotifier&) = delete;
    SmtpNotifier& operator=(const SmtpNotifier&) = delete;

    // Throws std::runtime_error if the retry fails too.
    void send(const std::string& to, const std::string& subject,
              const std::string& body) override;

    // RFC 5322 message text with CRLF line endings.
    static std::string format_message(const std::string& from, const std::string& to,
                                      const std::string& subject, const std::string& body);

    static std::vector<std::string> split_recipients(const std::string& to);

private:
    SmtpConfig smtp_;
    std::string from_;
    CURL* curl_ = nullptr;

    void connect();
    void disconnect();
    // Returns "" on success, the curl error otherwise.
    std::string try_send(const std::vector<std::string>& rcpts, const std::string& payload);
};
