#include "mailer.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <chrono>

Mailer::Mailer(Notifier& notifier, EmailConfig email, std::string hostname)
    : notifier_(notifier), email_(std::move(email)), hostname_(std::move(hostname)) {}

void Mailer::send(const Email& email) {
    std::string subject = fmt::format("AUTOCOPY ({}): {}", hostname_, email.subject);
    std::string body = email.body + "\nSent at " +
        format_local_time(std::chrono::system_clock::now(), "%X %x %Z") + "\n";

    try {
        notifier_.send(email_.to, subject, body);
    } catch (const std::exception& e) {
        autocopy_log(fmt::format("Failed to send email \"{}\": {}", subject, e.what()));
    }

    autocopy_log("v----------- begin email -----------v");
    autocopy_log(fmt::format("Subject: {}\nFrom: {}\nTo: {}\n\n{}",
                             subject, email_.from, email_.to, body));
    autocopy_log("^------------ end email ------------^");
}
