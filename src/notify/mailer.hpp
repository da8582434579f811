#pragma once

#include "notifier.hpp"
#include <core/types.hpp>
#include <string>

struct Email {
    std::string subject;
    std::string body;
};

// Front end for every operator message. Adds the host prefix and the
// "Sent at" footer, copies the message into the log and never throws.
class Mailer {
public:
    Mailer(Notifier& notifier, EmailConfig email, std::string hostname);

    void send(const Email& email);

    const std::string& hostname() const { return hostname_; }

private:
    Notifier& notifier_;
    EmailConfig email_;
    std::string hostname_;
};
