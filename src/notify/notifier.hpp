#pragma once

#include <string>

// Delivers one message to a comma-separated recipient list.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void send(const std::string& to, const std::string& subject,
                      const std::string& body) = 0;
};

// --no_email: messages are only logged.
class LogNotifier : public Notifier {
public:
    void send(const std::string& to, const std::string& subject,
              const std::string& body) override;
};
