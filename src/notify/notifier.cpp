#include "notifier.hpp"
#include <core/log.hpp>

void LogNotifier::send(const std::string& to, const std::string& subject, const std::string&) {
    autocopy_log("email to " + to + " suppressed because --no_email is set: " + subject);
}
