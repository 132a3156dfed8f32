#pragma once

#include <string>

#include "common/logging.h"

namespace telegram {

// Best-effort operator channel. Implementations must not throw: delivery
// problems are theirs to log and drop.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void notify(const std::string& text) = 0;
};

// Used when no Telegram credentials are configured.
class LogNotifier : public NotificationSink {
public:
    void notify(const std::string& text) override { LOG_DEBUG("Notification (not delivered): " + text); }
};

}  // namespace telegram
