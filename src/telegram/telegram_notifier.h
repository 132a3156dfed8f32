#pragma once

#include <tgbot/tgbot.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "telegram/notification_sink.h"

namespace telegram {

// TelegramNotifier forwards operator messages to a single chat. notify()
// only enqueues; a dispatch thread performs the Bot API call so request
// handlers never wait on Telegram.
class TelegramNotifier : public NotificationSink {
public:
    using ChatId = std::int64_t;

    TelegramNotifier(const std::string& token, ChatId chatId);
    ~TelegramNotifier() override;

    TelegramNotifier(const TelegramNotifier&) = delete;
    TelegramNotifier& operator=(const TelegramNotifier&) = delete;

    void start();
    // Flushes whatever is already queued, then joins the dispatch thread.
    void stop();

    void notify(const std::string& text) override;

private:
    void dispatchLoop();

    TgBot::Bot bot_;
    ChatId chatId_;

    std::atomic<bool> running_{false};
    std::thread dispatchThread_;

    std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::queue<std::string> messageQueue_;
};

}  // namespace telegram
