#include "telegram/telegram_notifier.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/logging.h"

namespace telegram {

TelegramNotifier::TelegramNotifier(const std::string& token, ChatId chatId)
    : bot_(token), chatId_(chatId) {
    if (token.empty()) {
        throw std::invalid_argument("Telegram bot token is required");
    }
}

TelegramNotifier::~TelegramNotifier() {
    stop();
}

void TelegramNotifier::start() {
    if (running_.exchange(true)) {
        return;
    }
    dispatchThread_ = std::thread(&TelegramNotifier::dispatchLoop, this);
}

void TelegramNotifier::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queueCondition_.notify_all();

    if (dispatchThread_.joinable()) {
        dispatchThread_.join();
    }
}

void TelegramNotifier::notify(const std::string& text) {
    if (!running_.load()) {
        LOG_WARN("Telegram notifier is not running; dropping message: " + text);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        messageQueue_.push(text);
    }
    queueCondition_.notify_one();
}

void TelegramNotifier::dispatchLoop() {
    while (true) {
        std::string text;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this]() {
                return !messageQueue_.empty() || !running_.load();
            });

            if (messageQueue_.empty()) {
                break;
            }

            text = std::move(messageQueue_.front());
            messageQueue_.pop();
        }

        try {
            bot_.getApi().sendMessage(chatId_, text);
        } catch (const std::exception& ex) {
            LOG_WARN(std::string("Failed to send Telegram message: ") + ex.what());
        }
    }
}

}  // namespace telegram
