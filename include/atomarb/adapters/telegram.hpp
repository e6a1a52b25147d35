// AtomArb - Telegram Notifier
// Posts event strings to a chat through the Bot API sendMessage method

#pragma once

#include <atomarb/adapters/http.hpp>
#include <atomarb/providers.hpp>
#include <string>

namespace atomarb {

class TelegramNotifier : public Notifier {
public:
    TelegramNotifier(const std::string& api_base, const std::string& token, std::string chat_id,
                     int timeout_ms);

    // Delivery failures are logged and dropped
    void notify(const std::string& message) override;

private:
    HttpClient http_;
    std::string chat_id_;
};

}  // namespace atomarb
