// AtomArb - Telegram Notifier Implementation

#include <atomarb/adapters/telegram.hpp>
#include <atomarb/log.hpp>

namespace atomarb {

TelegramNotifier::TelegramNotifier(const std::string& api_base, const std::string& token,
                                   std::string chat_id, int timeout_ms)
    : http_(api_base + "/bot" + token, timeout_ms), chat_id_(std::move(chat_id)) {}

void TelegramNotifier::notify(const std::string& message) {
    try {
        auto reply = http_.post("/sendMessage", {{"chat_id", chat_id_}, {"text", message}});
        if (!reply.value("ok", false)) {
            ATOMARB_LOG_WARN("telegram rejected message: " << reply.value("description", reply.dump()));
        }
    } catch (const ProviderError& e) {
        ATOMARB_LOG_WARN("telegram unreachable (" << to_string(e.kind()) << "): " << e.what());
    }
}

}  // namespace atomarb
