// AtomArb - Collaborator Defaults

#include <atomarb/log.hpp>
#include <atomarb/providers.hpp>

namespace atomarb {

void LogNotifier::notify(const std::string& message) {
    ATOMARB_LOG_INFO("notify: " << message);
}

}  // namespace atomarb
