#include "guard/listen_key_manager.hpp"

#include "guard/log.hpp"

#include <exception>

namespace guard {
namespace {

constexpr const char* kTag = "OCO";

} // namespace

ListenKeyManager::ListenKeyManager(ExchangeGateway& gateway)
    : gateway_(gateway) {}

std::string ListenKeyManager::acquire() {
    auto key = gateway_.create_listen_key();
    log_debug(kTag, "listen key acquired");
    return key;
}

bool ListenKeyManager::renew(const std::string& listen_key) {
    try {
        gateway_.keepalive_listen_key(listen_key);
        log_debug(kTag, "listen key renewed");
        return true;
    } catch (const std::exception& ex) {
        log_warn(kTag, "keepalive: ", ex.what());
        return false;
    }
}

void ListenKeyManager::release(const std::string& listen_key) noexcept {
    if (listen_key.empty()) {
        return;
    }
    try {
        gateway_.close_listen_key(listen_key);
        log_debug(kTag, "listen key released");
    } catch (const std::exception& ex) {
        log_debug(kTag, "listen key release ignored: ", ex.what());
    }
}

} // namespace guard
