#include <sc/config.h>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace sc {

namespace {
    std::mutex& config_mutex() {
        static std::mutex m;
        return m;
    }

    std::shared_ptr<const Config>& current() {
        static std::shared_ptr<const Config> cfg = std::make_shared<const Config>();
        return cfg;
    }
}  // namespace

std::shared_ptr<const Config> config() {
    std::lock_guard<std::mutex> lock(config_mutex());
    return current();
}

void set_config(Config cfg) {
    auto next = std::make_shared<const Config>(std::move(cfg));
    std::lock_guard<std::mutex> lock(config_mutex());
    current() = std::move(next);
}

void register_locale(const std::string& id, ErrorMap map) {
    std::lock_guard<std::mutex> lock(config_mutex());
    Config next = *current();
    next.locales[id] = std::move(map);
    current() = std::make_shared<const Config>(std::move(next));
}

void reset_config() { set_config(Config{}); }

bool debug_enabled() {
    static const bool enabled = std::getenv("SC_PARSE_DEBUG") != nullptr;
    return enabled;
}

void debug_log(const std::string& line) {
    if (!debug_enabled()) return;
    std::cerr << "sc: " << line << "\n";
}

}  // namespace sc
