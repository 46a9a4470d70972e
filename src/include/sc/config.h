#pragma once

#include <sc/issue.h>
#include <map>
#include <memory>
#include <string>

namespace sc {

// Process-wide settings. Published as an immutable snapshot so concurrent
// parses never observe a half-written config.
struct Config {
    // Consulted after the context error map.
    ErrorMap custom_error;
    // Locale maps by id; the bundles themselves live outside this library.
    std::map<std::string, ErrorMap> locales;
    std::string default_locale = "en";
};

std::shared_ptr<const Config> config();
void set_config(Config cfg);

// Install or replace the error map for a locale id.
void register_locale(const std::string& id, ErrorMap map);

// Restore the initial configuration (no custom map, no locales).
void reset_config();

// Trace output for the parse engine, enabled by the SC_PARSE_DEBUG
// environment variable.
bool debug_enabled();
void debug_log(const std::string& line);

}  // namespace sc
