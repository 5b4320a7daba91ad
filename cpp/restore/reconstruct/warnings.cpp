#include "restore/reconstruct/warnings.h"
#include "restore/core/logging.h"

namespace restore {

std::string quotedName(std::string_view name, std::string_view fallback) {
    std::string out;
    out.reserve(name.size() + fallback.size() + 2);
    out += '"';
    out.append(name.empty() ? fallback : name);
    out += '"';
    return out;
}

void WarningCollector::add(std::string message) {
    RESTORE_LOG_WARN("%s", message.c_str());
    messages_.push_back(std::move(message));
}

void WarningCollector::addForNode(std::string_view name, std::string_view fallback, std::string_view detail) {
    std::string message = quotedName(name, fallback);
    message += ": ";
    message.append(detail);
    add(std::move(message));
}

} // namespace restore
