#ifndef RESTORE_RECONSTRUCT_WARNINGS_H
#define RESTORE_RECONSTRUCT_WARNINGS_H

#include <string>
#include <string_view>
#include <vector>

namespace restore {

// Append-only, ordered list of human-readable fidelity notes for one call.
class WarningCollector {
public:
    void add(std::string message);

    // "<name>": <detail>, with `fallback` standing in for an empty name.
    void addForNode(std::string_view name, std::string_view fallback, std::string_view detail);

    const std::vector<std::string>& messages() const { return messages_; }
    std::size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

    std::vector<std::string> take() { return std::move(messages_); }

private:
    std::vector<std::string> messages_;
};

// Quoted display name used as the prefix of node warnings.
std::string quotedName(std::string_view name, std::string_view fallback);

} // namespace restore

#endif // RESTORE_RECONSTRUCT_WARNINGS_H
