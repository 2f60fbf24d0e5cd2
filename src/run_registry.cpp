#include "run_registry.hpp"

void RunRegistry::store(const std::string& name, BatchEntry entry) {
    std::lock_guard<std::mutex> lock(data_mutex);
    entries[name] = std::move(entry);
}

std::optional<BatchEntry> RunRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(data_mutex);
    auto it = entries.find(name);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RunRegistry::names() const {
    std::lock_guard<std::mutex> lock(data_mutex);
    std::vector<std::string> result;
    for (const auto& kv : entries) {
        result.push_back(kv.first);
    }
    return result;
}

std::size_t RunRegistry::size() const {
    std::lock_guard<std::mutex> lock(data_mutex);
    return entries.size();
}
