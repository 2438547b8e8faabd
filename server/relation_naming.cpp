// server/relation_naming.cpp
#include "relation_naming.hpp"
#include "../common/errors.hpp"
#include <cstring>

std::string relation_name(const std::string& device_id) {
    std::string name = kRelationPrefix;
    name.reserve(name.size() + device_id.size());
    for (char c : device_id) {
        if (c >= 'A' && c <= 'Z') {
            name += static_cast<char>(c - 'A' + 'a');
        } else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_') {
            name += c;
        } else {
            name += '_';
        }
    }
    return name;
}

void validate_device_id(const std::string& device_id) {
    if (device_id.empty()) {
        throw ValidationError("Device identifier must not be empty");
    }
    // One output character per input byte, so the length is known up front
    if (std::strlen(kRelationPrefix) + device_id.size() > kMaxRelationNameLength) {
        throw ValidationError("Device identifier '" + device_id + "' is too long (max " +
                              std::to_string(kMaxRelationNameLength - std::strlen(kRelationPrefix)) +
                              " characters)");
    }
}

std::optional<std::string> find_collision(const std::string& device_id,
                                          const std::vector<std::string>& known_ids) {
    const std::string target = relation_name(device_id);
    for (const auto& other : known_ids) {
        if (other != device_id && relation_name(other) == target) {
            return other;
        }
    }
    return std::nullopt;
}

bool is_device_relation(const std::string& table_name) {
    const size_t prefix_len = std::strlen(kRelationPrefix);
    return table_name.size() > prefix_len && table_name.compare(0, prefix_len, kRelationPrefix) == 0;
}
