// server/relation_naming.hpp
#pragma once
#include <optional>
#include <string>
#include <vector>

constexpr const char* kRelationPrefix = "device_";

// PostgreSQL truncates identifiers at 63 bytes; the longest derived
// index name appends "_timestamp_idx" (14 bytes).
constexpr size_t kMaxRelationNameLength = 63 - 14;

// device_<id>, with every character outside [A-Za-z0-9_] replaced by '_'
// and ASCII letters lower-cased the way PostgreSQL folds unquoted names.
std::string relation_name(const std::string& device_id);

// Throws ValidationError for an empty id or one whose relation name is too long.
void validate_device_id(const std::string& device_id);

// First identifier in `known_ids` that differs from `device_id` but maps
// to the same relation name.
std::optional<std::string> find_collision(const std::string& device_id,
                                          const std::vector<std::string>& known_ids);

bool is_device_relation(const std::string& table_name);
