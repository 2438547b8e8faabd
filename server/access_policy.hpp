// server/access_policy.hpp
#pragma once
#include "database.hpp"
#include "../common/protocol.hpp"
#include <memory>
#include <string>

class AccessPolicy {
public:
    virtual ~AccessPolicy() = default;
    virtual bool allowed(const Principal& principal, const std::string& device_id) = 0;
};

class OpenAccessPolicy : public AccessPolicy {
public:
    bool allowed(const Principal&, const std::string&) override { return true; }
};

// Users whose stored role is "admin" see every device; other users need a
// row in user_device_permissions. The principal's user name is users.email
// and its role field is not consulted.
class PermissionTableAccessPolicy : public AccessPolicy {
private:
    SqlExecutor& db;

public:
    explicit PermissionTableAccessPolicy(SqlExecutor& executor) : db(executor) {}
    bool allowed(const Principal& principal, const std::string& device_id) override;
};

std::unique_ptr<AccessPolicy> make_access_policy(bool enforce_permissions, SqlExecutor& executor);
