// server/access_policy.cpp
#include "access_policy.hpp"
#include "logger.hpp"

bool PermissionTableAccessPolicy::allowed(const Principal& principal, const std::string& device_id) {
    if (principal.user.empty()) {
        return false;
    }

    // The role in the request is the caller's claim; the users row decides.
    SqlResult user = db.execute("SELECT role FROM users WHERE email = $1", {principal.user});
    if (user.empty()) {
        Logger::debug("Access to " + device_id + " denied for unknown user " + principal.user);
        return false;
    }
    if (user.text(0, "role") == "admin") {
        return true;
    }

    SqlResult r = db.execute(
        "SELECT 1 FROM user_device_permissions p JOIN users u ON u.id = p.user_id "
        "WHERE u.email = $1 AND p.device_id = $2",
        {principal.user, device_id});
    if (r.empty()) {
        Logger::debug("Access to " + device_id + " denied for " + principal.user);
        return false;
    }
    return true;
}

std::unique_ptr<AccessPolicy> make_access_policy(bool enforce_permissions, SqlExecutor& executor) {
    if (enforce_permissions) {
        return std::make_unique<PermissionTableAccessPolicy>(executor);
    }
    return std::make_unique<OpenAccessPolicy>();
}
