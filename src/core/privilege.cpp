#include "privilege.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

PrivilegePolicy parse_privilege_policy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "skip") return PrivilegePolicy::Skip;
    if (lower == "nopasswd") return PrivilegePolicy::NoPasswd;
    throw ConfigurationError("Unknown sudo policy '" + name + "' (expected skip or nopasswd)");
}

std::string to_string(PrivilegePolicy policy) {
    switch (policy) {
        case PrivilegePolicy::Skip:     return "skip";
        case PrivilegePolicy::NoPasswd: return "nopasswd";
    }
    return "skip";
}

bool check_privilege_policy(bool requires_privilege, PrivilegePolicy policy) {
    if (!requires_privilege) return true;
    return policy == PrivilegePolicy::NoPasswd;
}
