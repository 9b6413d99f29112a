#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "update_capability.hpp"

// Name → constructor registry for UpdateCapability implementations.
// Registration is explicit; the built-in providers are registered the
// first time the registry is touched.
class ProviderFactory {
public:
    using Maker = std::function<std::unique_ptr<UpdateCapability>()>;

    // Throws ConfigurationError for an unknown name.
    static std::unique_ptr<UpdateCapability> create(const std::string& name);

    static void register_provider(const std::string& name, Maker maker);
    static bool has_provider(const std::string& name);

    // Static info for every registered provider, ordered by name.
    static std::map<std::string, ProviderInfo> registry();

private:
    static std::map<std::string, Maker>& makers();
    static std::mutex& registry_mutex();
};
