#include "provider_factory.hpp"
#include "apt.hpp"
#include "dnf.hpp"
#include "freebsd_pkg.hpp"
#include "openbsd_pkg.hpp"
#include <core/errors.hpp>

std::mutex& ProviderFactory::registry_mutex() {
    static std::mutex m;
    return m;
}

std::map<std::string, ProviderFactory::Maker>& ProviderFactory::makers() {
    static std::map<std::string, Maker> table = {
        {"apt",     [] { return std::make_unique<AptProvider>(); }},
        {"dnf",     [] { return std::make_unique<DnfProvider>(DnfProvider::Flavor::Dnf); }},
        {"yum",     [] { return std::make_unique<DnfProvider>(DnfProvider::Flavor::Yum); }},
        {"pkg",     [] { return std::make_unique<FreeBSDPkgProvider>(); }},
        {"pkg_add", [] { return std::make_unique<OpenBSDPkgProvider>(); }},
    };
    return table;
}

std::unique_ptr<UpdateCapability> ProviderFactory::create(const std::string& name) {
    Maker maker;
    {
        std::lock_guard<std::mutex> lock(registry_mutex());
        auto it = makers().find(name);
        if (it == makers().end()) {
            throw ConfigurationError("Unsupported package manager: " + name);
        }
        maker = it->second;
    }
    return maker();
}

void ProviderFactory::register_provider(const std::string& name, Maker maker) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    makers()[name] = std::move(maker);
}

bool ProviderFactory::has_provider(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return makers().count(name) > 0;
}

std::map<std::string, ProviderInfo> ProviderFactory::registry() {
    std::map<std::string, Maker> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_mutex());
        snapshot = makers();
    }

    std::map<std::string, ProviderInfo> infos;
    for (const auto& [name, maker] : snapshot) {
        infos[name] = maker()->info();
    }
    return infos;
}
