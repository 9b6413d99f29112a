#include "fleet.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

Fleet::Fleet(const FleetOptions& options, const std::vector<HostConfig>& hosts,
             ConnectionFactory connection_factory, CapabilityFactory capability_factory)
    : options_(options) {
    hosts_.reserve(hosts.size());
    for (const auto& hc : hosts) {
        hosts_.push_back(std::make_unique<HostRecord>(hc, options_, connection_factory,
                                                      capability_factory));
    }
    fleet_log_debug(fmt::format("fleet: loaded {} hosts", hosts_.size()));
}

HostRecord* Fleet::find(const std::string& name) {
    for (auto& h : hosts_) {
        if (h->name() == name) return h.get();
    }
    return nullptr;
}

std::vector<HostRecord*> Fleet::all() {
    std::vector<HostRecord*> out;
    out.reserve(hosts_.size());
    for (auto& h : hosts_) out.push_back(h.get());
    return out;
}

std::vector<HostRecord*> Fleet::select(const std::vector<std::string>& names) {
    if (names.empty()) return all();

    std::vector<HostRecord*> out;
    std::vector<std::string> unknown;
    for (const auto& name : names) {
        auto* h = find(name);
        if (h) {
            // A host runs at most once per selection; keep the first mention.
            if (std::find(out.begin(), out.end(), h) == out.end()) out.push_back(h);
        } else {
            unknown.push_back(name);
        }
    }

    if (!unknown.empty()) {
        std::string list;
        for (const auto& n : unknown) {
            if (!list.empty()) list += ", ";
            list += n;
        }
        throw ConfigurationError(fmt::format("Unknown host(s): {}", list));
    }
    return out;
}

std::vector<RemoteSession*> Fleet::sessions() {
    std::vector<RemoteSession*> out;
    out.reserve(hosts_.size());
    for (auto& h : hosts_) out.push_back(&h->session());
    return out;
}

void Fleet::close_all() {
    for (auto& h : hosts_) h->close(true);
}
