#pragma once

#include "method_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sysmon::methods {

class MethodRegistry {
public:
    void add(std::unique_ptr<MethodHandler> handler);
    MethodHandler* find(const std::string& method) const;
    std::vector<const MethodHandler*> handlers() const;

private:
    std::unordered_map<std::string, std::unique_ptr<MethodHandler>> handlers_;
};

void register_handshake_methods(MethodRegistry& registry);
void register_monitor_methods(MethodRegistry& registry);

} // namespace sysmon::methods
