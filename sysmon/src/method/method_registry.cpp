#include "method_registry.hpp"

namespace sysmon::methods {

void MethodRegistry::add(std::unique_ptr<MethodHandler> handler) {
    if (!handler) {
        return;
    }
    handlers_.emplace(handler->name(), std::move(handler));
}

MethodHandler* MethodRegistry::find(const std::string& method) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<const MethodHandler*> MethodRegistry::handlers() const {
    std::vector<const MethodHandler*> out;
    out.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        out.push_back(entry.second.get());
    }
    return out;
}

} // namespace sysmon::methods
