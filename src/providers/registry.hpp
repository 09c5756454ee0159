#pragma once

#include "providers/provider.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gateway {

struct ResolvedModel {
  IProvider* provider = nullptr;
  std::string provider_name;
  std::string model;
};

// Model backends by name. Filled at startup, read-only afterwards.
class ProviderRegistry {
 public:
  explicit ProviderRegistry(std::string default_provider) : default_provider_(std::move(default_provider)) {}

  void Register(std::unique_ptr<IProvider> provider) {
    if (!provider) return;
    auto name = provider->Name();
    backends_[std::move(name)] = std::move(provider);
  }

  IProvider* Get(const std::string& name) const {
    auto it = backends_.find(name);
    return it == backends_.end() ? nullptr : it->second.get();
  }

  const std::string& default_provider() const { return default_provider_; }

  // Sorted.
  std::vector<std::string> Names() const {
    std::vector<std::string> out;
    for (const auto& entry : backends_) out.push_back(entry.first);
    return out;
  }

  // "provider:model" picks a backend explicitly, anything else goes to the
  // default backend. Model tags such as "llama3:8b" pass through untouched
  // because only registered names count as a prefix.
  std::optional<ResolvedModel> Resolve(const std::string& model_name, std::string* err) const {
    ResolvedModel r;
    r.provider_name = default_provider_;
    r.model = model_name;
    const auto colon = model_name.find(':');
    if (colon != std::string::npos && Get(model_name.substr(0, colon)) != nullptr) {
      r.provider_name = model_name.substr(0, colon);
      r.model = model_name.substr(colon + 1);
    }
    r.provider = Get(r.provider_name);
    if (!r.provider) {
      if (err) {
        *err = "unknown provider: " + r.provider_name + " (available:";
        for (const auto& name : Names()) *err += " " + name;
        *err += ")";
      }
      return std::nullopt;
    }
    return r;
  }

 private:
  std::string default_provider_;
  std::map<std::string, std::unique_ptr<IProvider>> backends_;
};

}  // namespace gateway
