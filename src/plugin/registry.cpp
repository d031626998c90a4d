#include "plugin/registry.hpp"
#include "core/logger.hpp"
#include "plugin/deflate_algorithm.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace crush {

namespace {

std::mutex &registrar_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::vector<AlgorithmFactory> &registrar_factories() {
  static std::vector<AlgorithmFactory> factories;
  return factories;
}

} // namespace

std::vector<AlgorithmFactory> builtin_algorithm_factories() {
  return {make_deflate_algorithm, make_deflate_fast_algorithm};
}

AlgorithmRegistrar::AlgorithmRegistrar(AlgorithmFactory factory) {
  std::lock_guard<std::mutex> lock(registrar_mutex());
  registrar_factories().push_back(std::move(factory));
}

std::vector<AlgorithmFactory> AlgorithmRegistrar::registered() {
  std::lock_guard<std::mutex> lock(registrar_mutex());
  return registrar_factories();
}

std::string validate_metadata(const AlgorithmMetadata &meta) {
  if (meta.name.empty())
    return "algorithm name cannot be empty";
  if (meta.version.empty())
    return "algorithm '" + meta.name + "' has an empty version";
  if (meta.magic_number == MagicNumber{})
    return "algorithm '" + meta.name + "' has a zero magic number";
  if (!(meta.throughput_mbps > 0.0)) {
    std::ostringstream oss;
    oss << "algorithm '" << meta.name
        << "' has invalid throughput: " << meta.throughput_mbps;
    return oss.str();
  }
  if (!(meta.compression_ratio > 0.0 && meta.compression_ratio <= 1.0)) {
    std::ostringstream oss;
    oss << "algorithm '" << meta.name
        << "' has invalid compression ratio: " << meta.compression_ratio;
    return oss.str();
  }
  return {};
}

PluginRegistry::PluginRegistry(MagicNumber default_magic)
    : default_magic_(default_magic) {}

void PluginRegistry::init() {
  auto factories = builtin_algorithm_factories();
  auto linked = AlgorithmRegistrar::registered();
  factories.insert(factories.end(), linked.begin(), linked.end());
  init(factories);
}

void PluginRegistry::init(const std::vector<AlgorithmFactory> &factories) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
  warnings_.clear();

  for (const auto &factory : factories) {
    AlgorithmPtr algorithm;
    AlgorithmMetadata meta;
    try {
      algorithm = factory ? factory() : nullptr;
      if (algorithm)
        meta = algorithm->metadata();
    } catch (const std::exception &e) {
      std::string warning =
          std::string(algorithm ? "algorithm metadata() threw: "
                                : "algorithm factory threw: ") +
          e.what();
      LOG(LogLevel::ERROR, LogComponent::PLUGIN_REGISTRY, warning);
      warnings_.push_back(warning);
      continue;
    }
    if (!algorithm) {
      LOG(LogLevel::ERROR, LogComponent::PLUGIN_REGISTRY,
          "Algorithm factory returned no algorithm");
      warnings_.push_back("algorithm factory returned no algorithm");
      continue;
    }
    register_locked(std::move(algorithm), std::move(meta));
  }

  initialized_ = true;
  LOG(LogLevel::DEBUG, LogComponent::PLUGIN_REGISTRY,
      "Registry initialised with " << entries_.size() << " algorithm(s), "
                                   << warnings_.size() << " warning(s)");
}

void PluginRegistry::register_locked(AlgorithmPtr algorithm,
                                     AlgorithmMetadata meta) {
  std::string problem = validate_metadata(meta);
  if (!problem.empty()) {
    LOG(LogLevel::ERROR, LogComponent::PLUGIN_REGISTRY,
        "Skipping algorithm with invalid metadata: " << problem);
    warnings_.push_back("invalid metadata: " + problem);
    return;
  }

  auto existing = entries_.find(meta.magic_number);
  if (existing != entries_.end()) {
    std::string warning = "duplicate magic number " +
                          magic_to_string(meta.magic_number) + ": '" +
                          meta.name + "' conflicts with '" +
                          existing->second.metadata.name + "', keeping '" +
                          existing->second.metadata.name + "'";
    LOG(LogLevel::WARN, LogComponent::PLUGIN_REGISTRY, warning);
    warnings_.push_back(warning);
    return;
  }

  for (const auto &pair : entries_) {
    if (pair.second.metadata.name != meta.name)
      continue;
    std::string warning = "duplicate algorithm name '" + meta.name + "': " +
                          magic_to_string(meta.magic_number) +
                          " conflicts with " +
                          magic_to_string(pair.first) + ", keeping " +
                          magic_to_string(pair.first);
    LOG(LogLevel::WARN, LogComponent::PLUGIN_REGISTRY, warning);
    warnings_.push_back(warning);
    return;
  }

  LOG(LogLevel::TRACE, LogComponent::PLUGIN_REGISTRY,
      "Registered '" << meta.name << "' (" << magic_to_string(meta.magic_number)
                     << ")");
  entries_.emplace(meta.magic_number,
                   Entry{std::move(algorithm), std::move(meta)});
}

void PluginRegistry::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
  warnings_.clear();
  initialized_ = false;
}

bool PluginRegistry::initialized() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return initialized_;
}

size_t PluginRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

bool PluginRegistry::empty() const { return size() == 0; }

std::vector<PluginRegistry::Entry> PluginRegistry::entries() const {
  std::vector<Entry> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(entries_.size());
    for (const auto &pair : entries_)
      out.push_back(pair.second);
  }
  std::sort(out.begin(), out.end(), [](const Entry &a, const Entry &b) {
    return a.metadata.name < b.metadata.name;
  });
  return out;
}

std::vector<AlgorithmMetadata> PluginRegistry::list() const {
  std::vector<AlgorithmMetadata> out;
  for (auto &entry : entries())
    out.push_back(std::move(entry.metadata));
  return out;
}

AlgorithmPtr PluginRegistry::lookup(const MagicNumber &magic) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(magic);
  return it == entries_.end() ? nullptr : it->second.algorithm;
}

AlgorithmPtr PluginRegistry::find_by_name(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto &pair : entries_) {
    if (pair.second.metadata.name == name)
      return pair.second.algorithm;
  }
  return nullptr;
}

AlgorithmPtr PluginRegistry::default_algorithm() const {
  return lookup(default_magic_);
}

std::vector<std::string> PluginRegistry::warnings() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return warnings_;
}

PluginRegistry &global_registry() {
  static PluginRegistry registry;
  return registry;
}

void init_plugins() { global_registry().init(); }

std::vector<AlgorithmMetadata> list_plugins() {
  return global_registry().list();
}

} // namespace crush
