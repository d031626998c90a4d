#ifndef CRUSH_REGISTRY_HPP
#define CRUSH_REGISTRY_HPP

#include "plugin/algorithm.hpp"

#include <functional>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace crush {

// Magic number of the process default ("deflate") algorithm.
constexpr MagicNumber DEFAULT_ALGORITHM_MAGIC = {MAGIC_PREFIX_0, MAGIC_PREFIX_1,
                                                 FORMAT_VERSION, 0x00};

using AlgorithmFactory = std::function<AlgorithmPtr()>;

// Algorithms compiled into the crush library.
std::vector<AlgorithmFactory> builtin_algorithm_factories();

// Links an extra algorithm into every PluginRegistry::init() call:
//
//   static crush::AlgorithmRegistrar reg([] { return make_my_algorithm(); });
//
// Registration only records the factory; nothing is constructed until init().
class AlgorithmRegistrar {
public:
  explicit AlgorithmRegistrar(AlgorithmFactory factory);

  static std::vector<AlgorithmFactory> registered();
};

// Magic number -> algorithm map. Reads take a shared lock, init() takes an
// exclusive one. Besides the process-wide instance behind init_plugins(),
// isolated instances can be built from an explicit factory list.
class PluginRegistry {
public:
  struct Entry {
    AlgorithmPtr algorithm;
    AlgorithmMetadata metadata;
  };

  explicit PluginRegistry(MagicNumber default_magic = DEFAULT_ALGORITHM_MAGIC);

  PluginRegistry(const PluginRegistry &) = delete;
  PluginRegistry &operator=(const PluginRegistry &) = delete;

  // Clears and rebuilds from the built-in and registrar-linked algorithms.
  void init();

  // Clears and rebuilds from `factories`, in order. Invalid metadata is
  // skipped and a duplicate magic number or name keeps the first entry; all
  // of these are logged and recorded in warnings(), as are factories or
  // metadata() calls that throw.
  void init(const std::vector<AlgorithmFactory> &factories);

  void clear();

  bool initialized() const;
  size_t size() const;
  bool empty() const;

  // Snapshot ordered by name.
  std::vector<AlgorithmMetadata> list() const;
  std::vector<Entry> entries() const;

  AlgorithmPtr lookup(const MagicNumber &magic) const;
  AlgorithmPtr find_by_name(const std::string &name) const;

  // Fallback target for the timeout supervisor. Null if not registered.
  AlgorithmPtr default_algorithm() const;
  const MagicNumber &default_magic() const { return default_magic_; }

  std::vector<std::string> warnings() const;

private:
  void register_locked(AlgorithmPtr algorithm, AlgorithmMetadata meta);

  const MagicNumber default_magic_;
  mutable std::shared_mutex mutex_;
  std::map<MagicNumber, Entry> entries_;
  std::vector<std::string> warnings_;
  bool initialized_ = false;
};

// Returns an empty string if `meta` is acceptable, else the reason.
std::string validate_metadata(const AlgorithmMetadata &meta);

// Process-wide registry.
PluginRegistry &global_registry();

// Must be called before the first operation on the global registry. Safe to
// call again to re-scan.
void init_plugins();

std::vector<AlgorithmMetadata> list_plugins();

} // namespace crush

#endif // CRUSH_REGISTRY_HPP
