/**
 * @file helper_registry.hpp
 * @brief Case-insensitive table of helper methods contributed by providers.
 */

#ifndef SPF_HELPER_REGISTRY_HPP
#define SPF_HELPER_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace spf {

/// Positional arguments passed to a helper method.
using HelperArgs = std::vector<nlohmann::json>;

/// Type-erased helper method.
using HelperFunction = std::function<nlohmann::json(const HelperArgs &)>;

/** \brief A named helper method exposed by a provider. */
struct HelperMethod {
  std::string name;        ///< Method name as exposed (original case)
  HelperFunction function; ///< Callable implementing the method
};

/**
 * \brief Capability descriptor listing every method a provider exposes.
 */
struct HelperProvider {
  std::string name;                 ///< Provider identifier
  std::vector<HelperMethod> methods; ///< Methods registered in bulk
};

/** \brief Registry entry resolved by a lookup. */
struct HelperEntry {
  std::string provider; ///< Provider that registered the method
  std::string method;   ///< Original-case method name
  HelperFunction function;
};

/**
 * Table mapping lower-cased method names to provider methods. Entries are
 * never removed.
 */
class HelperRegistry {
public:
  /**
   * @param reserved_names Native method names that helpers may not use.
   *        Compared case-insensitively.
   */
  explicit HelperRegistry(const std::vector<std::string> &reserved_names = {});

  HelperRegistry(const HelperRegistry &) = delete;
  HelperRegistry &operator=(const HelperRegistry &) = delete;

  /**
   * Register every method listed by @p provider.
   *
   * @throws ReservedNameCollision, DuplicateHelperCollision As for
   *         register_method(); methods listed before the failing one stay
   *         registered.
   */
  void register_provider(const HelperProvider &provider);

  /**
   * Register a single method under the lower-cased form of its name.
   *
   * Re-registering a name from the same provider replaces the entry.
   *
   * @throws ReservedNameCollision When the name matches a native method.
   * @throws DuplicateHelperCollision When another provider owns the name.
   */
  void register_method(const std::string &provider, const HelperMethod &method);

  /**
   * Case-insensitive lookup.
   *
   * @return The entry, or nullopt when @p method is not registered.
   */
  std::optional<HelperEntry> resolve(const std::string &method) const;

  /// Check whether @p method is reserved by the facade.
  bool is_reserved(const std::string &method) const;

  /// Snapshot of all entries ordered by lookup key.
  std::vector<HelperEntry> entries() const;

  /// Number of registered methods.
  std::size_t size() const;

private:
  std::unordered_set<std::string> reserved_;
  std::unordered_map<std::string, HelperEntry> helpers_;
  mutable std::mutex mutex_;
};

/// Lower-case ASCII copy of @p value, used for helper lookup keys.
std::string helper_key(const std::string &value);

} // namespace spf

#endif // SPF_HELPER_REGISTRY_HPP
