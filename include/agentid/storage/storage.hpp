#pragma once
#include <agentid/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace agentid::storage {

using key_value_entry_t =
    std::pair<agentid::schema::bytes_t, agentid::schema::bytes_t>;

/// Raised when the backend fails a read or a write. Callers at the
/// operation boundary translate it into an internal error.
struct storage_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Group of puts and deletes applied atomically by commit().
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<agentid::schema::bytes_t> deletes;

  write_batch& put(agentid::schema::bytes_t key,
                   agentid::schema::bytes_t value) {
    puts.emplace_back(std::move(key), std::move(value));
    return *this;
  }

  write_batch& remove(agentid::schema::bytes_t key) {
    deletes.push_back(std::move(key));
    return *this;
  }

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Return the raw value at key, or std::nullopt when missing.
  std::optional<agentid::schema::bytes_t> get(
      const agentid::schema::bytes_view_t& key) const;

  /// Persist value at key.
  void put(const agentid::schema::bytes_view_t& key,
           const agentid::schema::bytes_view_t& value) const;

  /// Apply all puts then all deletes of the batch atomically.
  void commit(const write_batch& batch) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order, starting after `start_after` when given.
  std::vector<key_value_entry_t> list_by_prefix(
      const agentid::schema::bytes_view_t& prefix,
      std::optional<agentid::schema::bytes_view_t> start_after =
          std::nullopt) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace agentid::storage
