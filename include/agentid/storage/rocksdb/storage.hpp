#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <agentid/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace agentid::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<agentid::schema::bytes_t> get(
      const agentid::schema::bytes_view_t& key) const;
  void put(const agentid::schema::bytes_view_t& key,
           const agentid::schema::bytes_view_t& value) const;
  void commit(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const agentid::schema::bytes_view_t& prefix,
      std::optional<agentid::schema::bytes_view_t> start_after =
          std::nullopt) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

}  // namespace agentid::storage
