#include <agentid/common/critical.hpp>
#include <agentid/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace agentid::storage {

namespace {

ROCKSDB_NAMESPACE::Slice to_slice(const agentid::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

agentid::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

void require_database(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    throw storage_error{"RocksDB database is not initialized"};
  }
}

}  // namespace

std::optional<agentid::schema::bytes_t> storage<rocksdb_storage_tag>::get(
    const agentid::schema::bytes_view_t& key) const {
  require_database(database);
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{"failed to get value from RocksDB"};
  }
  return agentid::schema::bytes_t{std::begin(value), std::end(value)};
}

void storage<rocksdb_storage_tag>::put(
    const agentid::schema::bytes_view_t& key,
    const agentid::schema::bytes_view_t& value) const {
  require_database(database);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, to_slice(key),
                              to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    throw storage_error{"failed to put value into RocksDB"};
  }
}

void storage<rocksdb_storage_tag>::commit(const write_batch& batch) const {
  require_database(database);
  if (batch.empty()) {
    return;
  }
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.puts) {
    auto status = rocks_batch.Put(
        to_slice(agentid::schema::make_bytes_view(key)),
        to_slice(agentid::schema::make_bytes_view(value)));
    if (!status.ok()) {
      throw storage_error{"failed to stage RocksDB put"};
    }
  }
  for (const auto& key : batch.deletes) {
    auto status =
        rocks_batch.Delete(to_slice(agentid::schema::make_bytes_view(key)));
    if (!status.ok()) {
      throw storage_error{"failed to stage RocksDB delete"};
    }
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    throw storage_error{"failed to commit RocksDB batch"};
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const agentid::schema::bytes_view_t& prefix,
    std::optional<agentid::schema::bytes_view_t> start_after) const {
  require_database(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = agentid::schema::make_string_view(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  if (start_after) {
    iterator->Seek(to_slice(*start_after));
    if (iterator->Valid() &&
        iterator->key().compare(to_slice(*start_after)) == 0) {
      iterator->Next();
    }
  } else {
    iterator->Seek(to_slice(prefix));
  }
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    throw storage_error{"failed to iterate RocksDB"};
  }
  return entries;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    agentid::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace agentid::storage
