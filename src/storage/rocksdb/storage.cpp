#include <warden/common/critical.hpp>
#include <warden/storage/rocksdb/storage.hpp>

namespace warden::storage {

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
    warden::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<warden::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const warden::schema::bytes_view_t& key) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    warden::common::critical("Failed to get value from RocksDB");
  }
  return warden::schema::bytes_t(std::begin(value), std::end(value));
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = get_raw(warden::schema::make_bytes_view(detail::kCommittedHeightKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, warden::schema::hash32_t>>(
          warden::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value()) {
    warden::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(warden::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            warden::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      warden::common::critical("failed staging key in commit batch");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = batch.Put(
      std::string{detail::kCommittedHeightKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    warden::common::critical("failed staging committed height");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to write commit batch: {}", write_status.ToString());
    warden::common::critical("failed to commit block state");
  }
}

}  // namespace warden::storage
