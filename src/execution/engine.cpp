#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <iterator>
#include <provenance/blake3/hash.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/execution/engine.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/schema/query_error_code.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/storage/session.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace provenance::schema;

namespace {

using encoder_t = provenance::schema::encoding::scale_encoder_t;

constexpr auto kExecuteCodespace = std::string_view{"provenance.execute"};
constexpr auto kCheckCodespace = std::string_view{"provenance.check"};
constexpr auto kQueryCodespace = std::string_view{"provenance.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_view_t& tx,
                         const uint64_t call_index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 8);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(call_index);
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return provenance::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto encoder = encoder_t{};
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx) {
      error = "malformed SCALE envelope";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

transaction_result_t make_envelope_error(const transaction_error_code code,
                                         std::string log,
                                         std::string info,
                                         const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{[](const assign_role_t&) { return std::string_view{"assign_role"}; },
                 [](const create_batch_t&) { return std::string_view{"create_batch"}; },
                 [](const approve_batch_t&) { return std::string_view{"approve_batch"}; },
                 [](const certify_batch_t&) { return std::string_view{"certify_batch"}; }},
      payload);
}

template <typename T>
provenance::execution::result_t<uint64_t> widen(
    provenance::execution::result_t<T> result) {
  if (auto* rejected = std::get_if<provenance::execution::failure>(&result)) {
    return std::move(*rejected);
  }
  return static_cast<uint64_t>(std::get<T>(result));
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const uint64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace provenance::execution {

template <typename Library>
engine<Library>::engine(encoder_t& encoder,
                        provenance::storage::storage<Library>& storage,
                        const account_id_t& administrator)
    : encoder_{encoder},
      storage_{storage},
      administrator_{administrator},
      application_{derive_application_account(administrator)},
      audit_{},
      roles_{administrator_, audit_},
      vendors_{},
      assets_{},
      minter_{assets_, application_},
      batches_{roles_, vendors_, minter_, audit_} {
  load_persisted_state();
  spdlog::info("Execution engine ready after {} committed call(s)",
               committed_calls_);
  spdlog::info("Administrator {}", to_hex(administrator_));
}

template <typename Library>
account_id_t engine<Library>::derive_application_account(
    const account_id_t& administrator) {
  auto material = make_bytes(std::string_view{"provenance|application|"});
  material.insert(std::end(material), std::begin(administrator),
                  std::end(administrator));
  return provenance::blake3::hash(make_bytes_view(material));
}

template <typename Library>
transaction_result_t engine<Library>::check_transaction(
    const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_envelope_error(transaction_error_code::invalid_transaction,
                               "invalid transaction", decode_error,
                               kCheckCodespace);
  }
  if (maybe_tx->version != 1) {
    return make_envelope_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1",
        kCheckCodespace);
  }
  auto result = transaction_result_t{};
  result.info = std::string{payload_name(maybe_tx->payload)};
  return result;
}

template <typename Library>
transaction_result_t engine<Library>::execute(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    spdlog::warn("Rejected undecodable transaction: {}", decode_error);
    return make_envelope_error(transaction_error_code::invalid_transaction,
                               "invalid transaction", decode_error,
                               kExecuteCodespace);
  }
  if (maybe_tx->version != 1) {
    spdlog::warn("Rejected transaction version {}", maybe_tx->version);
    return make_envelope_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1",
        kExecuteCodespace);
  }
  return execute_locked(raw_tx, *maybe_tx);
}

template <typename Library>
transaction_result_t engine<Library>::execute(const transaction_t& tx) {
  auto raw_tx = encoder_.encode(tx);
  return execute(make_bytes_view(raw_tx));
}

template <typename Library>
transaction_result_t engine<Library>::execute_locked(const bytes_view_t& raw_tx,
                                                     const transaction_t& tx) {
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  auto frame = call_frame<Library>{.session = session,
                                   .caller = tx.sender,
                                   .call_index = committed_calls_ + 1};
  auto name = payload_name(tx.payload);

  auto outcome = execute_operation(frame, tx);
  if (auto* rejected = std::get_if<failure>(&outcome)) {
    spdlog::info("{} from {} rejected ({}): {}", name, to_hex(tx.sender),
                 static_cast<uint32_t>(rejected->code), rejected->message);
    return make_envelope_error(rejected->code, rejected->message,
                               std::string{name}, kExecuteCodespace);
  }

  auto next_root = fold_state_root(state_root_, raw_tx, frame.call_index);
  auto committed_key = make_bytes(key::kCommittedStateKey);
  session.put(make_bytes_view(committed_key),
              provenance::storage::committed_state{
                  .calls = frame.call_index, .state_root = next_root});
  session.commit();
  committed_calls_ = frame.call_index;
  state_root_ = next_root;

  auto result = transaction_result_t{};
  result.data = encoder_.encode(std::get<uint64_t>(outcome));
  result.info = std::string{name};
  result.events = std::move(frame.events);
  spdlog::debug("Committed call {} ({}), state root {}", committed_calls_,
                name, to_hex(state_root_));
  return result;
}

template <typename Library>
result_t<uint64_t> engine<Library>::execute_operation(
    call_frame<Library>& frame,
    const transaction_t& tx) {
  return std::visit(
      overloaded{
          [&](const assign_role_t& operation) {
            return widen(
                roles_.assign_role(frame, operation.account, operation.role));
          },
          [&](const create_batch_t& operation) {
            return widen(batches_.create_batch(
                frame, make_bytes_view(operation.batch_id)));
          },
          [&](const approve_batch_t& operation) {
            return widen(batches_.approve_batch(
                frame, make_bytes_view(operation.batch_id)));
          },
          [&](const certify_batch_t& operation) {
            return widen(batches_.certify_batch(
                frame, make_bytes_view(operation.batch_id)));
          }},
      tx.payload);
}

template <typename Library>
role_id_t engine<Library>::get_role(const account_id_t& account) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  return roles_.get_role(session, account);
}

template <typename Library>
batch_status_t engine<Library>::get_batch_status(const bytes_view_t& batch_id) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  return batches_.get_batch_status(session, batch_id);
}

template <typename Library>
asset_id_t engine<Library>::get_batch_asset(const bytes_view_t& batch_id) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  return batches_.get_batch_asset(session, batch_id);
}

template <typename Library>
std::optional<certificate_asset_t> engine<Library>::get_certificate(
    const bytes_view_t& batch_id) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  return assets_.find(session, batches_.get_batch_asset(session, batch_id));
}

template <typename Library>
std::vector<batch_id_t> engine<Library>::get_vendor_batches(
    const account_id_t& vendor) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  return vendors_.get_vendor_batches(session, vendor);
}

template <typename Library>
std::vector<audit_event_record_t> engine<Library>::events(const uint64_t from_id,
                                                          const uint64_t to_id) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};
  return audit_.range(session, from_id, to_id);
}

template <typename Library>
app_info_t engine<Library>::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.committed_calls = committed_calls_;
  result.state_root = state_root_;
  result.administrator = administrator_;
  result.application = application_;
  return result;
}

template <typename Library>
query_result_t engine<Library>::query(const std::string_view path,
                                      const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto session = provenance::storage::session<Library>{encoder_, storage_};

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = committed_calls_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/role") {
    auto account = try_make_hash32(data);
    if (!account) {
      return make_query_error(query_error_code::invalid_key,
                              "account must be 32 bytes", data,
                              committed_calls_);
    }
    result.value = encoder_.encode(roles_.get_role(session, *account));
    return result;
  }
  if (path == "/batch/status") {
    result.value = encoder_.encode(batches_.get_batch_status(session, data));
    return result;
  }
  if (path == "/batch/asset") {
    result.value = encoder_.encode(batches_.get_batch_asset(session, data));
    return result;
  }
  if (path == "/batch/certificate") {
    auto asset =
        assets_.find(session, batches_.get_batch_asset(session, data));
    if (!asset) {
      return make_query_error(query_error_code::not_found,
                              "batch has no certificate", data,
                              committed_calls_);
    }
    result.value = encoder_.encode(*asset);
    return result;
  }
  if (path == "/vendor/batches") {
    auto vendor = try_make_hash32(data);
    if (!vendor) {
      return make_query_error(query_error_code::invalid_key,
                              "vendor must be 32 bytes", data,
                              committed_calls_);
    }
    result.value = encoder_.encode(vendor_registry<Library>::join(
        vendors_.get_vendor_batches(session, *vendor)));
    return result;
  }
  if (path == "/events/range") {
    auto bounds = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!bounds) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (from, to)", data,
                              committed_calls_);
    }
    auto [from_id, to_id] = *bounds;
    result.value = encoder_.encode(audit_.range(session, from_id, to_id));
    return result;
  }
  if (path == "/engine/info") {
    auto app = app_info_t{};
    app.committed_calls = committed_calls_;
    app.state_root = state_root_;
    app.administrator = administrator_;
    app.application = application_;
    result.value = encoder_.encode(app);
    return result;
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& keyspace : key::kEngineKeyspaces) {
      keyspaces.emplace_back(keyspace);
    }
    result.value = encoder_.encode(keyspaces);
    return result;
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data, committed_calls_);
}

template <typename Library>
void engine<Library>::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto administrator_key = make_bytes(key::kAdministratorKey);
  auto pinned = storage_.template get<account_id_t>(
      encoder_, make_bytes_view(administrator_key));
  if (!pinned) {
    storage_.put(encoder_, make_bytes_view(administrator_key), administrator_);
    spdlog::info("Pinned administrator {}", to_hex(administrator_));
  } else if (*pinned != administrator_) {
    provenance::common::critical(
        "store was created for administrator " + to_hex(*pinned) +
        ", refusing to open with " + to_hex(administrator_));
  }

  auto committed_key = make_bytes(key::kCommittedStateKey);
  if (auto committed =
          storage_.template get<provenance::storage::committed_state>(
              encoder_, make_bytes_view(committed_key))) {
    committed_calls_ = committed->calls;
    state_root_ = committed->state_root;
  } else {
    state_root_ = make_zero_hash();
  }
}

template class engine<provenance::storage::rocksdb_storage_tag>;
template class engine<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
