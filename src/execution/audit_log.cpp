#include <spdlog/spdlog.h>
#include <algorithm>
#include <provenance/execution/audit_log.hpp>
#include <provenance/schema/key/engine_keys.hpp>
#include <provenance/storage/memory/storage.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <utility>

namespace provenance::execution {

template <typename Library>
void audit_log<Library>::emit(
    call_frame<Library>& frame,
    const std::string_view name,
    const provenance::schema::bytes_view_t& subject,
    std::vector<provenance::schema::transaction_event_attribute_t>
        extra_attributes) {
  auto& session = frame.session;
  auto event_id = last_event_id(session) + 1;

  auto record = provenance::schema::audit_event_record_t{
      .event_id = event_id,
      .call_index = frame.call_index,
      .name = std::string{name},
      .subject = provenance::schema::make_bytes(subject),
      .caller = frame.caller,
      .message = format_message(name, subject, frame.caller)};

  auto event_key = provenance::schema::key::make_event_key(event_id);
  session.put(provenance::schema::make_bytes_view(event_key), record);
  auto seq_key =
      provenance::schema::make_bytes(provenance::schema::key::kEventSeqKey);
  session.put(provenance::schema::make_bytes_view(seq_key), event_id);

  auto event = provenance::schema::transaction_event_t{.type = record.name};
  event.attributes.push_back({.key = "event_id",
                              .value = std::to_string(event_id),
                              .index = false});
  event.attributes.push_back({.key = "subject",
                              .value = provenance::schema::to_hex(subject),
                              .index = true});
  event.attributes.push_back({.key = "caller",
                              .value = provenance::schema::to_hex(frame.caller),
                              .index = true});
  for (auto& attribute : extra_attributes) {
    event.attributes.push_back(std::move(attribute));
  }
  frame.events.push_back(std::move(event));
  spdlog::debug("Staged audit event {}: {}", event_id, record.message);
}

template <typename Library>
std::vector<provenance::schema::audit_event_record_t>
audit_log<Library>::range(provenance::storage::session<Library>& session,
                          const uint64_t from_id,
                          const uint64_t to_id) const {
  auto records = std::vector<provenance::schema::audit_event_record_t>{};
  auto first = std::max<uint64_t>(from_id, 1);
  auto last = std::min(to_id, last_event_id(session));
  for (auto id = first; id <= last; ++id) {
    auto key = provenance::schema::key::make_event_key(id);
    auto record = session.template get<provenance::schema::audit_event_record_t>(
        provenance::schema::make_bytes_view(key));
    if (!record) {
      spdlog::warn("Audit event {} missing below sequence head {}", id, last);
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

template <typename Library>
uint64_t audit_log<Library>::last_event_id(
    provenance::storage::session<Library>& session) const {
  auto seq_key =
      provenance::schema::make_bytes(provenance::schema::key::kEventSeqKey);
  return session.template get<uint64_t>(
                    provenance::schema::make_bytes_view(seq_key))
      .value_or(0);
}

template <typename Library>
std::string audit_log<Library>::format_message(
    const std::string_view name,
    const provenance::schema::bytes_view_t& subject,
    const provenance::schema::account_id_t& caller) {
  auto message = std::string{name};
  message.push_back('|');
  message.append(provenance::schema::to_hex(subject));
  message.push_back('|');
  message.append(provenance::schema::to_hex(caller));
  return message;
}

template class audit_log<provenance::storage::rocksdb_storage_tag>;
template class audit_log<provenance::storage::memory_storage_tag>;

}  // namespace provenance::execution
