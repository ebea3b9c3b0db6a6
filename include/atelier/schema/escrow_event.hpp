#pragma once
#include <atelier/schema/primitives.hpp>
#include <string_view>
#include <variant>

// Schema type: escrow events.
// Escrow workflow: notifications emitted once a transition has committed.
namespace atelier::schema {

struct escrow_initialized_t final {
  escrow_id_t id{};
  principal_id_t client{};
  principal_id_t artisan{};
  bool operator==(const escrow_initialized_t&) const = default;
};

struct escrow_funded_t final {
  escrow_id_t id{};
  principal_id_t client{};
  amount_t amount{};
  timestamp_seconds_t timestamp{};
  bool operator==(const escrow_funded_t&) const = default;
};

struct escrow_released_t final {
  escrow_id_t id{};
  principal_id_t artisan{};
  amount_t amount{};
  timestamp_seconds_t timestamp{};
  bool operator==(const escrow_released_t&) const = default;
};

struct escrow_reclaimed_t final {
  escrow_id_t id{};
  principal_id_t client{};
  amount_t amount{};
  timestamp_seconds_t timestamp{};
  bool operator==(const escrow_reclaimed_t&) const = default;
};

using escrow_event_t = std::variant<escrow_initialized_t,
                                    escrow_funded_t,
                                    escrow_released_t,
                                    escrow_reclaimed_t>;

/// Name used for the event in logs and the event log.
std::string_view event_name(const escrow_event_t& event);

/// Escrow the event refers to.
escrow_id_t event_escrow_id(const escrow_event_t& event);

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  escrow_event_t event;
  bool operator==(const event_record<1>&) const = default;
};

using event_record_t = event_record<1>;

}  // namespace atelier::schema
