#include <atelier/schema/escrow_event.hpp>

namespace atelier::schema {

std::string_view event_name(const escrow_event_t& event) {
  return std::visit(overloaded{[](const escrow_initialized_t&) {
                                 return std::string_view{"initialized"};
                               },
                               [](const escrow_funded_t&) {
                                 return std::string_view{"funded"};
                               },
                               [](const escrow_released_t&) {
                                 return std::string_view{"released"};
                               },
                               [](const escrow_reclaimed_t&) {
                                 return std::string_view{"reclaimed"};
                               }},
                    event);
}

escrow_id_t event_escrow_id(const escrow_event_t& event) {
  return std::visit([](const auto& value) { return value.id; }, event);
}

}  // namespace atelier::schema
