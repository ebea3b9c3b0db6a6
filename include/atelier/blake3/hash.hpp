#pragma once
#include <atelier/schema/primitives.hpp>
#include <string_view>

namespace atelier::blake3 {

atelier::schema::hash32_t hash(const std::string_view& str);
atelier::schema::hash32_t hash(const atelier::schema::bytes_view_t& bytes);

}  // namespace atelier::blake3
