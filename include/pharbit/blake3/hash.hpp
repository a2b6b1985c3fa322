#pragma once
#include <pharbit/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace pharbit::blake3 {

pharbit::schema::hash32_t hash(const std::string_view& str);
pharbit::schema::hash32_t hash(const pharbit::schema::bytes_view_t& bytes);

}  // namespace pharbit::blake3
