#ifndef DLR_ID_GENERATOR_HPP
#define DLR_ID_GENERATOR_HPP

#include <array>
#include <cstdint>
#include <string>

namespace IdGenerator {

constexpr size_t UUID_SIZE = 16;
using uuid_t = std::array<uint8_t, UUID_SIZE>;

/**
 * @brief Draws a random RFC 4122 version 4 UUID from the OpenSSL CSPRNG.
 * @throws std::runtime_error if the generator is not seeded.
 */
uuid_t random_uuid();

// Canonical 8-4-4-4-12 lowercase hex form
std::string uuid_to_string(const uuid_t& uuid);

// New task identifier
std::string new_task_id();

bool is_valid_task_id(const std::string& id);

} // namespace IdGenerator

#endif //DLR_ID_GENERATOR_HPP
