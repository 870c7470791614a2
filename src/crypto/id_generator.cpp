#include "crypto/id_generator.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <cctype>
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace IdGenerator {

uuid_t random_uuid() {
    uuid_t uuid;
    if (RAND_bytes(uuid.data(), static_cast<int>(uuid.size())) != 1) {
        char err_buf[256];
        ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err_buf);
    }
    uuid[6] = static_cast<uint8_t>((uuid[6] & 0x0F) | 0x40); // version 4
    uuid[8] = static_cast<uint8_t>((uuid[8] & 0x3F) | 0x80); // RFC 4122 variant
    return uuid;
}

std::string uuid_to_string(const uuid_t& uuid) {
    std::stringstream ss;
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)uuid[i];
    }
    return ss.str();
}

std::string new_task_id() {
    return uuid_to_string(random_uuid());
}

bool is_valid_task_id(const std::string& id) {
    if (id.size() != 36) return false;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace IdGenerator
