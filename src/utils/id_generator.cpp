/**
 * @file id_generator.cpp
 * @brief Random identifier generation implementation
 * @author SwarmNet Team
 * @version 1.0.0
 */

#include "utils/id_generator.h"

#include <openssl/rand.h>
#include <openssl/err.h>

#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace swarmnet {
namespace utils {

std::string IdGenerator::generate(const std::string& prefix, size_t random_bytes) {
    return prefix + toHex(randomBytes(random_bytes));
}

std::string IdGenerator::messageId() {
    return generate("msg_");
}

std::string IdGenerator::collaborationId() {
    return generate("collab_");
}

std::string IdGenerator::taskId() {
    return generate("task_", 8);
}

std::vector<uint8_t> IdGenerator::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) {
        return bytes;
    }

    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        unsigned long error = ERR_get_error();
        char buffer[256];
        ERR_error_string_n(error, buffer, sizeof(buffer));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + buffer);
    }

    return bytes;
}

std::string IdGenerator::toHex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : bytes) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace utils
} // namespace swarmnet
