/**
 * @file id_generator.h
 * @brief Random identifier generation backed by OpenSSL
 * @author SwarmNet Team
 * @version 1.0.0
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace swarmnet {
namespace utils {

/**
 * @brief Generates unique identifiers for messages, collaborations and tasks
 */
class IdGenerator {
public:
    /**
     * @brief Generate a prefixed random identifier
     * @param prefix Identifier prefix, e.g. "msg_"
     * @param random_bytes Number of random bytes (hex encoded in the result)
     * @return Identifier of the form prefix + hex
     * @throws std::runtime_error if the random generator fails
     */
    static std::string generate(const std::string& prefix, size_t random_bytes = 12);

    static std::string messageId();
    static std::string collaborationId();
    static std::string taskId();

    /**
     * @brief Fill a buffer with cryptographically secure random bytes
     * @throws std::runtime_error if the random generator fails
     */
    static std::vector<uint8_t> randomBytes(size_t count);

    static std::string toHex(const std::vector<uint8_t>& bytes);
};

} // namespace utils
} // namespace swarmnet
