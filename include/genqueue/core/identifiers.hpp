/**
 * @file identifiers.hpp
 * @brief Random identifiers for jobs and workers
 */

#pragma once

#include <string>

namespace genqueue::core {

/**
 * @brief Generate a random RFC 4122 version 4 UUID
 * @return Lowercase UUID string (8-4-4-4-12)
 */
[[nodiscard]] auto generate_uuid() -> std::string;

/**
 * @brief Generate a default worker id
 * @return "worker-" followed by six lowercase hex digits
 */
[[nodiscard]] auto generate_worker_id() -> std::string;

}  // namespace genqueue::core
