/**
 * @file job_store.cpp
 * @brief Default clock for job stores
 */

#include <genqueue/queue/job_store.hpp>

#include <genqueue/core/timestamp.hpp>

namespace genqueue::queue {

auto system_clock_source() -> clock_source {
    return [] { return core::truncate_to_micros(clock_type::now()); };
}

}  // namespace genqueue::queue
