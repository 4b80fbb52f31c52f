// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/** \file random_source.hpp
 *  Pseudorandom number generator (PRNG) for generating random data from a
 * given entropy source.
 */

#ifndef MINTNET_SRC_COMMON_RANDOM_SOURCE_H_
#define MINTNET_SRC_COMMON_RANDOM_SOURCE_H_

#include "hash.hpp"

#include <limits>
#include <mutex>
#include <queue>

namespace mintnet {
    /// Generates pseudo-random numbers from a 32-byte seed. Output block i is
    /// SHA256(seed || i) so the stream is reproducible from the seed.
    /// Compatible with std::uniform_int_distribution.
    class random_source {
      public:
        using result_type = unsigned int;

        /// Constructor. Reads the seed from an entropy source.
        /// \param source_file path to a file to use as a seed, usually
        ///                    /dev/urandom. If fewer than 32 bytes can be
        ///                    read, the missing seed bytes stay zero.
        explicit random_source(const std::string& source_file);

        /// Constructor. Uses the given seed directly.
        /// \param seed the seed value.
        explicit random_source(const hash_t& seed);

        ~random_source() = default;
        random_source(const random_source& other) = delete;
        auto operator=(const random_source& other) = delete;
        random_source(random_source&& other) = delete;
        auto operator=(random_source&& other) = delete;

        /// Returns a new random integer.
        /// \return random integer.
        auto operator()() -> result_type;

        /// Returns the minimum random value this source can produce.
        /// \return the minimum random value.
        static constexpr auto min() -> result_type {
            return std::numeric_limits<result_type>::min();
        }

        /// Returns the maximum random value this source can produce.
        /// \return the maximum random value.
        static constexpr auto max() -> result_type {
            return std::numeric_limits<result_type>::max();
        }

      private:
        auto hash_at_index(uint64_t idx) const -> hash_t;

        std::mutex m_mut;
        std::queue<unsigned char> m_buf;
        hash_t m_seed{};
        uint64_t m_counter{};
    };
}

#endif // MINTNET_SRC_COMMON_RANDOM_SOURCE_H_
