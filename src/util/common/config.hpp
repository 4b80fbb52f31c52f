// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
//               2022 MITRE Corporation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * \file config.hpp
 * Tools for reading client options from a configuration file: the bank and
 * notary endpoints, the authority public keys responses are verified
 * against, and call timeouts.
 */

#ifndef MINTNET_SRC_COMMON_CONFIG_H_
#define MINTNET_SRC_COMMON_CONFIG_H_

#include "keys.hpp"
#include "logging.hpp"
#include "util/network/endpoint.hpp"

#include <chrono>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace mintnet::config {
    /// Random source to use when choosing between peers.
    static constexpr const char* random_source{"/dev/urandom"};

    /// \brief Maximum bytes optimistically reserved at once during deserialization.
    /// When deserializing, we want to limit the amount of memory we reserve
    /// without the sender actually sending that amount of information. This
    /// constant is used when deserializing so that a sender must send at least
    /// X bytes of information for us to allocate X+1MiB of memory.
    static constexpr uint64_t maximum_reservation
        = static_cast<uint64_t>(1024 * 1024); // 1MiB

    namespace defaults {
        static constexpr auto rpc_timeout = std::chrono::milliseconds(5000);
        static constexpr auto log_level = logging::log_level::warn;
    }

    static constexpr auto bank_endpoint_key = "bank_endpoint";
    static constexpr auto bank_public_key_key = "bank_public_key";
    static constexpr auto bank_private_key_key = "bank_private_key";
    static constexpr auto notary_endpoint_key = "notary_endpoint";
    static constexpr auto notary_public_key_key = "notary_public_key";
    static constexpr auto rpc_timeout_key = "rpc_timeout_ms";
    static constexpr auto loglevel_key = "loglevel";

    /// Project-wide configuration options.
    struct options {
        /// Endpoint of the bank's RPC server.
        network::endpoint_t m_bank_endpoint{};
        /// Key the bank signs its responses and control messages with.
        pubkey_t m_bank_public_key{};
        /// Bank signing key. Only present on nodes acting for the bank
        /// (announcing periods and blocks).
        std::optional<privkey_t> m_bank_private_key{};
        /// Endpoint of the notary's RPC server.
        network::endpoint_t m_notary_endpoint{};
        /// Key the notary signs its responses with.
        pubkey_t m_notary_public_key{};
        /// Deadline for a single remote call. Zero disables the deadline.
        std::chrono::milliseconds m_rpc_timeout{defaults::rpc_timeout};
        /// Log level for the client components.
        logging::log_level m_loglevel{defaults::log_level};
    };

    /// Read options from the given config file without checking invariants.
    /// \param config_file the path to the config file from which to load
    ///                    options.
    /// \return options struct with all required values, or string with error
    ///         message on failure.
    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Read options from the given stream without checking invariants.
    /// \see read_options(const std::string&)
    auto read_options(std::istream& stream)
        -> std::variant<options, std::string>;

    /// Loads options from the given config file and check for invariants.
    /// \param config_file the path to the config file from which load options.
    /// \return valid options struct, or string with error message on failure.
    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string>;

    /// Checks a fully populated options struct for invariants.
    /// \param opts options struct to check.
    /// \return std::nullopt if the struct satisfies all invariants. Error
    ///         string otherwise.
    auto check_options(const options& opts) -> std::optional<std::string>;

    /// Creates a log at the configured level whose lines are tagged with
    /// the given component name.
    /// \param opts options supplying the log level.
    /// \param component name printed in each line, e.g. "bank".
    /// \return the new log.
    auto make_log(const options& opts, std::string component)
        -> std::shared_ptr<logging::log>;

    /// Reads configuration parameters line-by-line from an input stream.
    /// Lines have the form key=value. Values in double quotes are strings,
    /// values made only of digits are unsigned integers and anything else
    /// is kept as a bare string. An environment variable named after the upper-cased
    /// key overrides the file value.
    class parser {
      public:
        /// Constructor.
        /// \param stream the generic stream used to add config values.
        explicit parser(std::istream& stream);

        /// Returns the given key if its value is a string.
        /// \param key key to retrieve.
        /// \return value associated with the key or std::nullopt if the value
        ///         was not a string or does not exist.
        [[nodiscard]] auto get_string(const std::string& key) const
            -> std::optional<std::string>;

        /// Return the value for the given key if its value is a long.
        /// \param key key to retrieve.
        /// \return value associated with the key, or std::nullopt if the value
        ///         was not a long or doesn't exist.
        [[nodiscard]] auto get_ulong(const std::string& key) const
            -> std::optional<size_t>;

        /// Indicates whether the key has a value of any type.
        [[nodiscard]] auto contains(const std::string& key) const -> bool;

      private:
        using value_t = std::variant<std::string, size_t>;

        [[nodiscard]] auto find_or_env(const std::string& key) const
            -> std::optional<value_t>;

        template<typename T>
        [[nodiscard]] auto get_val(const std::string& key) const
            -> std::optional<T> {
            const auto it = find_or_env(key);
            if(it) {
                const auto* val = std::get_if<T>(&it.value());
                if(val != nullptr) {
                    return *val;
                }
            }

            return std::nullopt;
        }

        [[nodiscard]] static auto parse_value(const std::string& val)
            -> value_t;

        std::map<std::string, value_t> m_options;
    };

    /// Parses a host:port string.
    /// \param in_str string to parse.
    /// \return the endpoint, or std::nullopt if the host is empty or the port
    ///         is not a number in the valid port range.
    auto parse_ip_port(const std::string& in_str)
        -> std::optional<network::endpoint_t>;
}

#endif // MINTNET_SRC_COMMON_CONFIG_H_
