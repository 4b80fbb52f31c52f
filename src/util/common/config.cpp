// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace mintnet::config {
    auto parse_ip_port(const std::string& in_str)
        -> std::optional<network::endpoint_t> {
        const auto sep = in_str.rfind(':');
        if(sep == std::string::npos || sep == 0) {
            return std::nullopt;
        }

        auto host = in_str.substr(0, sep);
        const auto port_str = in_str.substr(sep + 1);
        unsigned long port{};
        const auto* first = port_str.data();
        const auto* last = first + port_str.size();
        auto [ptr, ec] = std::from_chars(first, last, port);
        if(ec != std::errc() || ptr != last || port == 0
           || port > std::numeric_limits<network::port_number_t>::max()) {
            return std::nullopt;
        }

        return network::endpoint_t{std::move(host),
                                   static_cast<network::port_number_t>(port)};
    }

    namespace {
        auto read_endpoint(const parser& cfg,
                           const std::string& key,
                           network::endpoint_t& out)
            -> std::optional<std::string> {
            const auto val = cfg.get_string(key);
            if(!val.has_value()) {
                return std::nullopt;
            }
            auto ep = parse_ip_port(val.value());
            if(!ep.has_value()) {
                return "Malformed endpoint for " + key + ": " + val.value();
            }
            out = std::move(ep.value());
            return std::nullopt;
        }

        auto read_key(const parser& cfg,
                      const std::string& key,
                      std::optional<pubkey_t>& out)
            -> std::optional<std::string> {
            const auto val = cfg.get_string(key);
            if(!val.has_value()) {
                return std::nullopt;
            }
            out = key_from_hex(val.value());
            if(!out.has_value()) {
                return "Malformed key for " + key
                     + ", expected 64 hex digits";
            }
            return std::nullopt;
        }

        auto read_client_options(options& opts, const parser& cfg)
            -> std::optional<std::string> {
            auto err = read_endpoint(cfg, bank_endpoint_key, opts.m_bank_endpoint);
            if(err.has_value()) {
                return err;
            }
            err = read_endpoint(cfg,
                                notary_endpoint_key,
                                opts.m_notary_endpoint);
            if(err.has_value()) {
                return err;
            }

            auto key = std::optional<pubkey_t>();
            err = read_key(cfg, bank_public_key_key, key);
            if(err.has_value()) {
                return err;
            }
            opts.m_bank_public_key = key.value_or(pubkey_t{});

            key.reset();
            err = read_key(cfg, notary_public_key_key, key);
            if(err.has_value()) {
                return err;
            }
            opts.m_notary_public_key = key.value_or(pubkey_t{});

            key.reset();
            err = read_key(cfg, bank_private_key_key, key);
            if(err.has_value()) {
                return err;
            }
            opts.m_bank_private_key = key;

            if(cfg.contains(rpc_timeout_key)) {
                const auto timeout = cfg.get_ulong(rpc_timeout_key);
                if(!timeout.has_value()) {
                    return std::string(rpc_timeout_key)
                         + " must be an unsigned integer";
                }
                if(timeout.value()
                   > static_cast<size_t>(std::numeric_limits<int>::max())) {
                    return std::string(rpc_timeout_key) + " must be at most "
                         + std::to_string(std::numeric_limits<int>::max());
                }
                opts.m_rpc_timeout = std::chrono::milliseconds(
                    static_cast<std::chrono::milliseconds::rep>(
                        timeout.value()));
            }

            if(cfg.contains(loglevel_key)) {
                const auto lvl_str = cfg.get_string(loglevel_key);
                const auto lvl = lvl_str.has_value()
                                   ? logging::parse_loglevel(lvl_str.value())
                                   : std::nullopt;
                if(!lvl.has_value()) {
                    return "Unknown log level for " + std::string(loglevel_key);
                }
                opts.m_loglevel = lvl.value();
            }

            return std::nullopt;
        }
    }

    auto read_options(std::istream& stream)
        -> std::variant<options, std::string> {
        auto opts = options{};
        auto cfg = parser(stream);

        auto err = read_client_options(opts, cfg);
        if(err.has_value()) {
            return err.value();
        }

        return opts;
    }

    auto read_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        std::ifstream file(config_file);
        if(!file.good()) {
            return "Unable to open config file " + config_file;
        }
        return read_options(file);
    }

    auto load_options(const std::string& config_file)
        -> std::variant<options, std::string> {
        auto opt = read_options(config_file);
        if(std::holds_alternative<options>(opt)) {
            auto res = check_options(std::get<options>(opt));
            if(res) {
                return *res;
            }
        }
        return opt;
    }

    auto check_options(const options& opts) -> std::optional<std::string> {
        if(opts.m_bank_endpoint.first.empty()) {
            return "A bank endpoint is required";
        }
        if(opts.m_notary_endpoint.first.empty()) {
            return "A notary endpoint is required";
        }

        static constexpr auto unset_key = pubkey_t{};
        if(opts.m_bank_public_key == unset_key) {
            return "The bank public key is required to verify bank responses";
        }
        if(opts.m_notary_public_key == unset_key) {
            return "The notary public key is required to verify notary "
                   "responses";
        }

        if(opts.m_bank_private_key.has_value()) {
            auto ctx = make_secp_context();
            const auto derived
                = pubkey_from_privkey(opts.m_bank_private_key.value(),
                                      ctx.get());
            if(!derived.has_value()) {
                return "The bank private key is not a valid secp256k1 key";
            }
            if(derived.value() != opts.m_bank_public_key) {
                return "The bank private key does not match the bank public "
                       "key";
            }
        }

        return std::nullopt;
    }

    auto make_log(const options& opts, std::string component)
        -> std::shared_ptr<logging::log> {
        auto log = std::make_shared<logging::log>(opts.m_loglevel);
        log->set_name(std::move(component));
        return log;
    }

    parser::parser(std::istream& stream) {
        std::string line;
        while(std::getline(stream, line)) {
            if(line.empty() || line[0] == '#') {
                continue;
            }
            std::istringstream line_stream(line);
            std::string key;
            if(std::getline(line_stream, key, '=')) {
                std::string value;
                if(std::getline(line_stream, value) && !value.empty()) {
                    m_options.emplace(key, parse_value(value));
                }
            }
        }
    }

    auto parser::get_string(const std::string& key) const
        -> std::optional<std::string> {
        return get_val<std::string>(key);
    }

    auto parser::get_ulong(const std::string& key) const
        -> std::optional<size_t> {
        return get_val<size_t>(key);
    }

    auto parser::contains(const std::string& key) const -> bool {
        return find_or_env(key).has_value();
    }

    auto parser::find_or_env(const std::string& key) const
        -> std::optional<value_t> {
        auto upper_key = key;
        std::transform(upper_key.begin(),
                       upper_key.end(),
                       upper_key.begin(),
                       [](unsigned char c) {
                           return std::toupper(c);
                       });
        if(const auto* env_v = std::getenv(upper_key.c_str())) {
            auto value = std::string(env_v);
            if(!value.empty()) {
                return parse_value(value);
            }
        }

        auto it = m_options.find(key);
        if(it != m_options.end()) {
            return it->second;
        }

        return std::nullopt;
    }

    auto parser::parse_value(const std::string& value) -> value_t {
        if(value.size() >= 2 && value.front() == '\"'
           && value.back() == '\"') {
            return value.substr(1, value.size() - 2);
        }

        const auto* first = value.data();
        const auto* last = first + value.size();
        size_t as_int{};
        auto [ptr, ec] = std::from_chars(first, last, as_int);
        if(ec == std::errc() && ptr == last) {
            return as_int;
        }
        return value;
    }
}
