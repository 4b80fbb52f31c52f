// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"
#include "util/common/config.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

class config_validation_test : public ::testing::Test {
  protected:
    void SetUp() override {
        m_opts.m_bank_endpoint = {"127.0.0.1", 5555};
        m_opts.m_notary_endpoint = {"127.0.0.1", 5556};
        m_opts.m_bank_public_key = m_bank.m_pk;
        m_opts.m_notary_public_key = m_notary.m_pk;

        m_example_config
            = "bank_endpoint=\"127.0.0.1:5555\"\n"
              "bank_public_key=\""
            + mintnet::to_string(m_bank.m_pk)
            + "\"\n"
              "# notary lives on another host\n"
              "notary_endpoint=\"10.0.0.2:6000\"\n"
              "notary_public_key=\""
            + mintnet::to_string(m_notary.m_pk)
            + "\"\n"
              "rpc_timeout_ms=250\n"
              "loglevel=\"DEBUG\"\n";
    }

    static auto read(const std::string& cfg)
        -> std::variant<mintnet::config::options, std::string> {
        auto stream = std::istringstream(cfg);
        return mintnet::config::read_options(stream);
    }

    mintnet::test::keypair m_bank{mintnet::test::make_keypair(1)};
    mintnet::test::keypair m_notary{mintnet::test::make_keypair(2)};
    mintnet::config::options m_opts;
    std::string m_example_config;
};

TEST_F(config_validation_test, valid_options) {
    ASSERT_FALSE(mintnet::config::check_options(m_opts).has_value());
}

TEST_F(config_validation_test, endpoints_required) {
    auto opts = m_opts;
    opts.m_bank_endpoint = {};
    ASSERT_TRUE(mintnet::config::check_options(opts).has_value());

    opts = m_opts;
    opts.m_notary_endpoint = {};
    ASSERT_TRUE(mintnet::config::check_options(opts).has_value());
}

TEST_F(config_validation_test, authority_keys_required) {
    auto opts = m_opts;
    opts.m_bank_public_key = {};
    ASSERT_TRUE(mintnet::config::check_options(opts).has_value());

    opts = m_opts;
    opts.m_notary_public_key = {};
    ASSERT_TRUE(mintnet::config::check_options(opts).has_value());
}

TEST_F(config_validation_test, bank_private_key_must_match) {
    m_opts.m_bank_private_key = m_bank.m_sk;
    ASSERT_FALSE(mintnet::config::check_options(m_opts).has_value());

    m_opts.m_bank_private_key = m_notary.m_sk;
    ASSERT_TRUE(mintnet::config::check_options(m_opts).has_value());

    m_opts.m_bank_private_key = mintnet::privkey_t{};
    ASSERT_TRUE(mintnet::config::check_options(m_opts).has_value());
}

TEST_F(config_validation_test, read_example_config) {
    auto res = read(m_example_config);
    ASSERT_TRUE(std::holds_alternative<mintnet::config::options>(res));
    auto& opts = std::get<mintnet::config::options>(res);

    auto bank_ep = mintnet::network::endpoint_t{"127.0.0.1", 5555};
    auto notary_ep = mintnet::network::endpoint_t{"10.0.0.2", 6000};
    ASSERT_EQ(opts.m_bank_endpoint, bank_ep);
    ASSERT_EQ(opts.m_notary_endpoint, notary_ep);
    ASSERT_EQ(opts.m_bank_public_key, m_bank.m_pk);
    ASSERT_EQ(opts.m_notary_public_key, m_notary.m_pk);
    ASSERT_FALSE(opts.m_bank_private_key.has_value());
    ASSERT_EQ(opts.m_rpc_timeout, std::chrono::milliseconds(250));
    ASSERT_EQ(opts.m_loglevel, mintnet::logging::log_level::debug);
    ASSERT_FALSE(mintnet::config::check_options(opts).has_value());
}

TEST_F(config_validation_test, defaults) {
    auto res = read("bank_endpoint=\"127.0.0.1:5555\"\n");
    ASSERT_TRUE(std::holds_alternative<mintnet::config::options>(res));
    auto& opts = std::get<mintnet::config::options>(res);
    ASSERT_EQ(opts.m_rpc_timeout, mintnet::config::defaults::rpc_timeout);
    ASSERT_EQ(opts.m_loglevel, mintnet::config::defaults::log_level);
    ASSERT_TRUE(mintnet::config::check_options(opts).has_value());
}

TEST_F(config_validation_test, malformed_values) {
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("bank_endpoint=\"127.0.0.1\"\n")));
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("notary_endpoint=\"127.0.0.1:70000\"\n")));
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("bank_public_key=\"abcd\"\n")));
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("rpc_timeout_ms=\"soon\"\n")));
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("rpc_timeout_ms=2147483648\n")));
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("rpc_timeout_ms=18446744073709551615\n")));
    ASSERT_TRUE(std::holds_alternative<std::string>(
        read("loglevel=\"LOUD\"\n")));
}

TEST_F(config_validation_test, make_log_uses_configured_level) {
    m_opts.m_loglevel = mintnet::logging::log_level::trace;
    auto log = mintnet::config::make_log(m_opts, "bank");
    ASSERT_EQ(log->get_log_level(), mintnet::logging::log_level::trace);
}

TEST_F(config_validation_test, missing_file) {
    auto res = mintnet::config::read_options("does_not_exist.cfg");
    ASSERT_TRUE(std::holds_alternative<std::string>(res));
}

TEST(config_parser_test, value_types) {
    auto stream = std::istringstream("name=\"mint\"\n"
                                     "count=42\n"
                                     "ratio=0.25\n"
                                     "bare=word\n");
    auto cfg = mintnet::config::parser(stream);
    ASSERT_EQ(cfg.get_string("name"), "mint");
    ASSERT_EQ(cfg.get_ulong("count"), 42UL);
    ASSERT_EQ(cfg.get_string("ratio"), "0.25");
    ASSERT_FALSE(cfg.get_ulong("ratio").has_value());
    ASSERT_EQ(cfg.get_string("bare"), "word");
    ASSERT_FALSE(cfg.get_ulong("name").has_value());
    ASSERT_FALSE(cfg.contains("absent"));
}

TEST(config_parser_test, parse_ip_port) {
    auto ep = mintnet::config::parse_ip_port("localhost:8080");
    ASSERT_TRUE(ep.has_value());
    ASSERT_EQ(ep->first, "localhost");
    ASSERT_EQ(ep->second, 8080);

    ASSERT_FALSE(mintnet::config::parse_ip_port(":8080").has_value());
    ASSERT_FALSE(mintnet::config::parse_ip_port("localhost:").has_value());
    ASSERT_FALSE(mintnet::config::parse_ip_port("localhost:0").has_value());
    ASSERT_FALSE(mintnet::config::parse_ip_port("localhost:8o80").has_value());
}
