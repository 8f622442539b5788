// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"

#include "core/config.h"
#include "core/fs.h"
#include "core/logging.h"
#include "node/config.h"
#include "node/logging_init.h"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <utility>

namespace {

core::Config config_with(std::initializer_list<std::pair<const char*,
                                                         const char*>> kv) {
    core::Config config;
    for (const auto& [key, value] : kv) config.set(key, value);
    return config;
}

} // anonymous namespace

// ===========================================================================
// Node :: EngineConfig defaults
// ===========================================================================

TEST_CASE(Node, ConfigDefaults) {
    core::Config empty;
    auto loaded = node::load_engine_config(empty);
    CHECK_OK(loaded);
    const auto& cfg = loaded.value();

    CHECK_EQ(cfg.platform.fee_bps, 250u);
    CHECK_EQ(cfg.platform.max_fee_bps, 1000u);
    CHECK_EQ(cfg.platform.fee_recipient.str(), std::string("platform"));
    CHECK_EQ(cfg.platform.max_duration_days, 365);
    CHECK_EQ(cfg.platform.max_milestones, size_t{32});
    CHECK_EQ(cfg.platform.sweep_batch_size, size_t{0});
    CHECK(cfg.platform.allowed_tokens.empty());

    CHECK_EQ(cfg.owner.str(), std::string("admin"));
    CHECK(cfg.log_level == core::LogLevel::INFO);
    CHECK_EQ(cfg.log_categories,
             static_cast<uint32_t>(core::LogCategory::ALL));
    CHECK(cfg.log_file.empty());
    CHECK(cfg.print_to_console);
}

// ===========================================================================
// Node :: EngineConfig overrides
// ===========================================================================

TEST_CASE(Node, ConfigOverrides) {
    const char* argv[] = {"cfund-sim", "-platformfee=400",
                          "-maxplatformfee=500", "-feerecipient=treasury",
                          "-owner=ops", "-sweepbatch=25",
                          "-allowtoken=usdc", "-allowtoken=dai",
                          "-loglevel=Debug", "-logcategories=ledger,refund",
                          "-printtoconsole=0"};
    core::Config config;
    config.parse_args(11, const_cast<char**>(argv));

    auto loaded = node::load_engine_config(config);
    CHECK_OK(loaded);
    const auto& cfg = loaded.value();
    CHECK_EQ(cfg.platform.fee_bps, 400u);
    CHECK_EQ(cfg.platform.max_fee_bps, 500u);
    CHECK_EQ(cfg.platform.fee_recipient.str(), std::string("treasury"));
    CHECK_EQ(cfg.owner.str(), std::string("ops"));
    CHECK_EQ(cfg.platform.sweep_batch_size, size_t{25});
    CHECK_EQ(cfg.platform.allowed_tokens.size(), size_t{2});
    CHECK(cfg.platform.allowed_tokens.count("dai"));
    CHECK(cfg.log_level == core::LogLevel::DEBUG);
    CHECK_EQ(cfg.log_categories,
             static_cast<uint32_t>(core::LogCategory::LEDGER) |
                 static_cast<uint32_t>(core::LogCategory::REFUND));
    CHECK(!cfg.print_to_console);
}

TEST_CASE(Node, DefaultFeeCappedByMaximum) {
    auto loaded =
        node::load_engine_config(config_with({{"maxplatformfee", "100"}}));
    CHECK_OK(loaded);
    CHECK_EQ(loaded.value().platform.fee_bps, 100u);
}

TEST_CASE(Node, ConfigRejectsBadValues) {
    auto code = [](std::initializer_list<std::pair<const char*,
                                                   const char*>> kv) {
        return node::load_engine_config(config_with(kv)).code();
    };
    const auto invalid = core::ErrorCode::INVALID_PARAMETERS;

    CHECK_EQ(code({{"platformfee", "abc"}}), invalid);
    CHECK_EQ(code({{"platformfee", "-1"}}), invalid);
    CHECK_EQ(code({{"platformfee", "1200"}}), invalid);
    CHECK_EQ(code({{"maxplatformfee", "300"}, {"platformfee", "301"}}),
             invalid);
    CHECK_EQ(code({{"maxplatformfee", "10001"}}), invalid);
    CHECK_EQ(code({{"maxdurationdays", "0"}}), invalid);
    CHECK_EQ(code({{"maxdurationdays", "3651"}}), invalid);
    CHECK_EQ(code({{"maxmilestones", "2000"}}), invalid);
    CHECK_EQ(code({{"sweepbatch", "-5"}}), invalid);
    CHECK_EQ(code({{"feerecipient", "Not Valid"}}), invalid);
    CHECK_EQ(code({{"owner", ""}}), invalid);
    CHECK_EQ(code({{"loglevel", "chatty"}}), invalid);
    CHECK_EQ(code({{"logcategories", "ledger,mempool"}}), invalid);
    CHECK_EQ(code({{"printtoconsole", "sometimes"}}), invalid);
    CHECK_EQ(code({{"allowtoken", ""}}), invalid);

    auto err = node::load_engine_config(config_with({{"sweepbatch", "x"}}));
    CHECK(err.error().message().find("-sweepbatch=x") != std::string::npos);
}

// ===========================================================================
// Node :: log level and category parsing
// ===========================================================================

TEST_CASE(Node, ParseLogLevel) {
    CHECK(node::parse_log_level("trace").value() == core::LogLevel::TRACE);
    CHECK(node::parse_log_level("INFO").value() == core::LogLevel::INFO);
    CHECK(node::parse_log_level("warning").value() == core::LogLevel::WARN);
    CHECK(node::parse_log_level("err").value() == core::LogLevel::ERR);
    CHECK(node::parse_log_level("none").value() == core::LogLevel::OFF);
    CHECK_EQ(node::parse_log_level("").code(),
             core::ErrorCode::INVALID_PARAMETERS);
}

TEST_CASE(Node, ParseLogCategories) {
    CHECK_EQ(node::parse_log_categories("").value(),
             static_cast<uint32_t>(core::LogCategory::ALL));
    CHECK_EQ(node::parse_log_categories(" transfer , Journal ").value(),
             static_cast<uint32_t>(core::LogCategory::TRANSFER) |
                 static_cast<uint32_t>(core::LogCategory::JOURNAL));
    CHECK_EQ(node::parse_log_categories("none").value(), 0u);
    CHECK_EQ(node::parse_log_categories("ledger,,lock").value(),
             static_cast<uint32_t>(core::LogCategory::LEDGER) |
                 static_cast<uint32_t>(core::LogCategory::LOCK));
    CHECK_EQ(node::parse_log_categories("net").code(),
             core::ErrorCode::INVALID_PARAMETERS);
}

// ===========================================================================
// Node :: log file handling
// ===========================================================================

TEST_CASE(Node, RotateLogFile) {
    auto dir = std::filesystem::temp_directory_path() / "cfund_test_rotate";
    std::filesystem::remove_all(dir);
    const auto log = dir / "cfund.log";
    CHECK(core::fs::write_file(log, std::string(64, 'x')));

    CHECK(!node::rotate_log_file(dir / "absent.log", 10));
    CHECK(!node::rotate_log_file(log, 1024));
    CHECK(node::rotate_log_file(log, 32));
    CHECK(!core::fs::file_exists(log));
    CHECK(core::fs::file_exists(dir / "cfund.log.1"));

    std::filesystem::remove_all(dir);
}

TEST_CASE(Node, StartupBanner) {
    node::EngineConfig cfg;
    cfg.platform.sweep_batch_size = 50;
    cfg.platform.allowed_tokens.insert("usdc");
    const std::string banner = node::get_startup_banner(cfg);

    CHECK(banner.find("cfund campaign engine") != std::string::npos);
    CHECK(banner.find("Owner: admin") != std::string::npos);
    CHECK(banner.find("Platform fee: 250 bps") != std::string::npos);
    CHECK(banner.find("Sweep batch: 50") != std::string::npos);
    CHECK(banner.find("Allowed tokens: 1") != std::string::npos);
}

TEST_CASE(Node, InitLoggingWritesFile) {
    auto dir = std::filesystem::temp_directory_path() / "cfund_test_logging";
    std::filesystem::remove_all(dir);

    node::EngineConfig cfg;
    cfg.log_file = dir / "logs" / "cfund.log";
    cfg.print_to_console = false;
    CHECK_OK(node::init_logging(cfg));
    core::Logger::instance().flush();

    auto content = core::fs::read_file(cfg.log_file);
    CHECK(content.has_value());
    CHECK(content.value_or("").find("cfund campaign engine") !=
          std::string::npos);

    // Back to console-only output for the remaining tests.
    node::EngineConfig quiet;
    quiet.log_level = core::LogLevel::OFF;
    CHECK_OK(node::init_logging(quiet));
    std::filesystem::remove_all(dir);
}
