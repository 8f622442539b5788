// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// cfund-sim -- scenario runner for the campaign engine
//
// Runs one command per line against an engine backed by in-memory custody
// and a mock clock.  Blank lines and '#' comments are skipped.  A command
// prefixed with '!' is expected to fail; the run exits non-zero on the
// first unexpected outcome.
//
// Usage:
//   cfund-sim [options] [scenario-file]      (stdin when no file is given)
//
// Commands:
//   time <unix>                        set the clock
//   advance <seconds>                  move the clock forward
//   deposit <account> <asset> <amt>    fund an external wallet
//   create <creator> <goal> <min> <max> <days> [asset] [title...]
//   contribute <who> <id> <amt>
//   refund <who> <id>
//   enable-refunds <caller> <id>
//   cancel <caller> <id>
//   sweep <caller> <id> <max>
//   withdrawals <caller> <id> <0|1> <ceiling> <interval>
//   withdraw <caller> <id> <amt>
//   surplus <caller> <id>
//   milestone <caller> <id> <amt> [description...]
//   complete <caller> <id> <index>
//   goal <caller> <id> <amt>
//   extend <caller> <id> <days>
//   verify <caller> <id> <0|1>
//   promote <caller> <id> <0|1>
//   fee <caller> <bps>
//   allow-token <caller> <token> <0|1>
//   pause <caller> | unpause <caller>
//   summary <id>
//   balance <account> <asset>
//   journal
//   save <path> | load <path>
//
// Options:
//   -conf=FILE      read configuration from FILE
//   -events         print every journal event as it is appended
//   -time=UNIX      initial clock value (default 1700000000)
//   (plus every engine configuration key, see node/config.h)
// ---------------------------------------------------------------------------

#include "campaign/access.h"
#include "campaign/custody.h"
#include "campaign/engine.h"
#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "core/time.h"
#include "crypto/keccak.h"
#include "node/config.h"
#include "node/logging_init.h"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using campaign::CampaignId;
using primitives::AccountId;
using primitives::Amount;
using primitives::Asset;

using Args = std::vector<std::string>;

static constexpr int64_t DEFAULT_START_TIME = 1'700'000'000;

core::Error usage(std::string_view text) {
    return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                            "usage: " + std::string(text));
}

core::Result<int64_t> parse_int(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "not an integer: '" + s + "'");
    }
    return v;
}

core::Result<CampaignId> parse_id(const std::string& s) {
    const int64_t v = CFUND_TRY(parse_int(s));
    if (v <= 0) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "bad campaign id '" + s + "'");
    }
    return static_cast<CampaignId>(v);
}

core::Result<bool> parse_flag(const std::string& s) {
    auto flag = core::parse_bool(s);
    if (!flag.has_value()) {
        return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                "not a boolean: '" + s + "'");
    }
    return *flag;
}

std::string join(const Args& args, size_t from) {
    std::string out;
    for (size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

std::string describe_split(const campaign::FeeSplit& split) {
    return "gross=" + split.gross.to_string() +
           " fee=" + split.fee.to_string() +
           " net=" + split.net.to_string();
}

// ---------------------------------------------------------------------------
// Simulator
// ---------------------------------------------------------------------------

class Simulator {
public:
    Simulator(const node::EngineConfig& config, bool print_events)
        : gate_(config.owner),
          engine_(config.platform, custody_, gate_, clock_) {
        if (print_events) {
            engine_.subscribe([](const campaign::Event& e) {
                std::cout << "  event " << e.to_string() << "\n";
            });
        }
    }

    /// Run every line of @p in.  Returns false on the first unexpected
    /// outcome.
    bool run(std::istream& in) {
        std::string line;
        int line_num = 0;
        while (std::getline(in, line)) {
            ++line_num;
            auto hash = line.find('#');
            if (hash != std::string::npos) line.erase(hash);

            std::istringstream tokens(line);
            Args args;
            for (std::string tok; tokens >> tok;) args.push_back(tok);
            if (args.empty()) continue;

            bool expect_failure = false;
            if (args[0].starts_with("!")) {
                expect_failure = true;
                args[0].erase(0, 1);
            }

            auto result = execute(args);
            if (result.ok()) {
                std::cout << line_num << ": " << args[0] << " ok";
                if (!result.value().empty()) {
                    std::cout << " " << result.value();
                }
                std::cout << "\n";
            } else {
                std::cout << line_num << ": " << args[0] << " error "
                          << core::error_code_name(result.error().code())
                          << ": " << result.error().message() << "\n";
            }

            if (result.ok() == expect_failure) {
                std::cerr << "line " << line_num << ": unexpected "
                          << (expect_failure ? "success" : "failure")
                          << "\n";
                return false;
            }
        }
        return true;
    }

private:
    using Handler = core::Result<std::string> (Simulator::*)(const Args&);

    core::Result<std::string> execute(const Args& args) {
        static const std::map<std::string, Handler, std::less<>> handlers = {
            {"time",           &Simulator::cmd_time},
            {"advance",        &Simulator::cmd_advance},
            {"deposit",        &Simulator::cmd_deposit},
            {"create",         &Simulator::cmd_create},
            {"contribute",     &Simulator::cmd_contribute},
            {"refund",         &Simulator::cmd_refund},
            {"enable-refunds", &Simulator::cmd_enable_refunds},
            {"cancel",         &Simulator::cmd_cancel},
            {"sweep",          &Simulator::cmd_sweep},
            {"withdrawals",    &Simulator::cmd_withdrawals},
            {"withdraw",       &Simulator::cmd_withdraw},
            {"surplus",        &Simulator::cmd_surplus},
            {"milestone",      &Simulator::cmd_milestone},
            {"complete",       &Simulator::cmd_complete},
            {"goal",           &Simulator::cmd_goal},
            {"extend",         &Simulator::cmd_extend},
            {"verify",         &Simulator::cmd_verify},
            {"promote",        &Simulator::cmd_promote},
            {"fee",            &Simulator::cmd_fee},
            {"allow-token",    &Simulator::cmd_allow_token},
            {"pause",          &Simulator::cmd_pause},
            {"unpause",        &Simulator::cmd_unpause},
            {"summary",        &Simulator::cmd_summary},
            {"balance",        &Simulator::cmd_balance},
            {"journal",        &Simulator::cmd_journal},
            {"save",           &Simulator::cmd_save},
            {"load",           &Simulator::cmd_load},
        };

        auto it = handlers.find(args[0]);
        if (it == handlers.end()) {
            return core::make_error(core::ErrorCode::INVALID_PARAMETERS,
                                    "unknown command '" + args[0] + "'");
        }
        return (this->*(it->second))(args);
    }

    // -- Clock and wallets --------------------------------------------------

    core::Result<std::string> cmd_time(const Args& a) {
        if (a.size() != 2) return usage("time <unix>");
        const int64_t t = CFUND_TRY(parse_int(a[1]));
        if (t <= 0) return usage("time <unix>");
        core::MockableClock::set_mock_time(t);
        return core::format_iso8601(t);
    }

    core::Result<std::string> cmd_advance(const Args& a) {
        if (a.size() != 2) return usage("advance <seconds>");
        const int64_t s = CFUND_TRY(parse_int(a[1]));
        core::MockableClock::advance(s);
        return core::format_iso8601(core::MockableClock::now());
    }

    core::Result<std::string> cmd_deposit(const Args& a) {
        if (a.size() != 4) return usage("deposit <account> <asset> <amt>");
        auto who = CFUND_TRY(AccountId::from_string(a[1]));
        auto asset = CFUND_TRY(Asset::parse(a[2]));
        auto amount = CFUND_TRY(Amount::parse(a[3]));
        custody_.deposit(asset, who, amount);
        return custody_.wallet_balance(asset, who).to_string();
    }

    // -- Campaign operations ------------------------------------------------

    core::Result<std::string> cmd_create(const Args& a) {
        if (a.size() < 6) {
            return usage(
                "create <creator> <goal> <min> <max> <days> [asset] [title]");
        }
        auto creator = CFUND_TRY(AccountId::from_string(a[1]));
        campaign::CampaignParams params;
        params.goal = CFUND_TRY(Amount::parse(a[2]));
        params.min_contribution = CFUND_TRY(Amount::parse(a[3]));
        params.max_contribution = CFUND_TRY(Amount::parse(a[4]));
        params.duration_days = CFUND_TRY(parse_int(a[5]));
        if (a.size() > 6) params.asset = CFUND_TRY(Asset::parse(a[6]));
        params.metadata.title = a.size() > 7 ? join(a, 7) : "untitled";
        auto id = CFUND_TRY(engine_.create_campaign(creator, params));
        return "id=" + std::to_string(id);
    }

    core::Result<std::string> cmd_contribute(const Args& a) {
        if (a.size() != 4) return usage("contribute <who> <id> <amt>");
        auto who = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto amount = CFUND_TRY(Amount::parse(a[3]));
        CFUND_TRY_VOID(engine_.contribute(who, id, amount));
        return std::string{};
    }

    core::Result<std::string> cmd_refund(const Args& a) {
        if (a.size() != 3) return usage("refund <who> <id>");
        auto who = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto paid = CFUND_TRY(engine_.request_refund(who, id));
        return "paid=" + paid.to_string();
    }

    core::Result<std::string> cmd_enable_refunds(const Args& a) {
        if (a.size() != 3) return usage("enable-refunds <caller> <id>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        CFUND_TRY_VOID(engine_.enable_refunds(caller, id));
        return std::string{};
    }

    core::Result<std::string> cmd_cancel(const Args& a) {
        if (a.size() != 3) return usage("cancel <caller> <id>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto remaining = CFUND_TRY(engine_.cancel_campaign(caller, id));
        return "remaining=" + std::to_string(remaining);
    }

    core::Result<std::string> cmd_sweep(const Args& a) {
        if (a.size() != 4) return usage("sweep <caller> <id> <max>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        const int64_t max = CFUND_TRY(parse_int(a[3]));
        if (max < 0) return usage("sweep <caller> <id> <max>");
        auto remaining = CFUND_TRY(engine_.continue_refund_sweep(
            caller, id, static_cast<size_t>(max)));
        return "remaining=" + std::to_string(remaining);
    }

    core::Result<std::string> cmd_withdrawals(const Args& a) {
        if (a.size() != 6) {
            return usage(
                "withdrawals <caller> <id> <0|1> <ceiling> <interval>");
        }
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        campaign::WithdrawalSettings settings;
        settings.partial_enabled = CFUND_TRY(parse_flag(a[3]));
        settings.ceiling = CFUND_TRY(Amount::parse(a[4]));
        settings.min_interval = CFUND_TRY(parse_int(a[5]));
        CFUND_TRY_VOID(engine_.configure_withdrawals(caller, id, settings));
        return std::string{};
    }

    core::Result<std::string> cmd_withdraw(const Args& a) {
        if (a.size() != 4) return usage("withdraw <caller> <id> <amt>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto amount = CFUND_TRY(Amount::parse(a[3]));
        auto split =
            CFUND_TRY(engine_.withdraw_partial_funds(caller, id, amount));
        return describe_split(split);
    }

    core::Result<std::string> cmd_surplus(const Args& a) {
        if (a.size() != 3) return usage("surplus <caller> <id>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto split = CFUND_TRY(engine_.withdraw_surplus(caller, id));
        return describe_split(split);
    }

    core::Result<std::string> cmd_milestone(const Args& a) {
        if (a.size() < 4) {
            return usage("milestone <caller> <id> <amt> [description]");
        }
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto amount = CFUND_TRY(Amount::parse(a[3]));
        auto index = CFUND_TRY(
            engine_.add_milestone(caller, id, amount, join(a, 4)));
        return "index=" + std::to_string(index);
    }

    core::Result<std::string> cmd_complete(const Args& a) {
        if (a.size() != 4) return usage("complete <caller> <id> <index>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        const int64_t index = CFUND_TRY(parse_int(a[3]));
        if (index < 0) return usage("complete <caller> <id> <index>");
        auto split = CFUND_TRY(engine_.complete_milestone(
            caller, id, static_cast<size_t>(index)));
        return describe_split(split);
    }

    core::Result<std::string> cmd_goal(const Args& a) {
        if (a.size() != 4) return usage("goal <caller> <id> <amt>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        auto goal = CFUND_TRY(Amount::parse(a[3]));
        CFUND_TRY_VOID(engine_.modify_goal(caller, id, goal));
        return std::string{};
    }

    core::Result<std::string> cmd_extend(const Args& a) {
        if (a.size() != 4) return usage("extend <caller> <id> <days>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        const int64_t days = CFUND_TRY(parse_int(a[3]));
        CFUND_TRY_VOID(engine_.extend_deadline(caller, id, days));
        auto s = CFUND_TRY(engine_.summary(id));
        return "deadline=" + core::format_iso8601(s.campaign.deadline);
    }

    // -- Platform administration --------------------------------------------

    core::Result<std::string> cmd_verify(const Args& a) {
        if (a.size() != 4) return usage("verify <caller> <id> <0|1>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        const bool flag = CFUND_TRY(parse_flag(a[3]));
        CFUND_TRY_VOID(engine_.verify_campaign(caller, id, flag));
        return std::string{};
    }

    core::Result<std::string> cmd_promote(const Args& a) {
        if (a.size() != 4) return usage("promote <caller> <id> <0|1>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        auto id = CFUND_TRY(parse_id(a[2]));
        const bool flag = CFUND_TRY(parse_flag(a[3]));
        CFUND_TRY_VOID(engine_.promote_campaign(caller, id, flag));
        return std::string{};
    }

    core::Result<std::string> cmd_fee(const Args& a) {
        if (a.size() != 3) return usage("fee <caller> <bps>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        const int64_t bps = CFUND_TRY(parse_int(a[2]));
        if (bps < 0 || bps > UINT32_MAX) return usage("fee <caller> <bps>");
        CFUND_TRY_VOID(
            engine_.set_platform_fee(caller, static_cast<uint32_t>(bps)));
        return std::string{};
    }

    core::Result<std::string> cmd_allow_token(const Args& a) {
        if (a.size() != 4) return usage("allow-token <caller> <token> <0|1>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        const bool flag = CFUND_TRY(parse_flag(a[3]));
        CFUND_TRY_VOID(engine_.set_token_allowed(caller, a[2], flag));
        return std::string{};
    }

    core::Result<std::string> cmd_pause(const Args& a) {
        if (a.size() != 2) return usage("pause <caller>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        CFUND_TRY_VOID(gate_.pause(caller));
        return std::string{};
    }

    core::Result<std::string> cmd_unpause(const Args& a) {
        if (a.size() != 2) return usage("unpause <caller>");
        auto caller = CFUND_TRY(AccountId::from_string(a[1]));
        CFUND_TRY_VOID(gate_.unpause(caller));
        return std::string{};
    }

    // -- Queries ------------------------------------------------------------

    core::Result<std::string> cmd_summary(const Args& a) {
        if (a.size() != 2) return usage("summary <id>");
        auto id = CFUND_TRY(parse_id(a[1]));
        auto s = CFUND_TRY(engine_.summary(id));
        const auto& c = s.campaign;

        std::ostringstream ss;
        ss << campaign::campaign_state_string(s.state)
           << " creator=" << c.creator.str()
           << " asset=" << c.asset.to_string()
           << " goal=" << c.goal.to_string()
           << " raised=" << c.raised.to_string()
           << " released=" << c.released.to_string()
           << " custody=" << s.custody.to_string()
           << " fees=" << c.fees_paid.to_string()
           << " backers=" << c.backer_count
           << " milestones=" << c.milestones.size()
           << " deadline=" << core::format_iso8601(c.deadline);
        if (c.cancelled) ss << " sweep_remaining=" << s.sweep_remaining;
        return ss.str();
    }

    core::Result<std::string> cmd_balance(const Args& a) {
        if (a.size() != 3) return usage("balance <account> <asset>");
        auto who = CFUND_TRY(AccountId::from_string(a[1]));
        auto asset = CFUND_TRY(Asset::parse(a[2]));
        return custody_.wallet_balance(asset, who).to_string() +
               " (custody " + custody_.held(asset).to_string() + ")";
    }

    core::Result<std::string> cmd_journal(const Args& a) {
        if (a.size() != 1) return usage("journal");
        if (!engine_.verify_journal()) {
            return core::make_error(core::ErrorCode::INTERNAL_ERROR,
                                    "journal chain does not verify");
        }
        return "events=" + std::to_string(engine_.events().size()) +
               " head=" + crypto::to_hex(engine_.journal_head());
    }

    // -- Persistence --------------------------------------------------------

    core::Result<std::string> cmd_save(const Args& a) {
        if (a.size() != 2) return usage("save <path>");
        CFUND_TRY_VOID(engine_.save_snapshot(a[1]));
        return std::string{};
    }

    core::Result<std::string> cmd_load(const Args& a) {
        if (a.size() != 2) return usage("load <path>");
        CFUND_TRY_VOID(engine_.load_snapshot(a[1]));
        return "campaigns=" + std::to_string(engine_.campaign_count());
    }

    campaign::InMemoryCustody custody_;
    campaign::OwnerAccessGate gate_;
    campaign::SystemClock clock_;
    campaign::CampaignEngine engine_;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config config;
    auto positional = config.parse_args(argc, argv);

    if (auto conf = config.get(core::CONF_CONFIG)) {
        auto parsed = config.parse_file(*conf);
        if (!parsed.ok()) {
            std::cerr << "Error: " << parsed.error().message() << std::endl;
            return EXIT_FAILURE;
        }
    }

    auto engine_config = node::load_engine_config(config);
    if (!engine_config.ok()) {
        std::cerr << "Error: " << engine_config.error().message()
                  << std::endl;
        return EXIT_FAILURE;
    }

    auto logging = node::init_logging(engine_config.value());
    if (!logging.ok()) {
        std::cerr << "Error: " << logging.error().message() << std::endl;
        return EXIT_FAILURE;
    }

    core::MockableClock::set_mock_time(
        config.get_int("time", DEFAULT_START_TIME));

    Simulator sim(engine_config.value(), config.get_bool("events"));

    bool ok = false;
    if (positional.empty()) {
        ok = sim.run(std::cin);
    } else {
        std::ifstream in(positional.front());
        if (!in.is_open()) {
            std::cerr << "Error: cannot open scenario '"
                      << positional.front() << "'" << std::endl;
            return EXIT_FAILURE;
        }
        ok = sim.run(in);
    }

    core::Logger::instance().flush();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
