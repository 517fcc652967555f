// SHAREGOV CLI - Command Line Interface
// Copyright (c) 2024 SHAREGOV Developers
// MIT License
//
// sharegov-cli drives a governance engine stored in a LevelDB data
// directory. Each invocation loads the store, runs one command and exits.

#include <sharegov/crypto/sha256.h>
#include <sharegov/db/database.h>
#include <sharegov/governance/engine.h>
#include <sharegov/ledger/access_control.h>
#include <sharegov/ledger/balance_ledger.h>
#include <sharegov/util/config.h>
#include <sharegov/util/logging.h>
#include <sharegov/util/time.h>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sharegov {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "SHAREGOV CLI";

namespace defaults {
    constexpr const char* DATABASE_DIR = "governance";
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* CALLER = "operator";
}

/// Database key of the reference ledger snapshot
const std::string LEDGER_KEY = db::MakeKey(db::prefix::LEDGER, "ledger");

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: sharegov-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -datadir=DIR               Data directory path\n";
    std::cout << "  -caller=ID                 Identity used for privileged commands\n";
    std::cout << "  -operator=ID               Authorized operator (repeatable)\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error\n";
    std::cout << "  -printtoconsole            Also log to the console\n";
    std::cout << "\nLedger:\n";
    std::cout << "  mint <holder> <class> <amount>\n";
    std::cout << "  burn <holder> <class> <amount>\n";
    std::cout << "  transfer <from> <to> <class> <amount>\n";
    std::cout << "  balance <holder> <class>\n";
    std::cout << "\nProposals:\n";
    std::cout << "  create <description> <deadline> [option...]\n";
    std::cout << "  open <id> <start>\n";
    std::cout << "  vote <id> <voter> <yes|no|option>\n";
    std::cout << "  finalize <id>\n";
    std::cout << "  decide <id> [model]\n";
    std::cout << "  proposal <id>\n";
    std::cout << "  results <id>\n";
    std::cout << "  history <id>\n";
    std::cout << "  count\n";
    std::cout << "\nFractions:\n";
    std::cout << "  fraction <asset> <class> <amount> <owner>\n";
    std::cout << "  fractionvote <fraction> <description> <deadline>\n";
    std::cout << "  fractiondecide <fraction> <model>\n";
    std::cout << "  fractions <asset>\n";
    std::cout << "\nLocks:\n";
    std::cout << "  lock <holder> <class> <amount> <unlocktime>\n";
    std::cout << "  unlock <holder> <class> <amount>\n";
    std::cout << "  locks <holder>\n";
    std::cout << "  escrow <class>\n";
    std::cout << "\nEvents:\n";
    std::cout << "  events <kind> [after] [limit]\n";
    std::cout << "\nTimes are unix seconds, ISO 8601, or +N seconds from now.\n";
    std::cout << "Models: simplemajority, supermajority, consensus.\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 SHAREGOV Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

uint64_t ParseUInt(const std::string& str, const char* what) {
    if (str.empty() || str[0] == '-') {
        throw UsageError(std::string("invalid ") + what + ": " + str);
    }
    size_t pos = 0;
    uint64_t value = 0;
    try {
        value = std::stoull(str, &pos);
    } catch (const std::logic_error&) {
        throw UsageError(std::string("invalid ") + what + ": " + str);
    }
    if (pos != str.size()) {
        throw UsageError(std::string("invalid ") + what + ": " + str);
    }
    return value;
}

Amount ParseAmount(const std::string& str) {
    size_t pos = 0;
    Amount value = 0;
    try {
        value = std::stoll(str, &pos);
    } catch (const std::logic_error&) {
        throw UsageError("invalid amount: " + str);
    }
    if (pos != str.size()) {
        throw UsageError("invalid amount: " + str);
    }
    return value;
}

/// Unix seconds, ISO 8601, or +N relative to now
Timestamp ParseTime(const std::string& str) {
    if (!str.empty() && str[0] == '+') {
        return util::GetTime() + static_cast<Timestamp>(ParseUInt(str.substr(1), "offset"));
    }
    if (auto iso = util::ParseISO8601(str)) {
        return *iso;
    }
    return static_cast<Timestamp>(ParseUInt(str, "time"));
}

governance::GovernanceModel ParseModel(const std::string& str) {
    auto model = governance::ParseGovernanceModel(str);
    if (!model) {
        throw UsageError("unknown governance model: " + str);
    }
    return *model;
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw UsageError(std::string("usage: ") + usage);
    }
}

// ============================================================================
// Session
// ============================================================================

/// Open store, ledger and engine for one command
class Session {
public:
    Session(const util::ConfigManager& config, const governance::GovernanceParams& params)
        : config_(config), access_(params.operators.empty()) {
        for (const auto& op : params.operators) {
            access_.Add(op);
        }

        std::filesystem::path dbPath =
            std::filesystem::path(config.GetDataDir()) / defaults::DATABASE_DIR;
        auto [status, database] = db::OpenDatabase(dbPath);
        if (!status.ok()) {
            throw std::runtime_error("cannot open database " + dbPath.string() + ": " +
                                     status.ToString());
        }
        database_ = std::move(database);

        std::string snapshot;
        db::Status ledgerStatus = database_->Get(LEDGER_KEY, &snapshot);
        if (ledgerStatus.ok()) {
            if (!db::DeserializeFromString(snapshot, ledger_)) {
                throw std::runtime_error("ledger snapshot is corrupt");
            }
        } else if (!ledgerStatus.IsNotFound()) {
            throw std::runtime_error("cannot read ledger: " + ledgerStatus.ToString());
        }

        engine_ = std::make_unique<governance::GovernanceEngine>(ledger_, access_, params,
                                                                 database_.get());
        governance::Status loaded = engine_->Load();
        if (!loaded.ok()) {
            throw std::runtime_error("cannot load governance state: " + loaded.ToString());
        }
    }

    /// Write the ledger snapshot back
    void SaveLedger() {
        db::Status status = database_->Put(LEDGER_KEY, db::SerializeToString(ledger_));
        if (!status.ok()) {
            throw std::runtime_error("cannot write ledger: " + status.ToString());
        }
    }

    HolderId Caller() const {
        return config_.GetString("caller", defaults::CALLER);
    }

    ledger::MemoryBalanceLedger& Ledger() { return ledger_; }
    governance::GovernanceEngine& Engine() { return *engine_; }

private:
    const util::ConfigManager& config_;
    ledger::MemoryBalanceLedger ledger_;
    ledger::OperatorRegistry access_;
    std::unique_ptr<db::Database> database_;
    std::unique_ptr<governance::GovernanceEngine> engine_;
};

// ============================================================================
// Commands
// ============================================================================

using Args = std::vector<std::string>;
using Command = std::function<int(Session&, const Args&)>;

int Report(const governance::Status& status) {
    if (!status.ok()) {
        std::cerr << "error: " << status.ToString() << "\n";
        return static_cast<int>(status.code());
    }
    return 0;
}

int CmdMint(Session& session, const Args& args) {
    RequireArgs(args, 3, "mint <holder> <class> <amount>");
    if (!session.Ledger().Mint(args[0], ParseUInt(args[1], "class"), ParseAmount(args[2]))) {
        std::cerr << "error: mint rejected\n";
        return 1;
    }
    session.SaveLedger();
    return 0;
}

int CmdBurn(Session& session, const Args& args) {
    RequireArgs(args, 3, "burn <holder> <class> <amount>");
    if (!session.Ledger().Burn(args[0], ParseUInt(args[1], "class"), ParseAmount(args[2]))) {
        std::cerr << "error: burn rejected\n";
        return 1;
    }
    session.SaveLedger();
    return 0;
}

int CmdTransfer(Session& session, const Args& args) {
    RequireArgs(args, 4, "transfer <from> <to> <class> <amount>");
    if (!session.Ledger().Transfer(args[0], args[1], ParseUInt(args[2], "class"),
                                   ParseAmount(args[3]))) {
        std::cerr << "error: transfer rejected\n";
        return 1;
    }
    session.SaveLedger();
    return 0;
}

int CmdBalance(Session& session, const Args& args) {
    RequireArgs(args, 2, "balance <holder> <class>");
    ShareClassId shareClass = ParseUInt(args[1], "class");
    auto& ledger = session.Ledger();
    std::cout << "balance: " << ledger.BalanceOf(args[0], shareClass) << "\n";
    std::cout << "locked: " << ledger.LockedOf(args[0], shareClass) << "\n";
    std::cout << "spendable: " << ledger.SpendableOf(args[0], shareClass) << "\n";
    return 0;
}

int CmdCreate(Session& session, const Args& args) {
    RequireArgs(args, 2, "create <description> <deadline> [option...]");
    std::vector<std::string> options(args.begin() + 2, args.end());
    auto [status, id] = session.Engine().CreateProposal(session.Caller(), args[0], options,
                                                        ParseTime(args[1]));
    if (!status.ok()) {
        return Report(status);
    }
    std::cout << id << "\n";
    return 0;
}

int CmdOpen(Session& session, const Args& args) {
    RequireArgs(args, 2, "open <id> <start>");
    return Report(session.Engine().OpenVoting(session.Caller(), ParseUInt(args[0], "id"),
                                              ParseTime(args[1])));
}

int CmdVote(Session& session, const Args& args) {
    RequireArgs(args, 3, "vote <id> <voter> <yes|no|option>");
    ProposalId id = ParseUInt(args[0], "id");
    auto [found, proposal] = session.Engine().GetProposal(id);
    if (!found.ok()) {
        return Report(found);
    }

    governance::VoteChoice choice;
    if (proposal.IsMultiOption()) {
        choice = args[2];
    } else if (args[2] == governance::YES_OPTION) {
        choice = true;
    } else if (args[2] == governance::NO_OPTION) {
        choice = false;
    } else {
        throw UsageError("binary proposals take yes or no");
    }

    governance::Status status = session.Engine().CastVote(id, args[1], choice);
    if (!status.ok()) {
        return Report(status);
    }
    auto record = session.Engine().GetVote(id, args[1]);
    if (record) {
        std::cout << "receipt: " << HashToHex(record->GetHash()) << "\n";
    }
    return 0;
}

int CmdFinalize(Session& session, const Args& args) {
    RequireArgs(args, 1, "finalize <id>");
    return Report(session.Engine().Finalize(session.Caller(), ParseUInt(args[0], "id")));
}

int CmdDecide(Session& session, const Args& args) {
    RequireArgs(args, 1, "decide <id> [model]");
    ProposalId id = ParseUInt(args[0], "id");
    auto [status, decision] = args.size() > 1
                                  ? session.Engine().ComputeDecision(id, ParseModel(args[1]))
                                  : session.Engine().ComputeDecision(id);
    if (!status.ok()) {
        return Report(status);
    }
    std::cout << decision.ToString() << "\n";
    std::cout << (decision.passed ? "passed" : "failed") << "\n";
    return 0;
}

int CmdProposal(Session& session, const Args& args) {
    RequireArgs(args, 1, "proposal <id>");
    ProposalId id = ParseUInt(args[0], "id");
    auto [status, proposal] = session.Engine().GetProposal(id);
    if (!status.ok()) {
        return Report(status);
    }
    auto [stateStatus, state] = session.Engine().GetState(id);
    std::cout << proposal.ToString() << "\n";
    if (stateStatus.ok()) {
        std::cout << "state: " << governance::ProposalStateToString(state) << "\n";
    }
    std::cout << "hash: " << HashToHex(proposal.GetHash()) << "\n";
    return 0;
}

int CmdResults(Session& session, const Args& args) {
    RequireArgs(args, 1, "results <id>");
    auto [status, results] = session.Engine().GetResults(ParseUInt(args[0], "id"));
    if (!status.ok()) {
        return Report(status);
    }
    for (const auto& [option, count] : results) {
        std::cout << option << ": " << count << "\n";
    }
    return 0;
}

int CmdHistory(Session& session, const Args& args) {
    RequireArgs(args, 1, "history <id>");
    auto [status, history] = session.Engine().GetVotingHistory(ParseUInt(args[0], "id"));
    if (!status.ok()) {
        return Report(status);
    }
    std::cout << "yes: " << history.yes << "\n";
    std::cout << "no: " << history.no << "\n";
    std::cout << "finalized: " << (history.finalized ? "true" : "false") << "\n";
    return 0;
}

int CmdCount(Session& session, const Args&) {
    std::cout << session.Engine().GetCurrentProposalCount() << "\n";
    return 0;
}

int CmdFraction(Session& session, const Args& args) {
    RequireArgs(args, 4, "fraction <asset> <class> <amount> <owner>");
    auto [status, id] = session.Engine().RegisterFraction(
        session.Caller(), ParseUInt(args[0], "asset"), ParseUInt(args[1], "class"),
        ParseAmount(args[2]), args[3]);
    if (!status.ok()) {
        return Report(status);
    }
    std::cout << id << "\n";
    return 0;
}

int CmdFractionVote(Session& session, const Args& args) {
    RequireArgs(args, 3, "fractionvote <fraction> <description> <deadline>");
    auto [status, id] = session.Engine().CreateFractionVote(
        session.Caller(), ParseUInt(args[0], "fraction"), args[1], ParseTime(args[2]));
    if (!status.ok()) {
        return Report(status);
    }
    std::cout << id << "\n";
    return 0;
}

int CmdFractionDecide(Session& session, const Args& args) {
    RequireArgs(args, 2, "fractiondecide <fraction> <model>");
    auto [status, decision] = session.Engine().ComputeFractionDecision(
        ParseUInt(args[0], "fraction"), ParseModel(args[1]));
    if (!status.ok()) {
        return Report(status);
    }
    std::cout << decision.ToString() << "\n";
    std::cout << (decision.passed ? "passed" : "failed") << "\n";
    return 0;
}

int CmdFractions(Session& session, const Args& args) {
    RequireArgs(args, 1, "fractions <asset>");
    for (const auto& fraction : session.Engine().GetFractionsByAsset(ParseUInt(args[0], "asset"))) {
        std::cout << fraction.ToString() << "\n";
    }
    return 0;
}

int CmdLock(Session& session, const Args& args) {
    RequireArgs(args, 4, "lock <holder> <class> <amount> <unlocktime>");
    governance::Status status = session.Engine().LockTokens(
        args[0], ParseUInt(args[1], "class"), ParseAmount(args[2]), ParseTime(args[3]));
    if (!status.ok()) {
        return Report(status);
    }
    session.SaveLedger();
    return 0;
}

int CmdUnlock(Session& session, const Args& args) {
    RequireArgs(args, 3, "unlock <holder> <class> <amount>");
    governance::Status status = session.Engine().UnlockTokens(
        args[0], ParseUInt(args[1], "class"), ParseAmount(args[2]));
    if (!status.ok()) {
        return Report(status);
    }
    session.SaveLedger();
    return 0;
}

int CmdLocks(Session& session, const Args& args) {
    RequireArgs(args, 1, "locks <holder>");
    for (const auto& record : session.Engine().GetLocks(args[0])) {
        std::cout << record.ToString() << " (until " << util::FormatISO8601(record.unlockTime)
                  << ")\n";
    }
    return 0;
}

int CmdEscrow(Session& session, const Args& args) {
    RequireArgs(args, 1, "escrow <class>");
    std::cout << session.Engine().GetTotalLocked(ParseUInt(args[0], "class")) << "\n";
    return 0;
}

int CmdEvents(Session& session, const Args& args) {
    RequireArgs(args, 1, "events <kind> [after] [limit]");
    auto kind = governance::ParseEventKind(args[0]);
    if (!kind) {
        throw UsageError("unknown event kind: " + args[0]);
    }
    uint64_t after = args.size() > 1 ? ParseUInt(args[1], "sequence") : 0;
    size_t limit = args.size() > 2 ? static_cast<size_t>(ParseUInt(args[2], "limit")) : 0;
    for (const auto& event : session.Engine().GetEvents(*kind, after, limit)) {
        std::cout << util::FormatISO8601(event.timestamp) << " " << event.ToString() << "\n";
    }
    return 0;
}

const std::map<std::string, Command>& GetCommands() {
    static const std::map<std::string, Command> commands = {
        {"mint", CmdMint},
        {"burn", CmdBurn},
        {"transfer", CmdTransfer},
        {"balance", CmdBalance},
        {"create", CmdCreate},
        {"open", CmdOpen},
        {"vote", CmdVote},
        {"finalize", CmdFinalize},
        {"decide", CmdDecide},
        {"proposal", CmdProposal},
        {"results", CmdResults},
        {"history", CmdHistory},
        {"count", CmdCount},
        {"fraction", CmdFraction},
        {"fractionvote", CmdFractionVote},
        {"fractiondecide", CmdFractionDecide},
        {"fractions", CmdFractions},
        {"lock", CmdLock},
        {"unlock", CmdUnlock},
        {"locks", CmdLocks},
        {"escrow", CmdEscrow},
        {"events", CmdEvents},
    };
    return commands;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error parsing command line: " << parsed.errorMessage << "\n";
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    const auto& positional = config.GetArgs();
    if (positional.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'sharegov-cli -help' for usage information.\n";
        return 1;
    }

    // Config file: explicit -conf must exist, the default one is optional
    std::string confPath = config.GetPath(util::ConfigKeys::CONF);
    if (confPath.empty()) {
        std::filesystem::path defaultConf =
            std::filesystem::path(config.GetDataDir()) / util::DEFAULT_CONFIG_FILENAME;
        if (std::filesystem::exists(defaultConf)) {
            confPath = defaultConf.string();
        }
    }
    if (!confPath.empty()) {
        parsed = config.ParseFile(confPath);
        if (!parsed.success) {
            std::cerr << "Error reading config file " << parsed.errorFile << ":"
                      << parsed.errorLine << ": " << parsed.errorMessage << "\n";
            return 1;
        }
    }

    std::filesystem::create_directories(config.GetDataDir());

    util::LogOptions logOptions = util::GetLogOptions(config);
    if (logOptions.logFile.empty()) {
        logOptions.logFile =
            (std::filesystem::path(config.GetDataDir()) / defaults::LOG_FILENAME).string();
    }
    util::ConfigureLogging(logOptions);

    governance::GovernanceParams params;
    parsed = governance::GovernanceParams::FromConfig(config, params);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    const std::string& method = positional.front();
    auto it = GetCommands().find(method);
    if (it == GetCommands().end()) {
        std::cerr << "Error: Unknown command '" << method << "'.\n";
        std::cerr << "Use 'sharegov-cli -help' for usage information.\n";
        return 1;
    }

    LOG_DEBUG(util::LogCategory::CLI) << "Running " << method << " with " << params.ToString();

    Session session(config, params);
    Args args(positional.begin() + 1, positional.end());
    try {
        return it->second(session, args);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace cli
} // namespace sharegov

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return sharegov::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
