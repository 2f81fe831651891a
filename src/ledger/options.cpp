// COMMONIP - Ledger Options Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <commonip/ledger/options.h>
#include <commonip/crypto/sha256.h>

#include <memory>
#include <stdexcept>
#include <sstream>

namespace commonip {
namespace ledger {

namespace {

const char* POOL_LABEL = "commonip.pool";

util::ConfigParseResult KeyError(const util::ConfigManager& config, const std::string& key,
                                 const std::string& message) {
    auto entry = config.GetEntry(key);
    if (entry) {
        return util::ConfigParseResult::Error(key + ": " + message, entry->source,
                                              entry->lineNumber);
    }
    return util::ConfigParseResult::Error(key + ": " + message);
}

/// Read an integer key into `out`; absent keys leave `out` alone
bool ReadInt(const util::ConfigManager& config, const std::string& key, int64_t minimum,
             int64_t& out, util::ConfigParseResult& error) {
    if (!config.HasKey(key)) {
        return true;
    }
    auto value = config.TryGetInt(key);
    if (!value) {
        error = KeyError(config, key, "expected an integer");
        return false;
    }
    if (*value < minimum) {
        error = KeyError(config, key, "must be at least " + std::to_string(minimum));
        return false;
    }
    out = *value;
    return true;
}

bool ReadBps(const util::ConfigManager& config, const std::string& key, uint32_t& out,
             util::ConfigParseResult& error) {
    int64_t value = out;
    if (!ReadInt(config, key, 0, value, error)) {
        return false;
    }
    if (value > BPS_DENOMINATOR) {
        error = KeyError(config, key, "must not exceed " + std::to_string(BPS_DENOMINATOR));
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = util::ConfigManager::Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // anonymous namespace

util::ConfigParseResult LedgerOptions::FromConfig(const util::ConfigManager& config,
                                                  LedgerOptions& out) {
    LedgerOptions options = out;
    util::ConfigParseResult error;

    // Logging
    if (auto level = config.TryGetString("log.level")) {
        options.logLevel = util::LogLevelFromString(*level);
    }
    if (config.HasKey("log.console")) {
        auto console = config.TryGetBool("log.console");
        if (!console) {
            return KeyError(config, "log.console", "expected a boolean");
        }
        options.logToConsole = *console;
    }
    options.logFile = config.GetString("log.file", options.logFile);
    if (auto categories = config.TryGetString("log.categories")) {
        options.logCategories = SplitList(*categories);
    }

    // Pool
    if (auto pool = config.TryGetString("ledger.pooladdress")) {
        try {
            options.poolAddress = Address::FromHex(*pool);
        } catch (const std::invalid_argument& e) {
            return KeyError(config, "ledger.pooladdress", e.what());
        }
    }

    // Asset
    if (!ReadInt(config, "asset.initialsupply", 1, options.initialSupply, error)) {
        return error;
    }

    // License
    license::LicenseOptions& lic = options.license;
    if (!ReadInt(config, "license.approvalfeethreshold", 0, lic.approvalFeeThreshold, error) ||
        !ReadInt(config, "license.royaltyinterval", 1, lic.royaltyInterval, error) ||
        !ReadInt(config, "license.proposalvoting", 1, lic.proposalVotingDuration, error) ||
        !ReadInt(config, "license.proposalexecutionwindow", 1, lic.proposalExecutionWindow,
                 error)) {
        return error;
    }

    // Governance
    governance::GovernanceSettings& gov = options.governance;
    if (!ReadBps(config, "governance.defaultquorum", gov.defaultQuorumBps, error) ||
        !ReadBps(config, "governance.emergencyquorum", gov.emergencyQuorumBps, error) ||
        !ReadBps(config, "governance.licensequorum", gov.licenseQuorumBps, error) ||
        !ReadBps(config, "governance.assetquorum", gov.assetQuorumBps, error) ||
        !ReadBps(config, "governance.revenuequorum", gov.revenueQuorumBps, error) ||
        !ReadInt(config, "governance.votingduration", 1, gov.votingDuration, error) ||
        !ReadInt(config, "governance.emergencyvotingduration", 1, gov.emergencyVotingDuration,
                 error) ||
        !ReadInt(config, "governance.executiondelay", 0, gov.executionDelay, error)) {
        return error;
    }
    Result valid = gov.Validate();
    if (!valid.IsOk()) {
        return util::ConfigParseResult::Error("governance: " + valid.reason);
    }

    out = options;
    LOG_DEBUG(util::LogCategory::CONFIG) << "Ledger options loaded (" << config.Size()
                                         << " keys)";
    return util::ConfigParseResult::Success();
}

Address LedgerOptions::ResolvePoolAddress() const {
    return poolAddress.IsNull() ? AddressFromLabel(POOL_LABEL) : poolAddress;
}

void SetupLogging(const LedgerOptions& options) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(options.logLevel);

    if (options.logToConsole) {
        logger.AddSink(std::make_shared<util::ConsoleSink>(options.logLevel));
    }
    if (!options.logFile.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(options.logFile);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_ERROR(util::LogCategory::CONFIG) << "Cannot open log file " << options.logFile;
        }
    }

    logger.EnableAllCategories();
    for (const auto& category : options.logCategories) {
        logger.EnableCategory(category);
    }
}

} // namespace ledger
} // namespace commonip
