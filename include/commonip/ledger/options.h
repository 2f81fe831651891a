// COMMONIP - Ledger Options
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Tunable defaults of a CollectiveLedger, loadable from an INI-style
// configuration:
//
//   [log]
//   level=debug
//   file=/var/log/commonip.log
//
//   [license]
//   approvalfeethreshold=500
//   royaltyinterval=30d
//
//   [governance]
//   defaultquorum=5000
//   executiondelay=1d

#ifndef COMMONIP_LEDGER_OPTIONS_H
#define COMMONIP_LEDGER_OPTIONS_H

#include <commonip/asset/asset.h>
#include <commonip/core/types.h>
#include <commonip/governance/settings.h>
#include <commonip/license/license.h>
#include <commonip/util/config.h>
#include <commonip/util/logging.h>

#include <string>
#include <vector>

namespace commonip {
namespace ledger {

struct LedgerOptions {
    /// Address holding pooled funds on every payment ledger; null selects
    /// the address derived from "commonip.pool"
    Address poolAddress;

    Amount initialSupply{asset::DEFAULT_INITIAL_SUPPLY};

    license::LicenseOptions license;

    /// Settings of assets without their own override
    governance::GovernanceSettings governance;

    util::LogLevel logLevel{util::LogLevel::Info};
    bool logToConsole{true};
    std::string logFile;
    std::vector<std::string> logCategories;

    /**
     * Read options from parsed configuration. On error `out` is left
     * unchanged and the result names the offending key.
     */
    static util::ConfigParseResult FromConfig(const util::ConfigManager& config,
                                              LedgerOptions& out);

    /// Pool address with the default applied
    Address ResolvePoolAddress() const;
};

/// Configure the global logger from options
void SetupLogging(const LedgerOptions& options);

} // namespace ledger
} // namespace commonip

#endif // COMMONIP_LEDGER_OPTIONS_H
