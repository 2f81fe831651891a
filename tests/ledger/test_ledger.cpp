// COMMONIP - Collective Ledger Tests
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include <gtest/gtest.h>

#include <commonip/crypto/sha256.h>
#include <commonip/ledger/ledger.h>
#include <commonip/ledger/options.h>
#include <commonip/util/config.h>
#include <commonip/util/logging.h>
#include <commonip/util/time.h>

#include <cstdio>
#include <memory>

namespace commonip {
namespace ledger {
namespace {

constexpr int64_t T0 = 1700000000;

// ============================================================================
// End-to-end Flows
// ============================================================================

class CollectiveLedgerTest : public ::testing::Test {
protected:
    CollectiveLedgerTest()
        : admin_(AddressFromLabel("admin")),
          alice_(AddressFromLabel("alice")),
          bob_(AddressFromLabel("bob")),
          carol_(AddressFromLabel("carol")),
          payer_(AddressFromLabel("payer")),
          licensee_(AddressFromLabel("licensee")),
          usd_(std::make_shared<token::MemoryPaymentLedger>("USD")),
          ledger_(admin_) {}

    void SetUp() override {
        util::SetMockTime(T0);
        ledger_.AddCurrency(usd_);
        for (const Address& who : {payer_, licensee_}) {
            ASSERT_TRUE(usd_->Mint(who, 100000).IsOk());
            ASSERT_TRUE(usd_->Approve(who, ledger_.PoolAddress(), 100000).IsOk());
        }
    }

    void TearDown() override { util::DisableMockTime(); }

    AssetId Register() {
        Result r = ledger_.Assets().RegisterAsset(alice_, "patent", "ipfs://design-v1",
                                                  {alice_, bob_, carol_}, {60, 30, 10},
                                                  {600, 300, 100});
        EXPECT_TRUE(r.IsOk()) << r.ToString();
        return r.id;
    }

    const CurrencyId& USD() const { return usd_->Id(); }

    Address admin_;
    Address alice_;
    Address bob_;
    Address carol_;
    Address payer_;
    Address licensee_;
    std::shared_ptr<token::MemoryPaymentLedger> usd_;
    CollectiveLedger ledger_;
};

TEST_F(CollectiveLedgerTest, DefaultPoolAddress) {
    EXPECT_EQ(ledger_.PoolAddress(), AddressFromLabel("commonip.pool"));
    EXPECT_TRUE(ledger_.Payments().Has(USD()));
    EXPECT_EQ(ledger_.Guard().Admin(), admin_);
}

TEST_F(CollectiveLedgerTest, ShareTransferThenDistribution) {
    AssetId asset = Register();
    EXPECT_EQ(ledger_.AssetTokens().BalanceOf(alice_, asset), 600);

    auto& owners = ledger_.Ownership();
    ASSERT_TRUE(owners.TransferShare(alice_, asset, alice_, bob_, 10).IsOk());
    EXPECT_EQ(owners.GetPercentage(asset, alice_), 50u);
    EXPECT_EQ(owners.GetPercentage(asset, bob_), 40u);
    EXPECT_EQ(owners.GetGovernanceWeight(asset, alice_), 500u);
    EXPECT_EQ(owners.GetGovernanceWeight(asset, bob_), 400u);

    auto& pool = ledger_.Revenue();
    ASSERT_TRUE(pool.ReceiveRevenue(payer_, asset, USD(), 1000).IsOk());
    ASSERT_TRUE(pool.DistributeRevenue(carol_, asset, USD(), 1000).IsOk());
    EXPECT_EQ(pool.GetPending(asset, alice_, USD()), 500);
    EXPECT_EQ(pool.GetPending(asset, bob_, USD()), 400);
    EXPECT_EQ(pool.GetPending(asset, carol_, USD()), 100);
    EXPECT_EQ(pool.GetAccumulated(asset, USD()), 0);

    ASSERT_TRUE(pool.WithdrawPendingRevenue(bob_, asset, USD()).IsOk());
    EXPECT_EQ(usd_->BalanceOf(bob_), 400);
    EXPECT_EQ(usd_->BalanceOf(ledger_.PoolAddress()), 600);
}

TEST_F(CollectiveLedgerTest, LicenseFeeAndRoyalties) {
    AssetId asset = Register();
    auto& licenses = ledger_.Licenses();

    license::LicenseOffer offer;
    offer.licensee = licensee_;
    offer.type = license::LicenseType::NonExclusive;
    offer.fee = 1000;
    offer.royaltyBps = 500;
    offer.currency = USD();
    offer.termsUri = "ipfs://terms";

    Result created = licenses.CreateOffer(alice_, asset, offer);
    ASSERT_TRUE(created.IsOk()) << created.ToString();
    ASSERT_TRUE(licenses.Approve(bob_, created.id, true).IsOk());
    ASSERT_TRUE(licenses.Execute(licensee_, created.id).IsOk());

    ASSERT_TRUE(licenses.ReportUsage(licensee_, created.id, 10000, 1).IsOk());
    EXPECT_EQ(licenses.DueRoyalties(created.id), 500);
    ASSERT_TRUE(licenses.PayRoyalties(licensee_, created.id, 500).IsOk());

    auto& pool = ledger_.Revenue();
    EXPECT_EQ(pool.GetPending(asset, alice_, USD()), 900);
    EXPECT_EQ(pool.GetPending(asset, bob_, USD()), 450);
    EXPECT_EQ(pool.GetPending(asset, carol_, USD()), 150);
    EXPECT_EQ(usd_->BalanceOf(ledger_.PoolAddress()), 1500);
}

TEST_F(CollectiveLedgerTest, GovernanceChangesMetadata) {
    AssetId asset = Register();
    auto& governance = ledger_.Governance();

    governance::GovernanceSettings settings;
    settings.assetQuorumBps = 6000;
    ASSERT_TRUE(governance.SetGovernanceSettings(alice_, asset, settings).IsOk());

    governance::AssetManagementChange change;
    change.metadataUri = "ipfs://design-v2";
    Result created = governance.CreateProposal(bob_, asset,
                                               governance::ProposalCategory::AssetManagement,
                                               change, 0, "publish v2");
    ASSERT_TRUE(created.IsOk()) << created.ToString();
    auto proposal = governance.GetProposal(created.id);
    EXPECT_EQ(proposal->quorum, 600u);

    ASSERT_TRUE(governance.Vote(alice_, created.id, true).IsOk());
    ASSERT_TRUE(governance.Vote(bob_, created.id, true).IsOk());

    EXPECT_EQ(governance.ExecuteAssetManagement(carol_, created.id).code,
              ErrorCode::VOTING_NOT_ENDED);
    util::SetMockTime(proposal->votingDeadline + 1);
    ASSERT_TRUE(governance.ExecuteAssetManagement(carol_, created.id).IsOk());
    EXPECT_EQ(ledger_.Assets().GetAsset(asset)->metadataUri, "ipfs://design-v2");
}

TEST_F(CollectiveLedgerTest, PauseBlocksEveryComponent) {
    AssetId asset = Register();
    ASSERT_TRUE(ledger_.Revenue().ReceiveRevenue(payer_, asset, USD(), 1000).IsOk());
    ASSERT_TRUE(ledger_.Guard().Pause(admin_, "incident").IsOk());

    EXPECT_EQ(ledger_.Assets().UpdateMetadata(alice_, asset, "x").code,
              ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(ledger_.Ownership().TransferShare(alice_, asset, alice_, bob_, 5).code,
              ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(ledger_.Revenue().DistributeAllRevenue(alice_, asset, USD()).code,
              ErrorCode::SYSTEM_PAUSED);
    license::LicenseOffer offer;
    offer.licensee = licensee_;
    EXPECT_EQ(ledger_.Licenses().CreateOffer(alice_, asset, offer).code,
              ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(ledger_.Governance()
                  .SetGovernanceSettings(alice_, asset, governance::GovernanceSettings{})
                  .code,
              ErrorCode::SYSTEM_PAUSED);

    // Reads keep working
    EXPECT_EQ(ledger_.Revenue().GetAccumulated(asset, USD()), 1000);
    EXPECT_EQ(ledger_.Ownership().GetPercentage(asset, alice_), 60u);

    ASSERT_TRUE(ledger_.Guard().Unpause(admin_).IsOk());
    EXPECT_TRUE(ledger_.Revenue().DistributeAllRevenue(alice_, asset, USD()).IsOk());
}

TEST_F(CollectiveLedgerTest, CallbackCannotReenterAnotherComponent) {
    AssetId asset = Register();

    Result fromLicenses;
    Result fromGovernance;
    usd_->SetTransferHook([&](const Address& from, const Address&, Amount) {
        if (from != payer_) {
            return;
        }
        license::LicenseOffer offer;
        offer.licensee = payer_;
        fromLicenses = ledger_.Licenses().CreateOffer(alice_, asset, offer);
        fromGovernance = ledger_.Governance().SetGovernanceSettings(
            alice_, asset, governance::GovernanceSettings{});
    });

    ASSERT_TRUE(ledger_.Revenue().ReceiveRevenue(payer_, asset, USD(), 1000).IsOk());
    EXPECT_EQ(fromLicenses.code, ErrorCode::REENTRANT_CALL);
    EXPECT_EQ(fromGovernance.code, ErrorCode::REENTRANT_CALL);
    EXPECT_EQ(ledger_.Licenses().GetLicenseCount(), 0u);
    EXPECT_FALSE(ledger_.Settings().HasOverride(asset));
    EXPECT_EQ(ledger_.Revenue().GetAccumulated(asset, USD()), 1000);
}

TEST_F(CollectiveLedgerTest, JournalOrdersEvents) {
    AssetId asset = Register();
    ASSERT_TRUE(ledger_.Revenue().ReceiveRevenue(payer_, asset, USD(), 1000).IsOk());

    const auto& journal = ledger_.Journal();
    auto events = journal.GetEventsForAsset(asset);
    ASSERT_GE(events.size(), 2u);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_LT(events[i - 1].sequence, events[i].sequence);
    }
    EXPECT_EQ(events.back().type, EventType::RevenueReceived);
    EXPECT_EQ(events.back().amount, 1000);
}

TEST(CollectiveLedgerOptionsTest, OptionsReachComponents) {
    util::SetMockTime(T0);
    Address admin = AddressFromLabel("admin");
    Address alice = AddressFromLabel("alice");
    Address bob = AddressFromLabel("bob");

    LedgerOptions options;
    options.poolAddress = AddressFromLabel("custom-pool");
    options.initialSupply = 10000;
    options.license.approvalFeeThreshold = 2000;
    options.governance.votingDuration = util::SECONDS_PER_WEEK;

    auto tokens = std::make_shared<token::MemoryAssetTokenLedger>();
    CollectiveLedger ledger(admin, tokens, options);
    auto usd = std::make_shared<token::MemoryPaymentLedger>("USD");
    ledger.AddCurrency(usd);
    EXPECT_EQ(ledger.PoolAddress(), AddressFromLabel("custom-pool"));

    Result registered = ledger.Assets().RegisterAsset(alice, "music", "ipfs://song",
                                                      {alice, bob}, {75, 25}, {3, 1});
    ASSERT_TRUE(registered.IsOk());
    EXPECT_EQ(tokens->BalanceOf(alice, registered.id), 7500);
    EXPECT_EQ(tokens->BalanceOf(bob, registered.id), 2500);

    license::LicenseOffer offer;
    offer.licensee = AddressFromLabel("licensee");
    offer.fee = 1500;
    offer.currency = usd->Id();
    Result created = ledger.Licenses().CreateOffer(alice, registered.id, offer);
    ASSERT_TRUE(created.IsOk());
    EXPECT_FALSE(ledger.Licenses().GetLicense(created.id)->requiresApproval);

    governance::AssetManagementChange change;
    change.complianceStatus = "approved";
    Result proposal = ledger.Governance().CreateProposal(
        bob, registered.id, governance::ProposalCategory::AssetManagement, change, 0, "");
    ASSERT_TRUE(proposal.IsOk());
    EXPECT_EQ(ledger.Governance().GetProposal(proposal.id)->votingDeadline,
              T0 + util::SECONDS_PER_WEEK);
    util::DisableMockTime();
}

// ============================================================================
// Options
// ============================================================================

class LedgerOptionsTest : public ::testing::Test {
protected:
    util::ConfigParseResult Load(const std::string& text, LedgerOptions& out) {
        util::ConfigParseResult parsed = config_.ParseString(text, "ledger.conf");
        EXPECT_TRUE(parsed.success) << parsed.errorMessage;
        return LedgerOptions::FromConfig(config_, out);
    }

    util::ConfigManager config_;
};

TEST_F(LedgerOptionsTest, EmptyConfigKeepsDefaults) {
    LedgerOptions options;
    ASSERT_TRUE(Load("", options).success);
    EXPECT_TRUE(options.poolAddress.IsNull());
    EXPECT_EQ(options.initialSupply, asset::DEFAULT_INITIAL_SUPPLY);
    EXPECT_EQ(options.license.approvalFeeThreshold, license::DEFAULT_APPROVAL_FEE_THRESHOLD);
    EXPECT_EQ(options.governance, governance::GovernanceSettings{});
    EXPECT_EQ(options.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(options.logToConsole);
}

TEST_F(LedgerOptionsTest, ReadsEverySection) {
    Address pool = AddressFromLabel("pool");
    std::string text =
        "[log]\n"
        "level=debug\n"
        "console=no\n"
        "file=/tmp/commonip.log\n"
        "categories=revenue, license,,governance\n"
        "[ledger]\n"
        "pooladdress=" + pool.ToHex() + "\n"
        "[asset]\n"
        "initialsupply=5000\n"
        "[license]\n"
        "approvalfeethreshold=750\n"
        "royaltyinterval=7d\n"
        "proposalvoting=2d\n"
        "proposalexecutionwindow=12h\n"
        "[governance]\n"
        "defaultquorum=6000\n"
        "emergencyquorum=2500\n"
        "licensequorum=4500\n"
        "assetquorum=5500\n"
        "revenuequorum=6500\n"
        "votingduration=5d\n"
        "emergencyvotingduration=6h\n"
        "executiondelay=2h\n";

    LedgerOptions options;
    auto result = Load(text, options);
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(options.logLevel, util::LogLevel::Debug);
    EXPECT_FALSE(options.logToConsole);
    EXPECT_EQ(options.logFile, "/tmp/commonip.log");
    ASSERT_EQ(options.logCategories.size(), 3u);
    EXPECT_EQ(options.logCategories[1], "license");

    EXPECT_EQ(options.poolAddress, pool);
    EXPECT_EQ(options.ResolvePoolAddress(), pool);
    EXPECT_EQ(options.initialSupply, 5000);

    EXPECT_EQ(options.license.approvalFeeThreshold, 750);
    EXPECT_EQ(options.license.royaltyInterval, 7 * util::SECONDS_PER_DAY);
    EXPECT_EQ(options.license.proposalVotingDuration, 2 * util::SECONDS_PER_DAY);
    EXPECT_EQ(options.license.proposalExecutionWindow, 12 * util::SECONDS_PER_HOUR);

    const auto& gov = options.governance;
    EXPECT_EQ(gov.defaultQuorumBps, 6000u);
    EXPECT_EQ(gov.emergencyQuorumBps, 2500u);
    EXPECT_EQ(gov.licenseQuorumBps, 4500u);
    EXPECT_EQ(gov.assetQuorumBps, 5500u);
    EXPECT_EQ(gov.revenueQuorumBps, 6500u);
    EXPECT_EQ(gov.votingDuration, 5 * util::SECONDS_PER_DAY);
    EXPECT_EQ(gov.emergencyVotingDuration, 6 * util::SECONDS_PER_HOUR);
    EXPECT_EQ(gov.executionDelay, 2 * util::SECONDS_PER_HOUR);
}

TEST_F(LedgerOptionsTest, BadIntegerNamesKeyAndLine) {
    LedgerOptions options;
    options.initialSupply = 42;
    auto result = Load("[asset]\ninitialsupply=lots\n", options);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "asset.initialsupply: expected an integer");
    EXPECT_EQ(result.errorSource, "ledger.conf");
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(options.initialSupply, 42);
}

TEST_F(LedgerOptionsTest, RangeChecks) {
    LedgerOptions options;
    auto result = Load("[license]\nroyaltyinterval=0\n", options);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "license.royaltyinterval: must be at least 1");

    util::ConfigManager bps;
    ASSERT_TRUE(bps.ParseString("[governance]\nassetquorum=10001\n").success);
    result = LedgerOptions::FromConfig(bps, options);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "governance.assetquorum: must not exceed 10000");
    EXPECT_EQ(options.governance.assetQuorumBps, governance::DEFAULT_ASSET_QUORUM_BPS);
}

TEST_F(LedgerOptionsTest, InvalidCombinationRejected) {
    LedgerOptions options;
    auto result = Load("[governance]\nemergencyquorum=9000\n", options);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage.find("governance: "), 0u);
    EXPECT_EQ(options.governance.emergencyQuorumBps, governance::DEFAULT_EMERGENCY_QUORUM_BPS);
}

TEST_F(LedgerOptionsTest, BadPoolAddressOrBoolean) {
    LedgerOptions options;
    auto result = Load("[ledger]\npooladdress=xyz\n", options);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage.find("ledger.pooladdress: "), 0u);

    util::ConfigManager console;
    ASSERT_TRUE(console.ParseString("[log]\nconsole=maybe\n").success);
    result = LedgerOptions::FromConfig(console, options);
    ASSERT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "log.console: expected a boolean");
    EXPECT_TRUE(options.logToConsole);
}

// ============================================================================
// Logging Setup
// ============================================================================

class SetupLoggingTest : public ::testing::Test {
protected:
    void SetUp() override { path_ = ::testing::TempDir() + "commonip_setup_logging.log"; }

    void TearDown() override {
        auto& logger = util::Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(util::LogLevel::Info);
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(SetupLoggingTest, FileSinkAndCategories) {
    LedgerOptions options;
    options.logLevel = util::LogLevel::Warn;
    options.logToConsole = false;
    options.logFile = path_;
    options.logCategories = {"revenue"};

    SetupLogging(options);
    auto& logger = util::Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);
    EXPECT_EQ(logger.GetLevel(), util::LogLevel::Warn);
    EXPECT_TRUE(logger.IsCategoryEnabled("revenue"));
    EXPECT_FALSE(logger.IsCategoryEnabled("license"));
    EXPECT_FALSE(logger.WillLog(util::LogLevel::Info, "revenue"));
}

TEST_F(SetupLoggingTest, UnopenableFileIsSkipped) {
    LedgerOptions options;
    options.logToConsole = true;
    options.logFile = "/nonexistent-dir/commonip.log";

    SetupLogging(options);
    EXPECT_EQ(util::Logger::Instance().SinkCount(), 1u);
    EXPECT_TRUE(util::Logger::Instance().IsCategoryEnabled("license"));
}

} // anonymous namespace
} // namespace ledger
} // namespace commonip
