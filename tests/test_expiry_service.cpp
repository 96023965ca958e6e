#include <gtest/gtest.h>
#include "ExpiryService.hpp"
#include "LedgerTestUtils.hpp"

using namespace std;

class ExpiryServiceTest : public LedgerDbTest {};

TEST_F(ExpiryServiceTest, SweepReleasesExpiredReservations) {
    ExpiryService service(cfg_);
    string err;
    ASSERT_TRUE(service.init(err)) << err;

    ReserveRequest req;
    ASSERT_EQ(service.ledger().build_request(service.db(), "p1", {{"gigabytes", 4}}, req, err),
              DbStatus::Ok)
        << err;
    req.expire = utils::now() - chrono::seconds(30);
    vector<string> ids;
    OverQuota over;
    ASSERT_EQ(service.ledger().reserve(service.db(), req, ids, over, err), DbStatus::Ok) << err;

    EXPECT_EQ(service.run_once(), 1);
    EXPECT_EQ(service.run_once(), 0);
    EXPECT_EQ(service.sweeps(), 2u);
    EXPECT_EQ(service.expired_total(), 1u);

    QuotaUsageRecord usage;
    ASSERT_EQ(service.ledger().get_usage(*db_, "p1", "gigabytes", usage, err), DbStatus::Ok);
    EXPECT_EQ(usage.reserved, 0);
}

TEST_F(ExpiryServiceTest, StopBeforeRunDoesNothing) {
    ExpiryService service(cfg_);
    string err;
    ASSERT_TRUE(service.init(err)) << err;

    service.stop();
    EXPECT_TRUE(service.stopping());
    service.run();
    EXPECT_EQ(service.sweeps(), 0u);
}

TEST_F(ExpiryServiceTest, UnopenableStoreFailsInit) {
    LedgerConfig cfg = cfg_;
    cfg.db_path = (dir_ / "missing" / "ledger.db").string();
    ExpiryService service(cfg);
    string err;
    EXPECT_FALSE(service.init(err));
    EXPECT_FALSE(err.empty());
}
