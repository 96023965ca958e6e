#include <gtest/gtest.h>
#include <sstream>
#include "AdminSession.hpp"
#include "LedgerTestUtils.hpp"
#include "QuotaLedger.hpp"

using namespace std;

class AdminSessionTest : public LedgerDbTest {
protected:
    void SetUp() override {
        LedgerDbTest::SetUp();
        ledger_ = make_unique<QuotaLedger>(*logger_, cfg_);
    }

    // Run one script and return the reply lines.
    vector<string> run(const string &script) {
        istringstream in(script);
        ostringstream out;
        AdminSession session(in, out, *ledger_, *db_, *logger_);
        session.run();

        vector<string> lines;
        istringstream replies(out.str());
        string line;
        while (getline(replies, line)) lines.push_back(line);
        return lines;
    }

    unique_ptr<QuotaLedger> ledger_;
};

TEST_F(AdminSessionTest, QuotaCommands) {
    auto lines = run("QUOTA_SET p1 volumes 10\n"
                     "QUOTA_GET p1 volumes\n"
                     "QUOTA_GET p1 gigabytes\n"
                     "CLASS_SET default gigabytes 1000\n"
                     "QUOTA_GET p1\n"
                     "QUOTA_DELETE p1 volumes\n"
                     "QUOTA_DELETE p1 volumes\n");
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[0], "OK 200 volumes=10");
    EXPECT_EQ(lines[1], "OK 200 volumes=10");
    EXPECT_EQ(lines[2].substr(0, 7), "ERR 404");
    EXPECT_EQ(lines[3], "OK 200 default:gigabytes=1000");
    EXPECT_NE(lines[4].find("gigabytes=1000"), string::npos);
    EXPECT_NE(lines[4].find("volumes=10"), string::npos);
    EXPECT_NE(lines[4].find("backups=-1"), string::npos);
    EXPECT_EQ(lines[5], "OK 200 Deleted");
    EXPECT_EQ(lines[6].substr(0, 7), "ERR 404");
}

TEST_F(AdminSessionTest, ClassCommands) {
    auto lines = run("CLASS_SET gold volumes 40\n"
                     "CLASS_SET gold gigabytes 400\n"
                     "CLASS_GET gold volumes\n"
                     "CLASS_GET gold\n"
                     "CLASS_DELETE gold volumes\n"
                     "CLASS_DELETE gold volumes\n"
                     "CLASS_GET gold volumes\n"
                     "CLASS_DELETE gold\n"
                     "CLASS_GET gold\n"
                     "CLASS_GET\n");
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_EQ(lines[2], "OK 200 volumes=40");
    EXPECT_EQ(lines[3], "OK 200 gigabytes=400 volumes=40");
    EXPECT_EQ(lines[4], "OK 200 Deleted");
    EXPECT_EQ(lines[5].substr(0, 7), "ERR 404");
    EXPECT_EQ(lines[6].substr(0, 7), "ERR 404");
    EXPECT_EQ(lines[7], "OK 200 Deleted");
    EXPECT_EQ(lines[8], "OK 200");
    EXPECT_EQ(lines[9].substr(0, 7), "ERR 400");
}

TEST_F(AdminSessionTest, QuotaDeleteWholeProject) {
    auto lines = run("QUOTA_SET p1 volumes 10\n"
                     "RESERVE p1 volumes=2\n"
                     "QUOTA_DELETE p1\n"
                     "USAGE p1\n"
                     "QUOTA_DELETE p2\n");
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[2], "OK 200 Deleted");
    EXPECT_EQ(lines[3], "OK 200");
    EXPECT_EQ(lines[4], "OK 200 Deleted");
}

TEST_F(AdminSessionTest, ReserveCommitAndOverQuota) {
    auto lines = run("QUOTA_SET p1 volumes 10\n"
                     "RESERVE p1 volumes=3\n");
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[1].substr(0, 7), "OK 200 ");
    string id = lines[1].substr(7);
    EXPECT_EQ(id.size(), 36u);

    lines = run("COMMIT p1 " + id + "\n"
                "USAGE p1\n"
                "RESERVE p1 volumes=8\n"
                "RESERVE p1 volumes=7\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "OK 200 Committed");
    EXPECT_EQ(lines[1], "OK 200 volumes=3/0");
    EXPECT_EQ(lines[2].substr(0, 8), "ERR 413 ");
    EXPECT_NE(lines[2].find("volumes"), string::npos);
    ASSERT_EQ(lines[3].substr(0, 7), "OK 200 ");

    lines = run("ROLLBACK p1 " + lines[3].substr(7) + "\nUSAGE p1\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "OK 200 Rolled back");
    EXPECT_EQ(lines[1], "OK 200 volumes=3/0");
}

TEST_F(AdminSessionTest, ExpireAndQuit) {
    auto lines = run("EXPIRE\nQUIT\nUSAGE p1\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "OK 200 Expired 0");
    EXPECT_EQ(lines[1], "OK 200 Bye");
}

TEST_F(AdminSessionTest, MalformedCommands) {
    auto lines = run("\n"
                     "FROB\n"
                     "QUOTA_SET p1 volumes lots\n"
                     "QUOTA_SET p1 volumes -5\n"
                     "RESERVE p1\n"
                     "RESERVE p1 volumes\n"
                     "RESERVE p1 volumes=1 volumes=2\n"
                     "RESERVE p1 teapots=1\n"
                     "COMMIT p1\n"
                     "USAGE\n");
    ASSERT_EQ(lines.size(), 10u);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i == 7) {
            EXPECT_EQ(lines[i].substr(0, 7), "ERR 404") << lines[i];
        } else {
            EXPECT_EQ(lines[i].substr(0, 7), "ERR 400") << lines[i];
        }
    }
}
