#include "dal/SessionRepository.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using sso::common::DeviceClass;
using sso::dal::ConnectionPool;
using sso::dal::SessionRepository;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("SSO_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class SessionRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "SSO_DB_URL not set, skipping integration test";
    }
    sso::common::Logger::init("warn");
    _cpPool = std::make_unique<ConnectionPool>(_sDbUrl, 4);
    _srRepo = std::make_unique<SessionRepository>(*_cpPool);

    // Clean test data and ensure a test user exists
    auto cg = _cpPool->checkout();
    pqxx::work txn(*cg);
    txn.exec("DELETE FROM sessions");
    txn.exec("DELETE FROM users");
    auto r = txn.exec(
        "INSERT INTO users (email, password_hash, name) "
        "VALUES ('test@example.com', 'hash', 'Test') RETURNING id");
    _iTestUserId = r.one_row()[0].as<int64_t>();
    txn.commit();
  }

  std::string _sDbUrl;
  std::unique_ptr<ConnectionPool> _cpPool;
  std::unique_ptr<SessionRepository> _srRepo;
  int64_t _iTestUserId = 0;
};

TEST_F(SessionRepositoryTest, CreateThenIsLive) {
  auto sId = _srRepo->create(_iTestUserId, DeviceClass::Web, "Chrome on Linux", "10.1.1.1");
  EXPECT_TRUE(_srRepo->isLive(sId));

  auto vLive = _srRepo->listLive(_iTestUserId);
  ASSERT_EQ(vLive.size(), 1u);
  EXPECT_EQ(vLive[0].sSessionId, sId);
  EXPECT_EQ(vLive[0].eClass, DeviceClass::Web);
  EXPECT_EQ(vLive[0].sDeviceName, "Chrome on Linux");
  EXPECT_EQ(vLive[0].sIpAddress, "10.1.1.1");
}

TEST_F(SessionRepositoryTest, IsLiveFalseForMissingOrNonUuid) {
  EXPECT_FALSE(_srRepo->isLive("00000000-0000-4000-8000-000000000000"));
  EXPECT_FALSE(_srRepo->isLive("not-a-uuid"));
  EXPECT_NO_THROW(_srRepo->revoke("not-a-uuid"));
}

TEST_F(SessionRepositoryTest, SameClassCreateEvictsPrevious) {
  auto sFirst = _srRepo->create(_iTestUserId, DeviceClass::Mobile, "iOS Device", "");
  auto sSecond = _srRepo->create(_iTestUserId, DeviceClass::Mobile, "iOS Device", "");
  EXPECT_FALSE(_srRepo->isLive(sFirst));
  EXPECT_TRUE(_srRepo->isLive(sSecond));
  EXPECT_EQ(_srRepo->listLive(_iTestUserId).size(), 1u);
}

TEST_F(SessionRepositoryTest, ListIsInCreationOrder) {
  auto sDesktop = _srRepo->create(_iTestUserId, DeviceClass::Desktop, "d", "");
  auto sWeb = _srRepo->create(_iTestUserId, DeviceClass::Web, "w", "");

  auto vLive = _srRepo->listLive(_iTestUserId);
  ASSERT_EQ(vLive.size(), 2u);
  EXPECT_EQ(vLive[0].sSessionId, sDesktop);
  EXPECT_EQ(vLive[1].sSessionId, sWeb);
  EXPECT_TRUE(vLive[1].sIpAddress.empty());
}

TEST_F(SessionRepositoryTest, RevokeDeviceAndRevokeAll) {
  auto sWeb = _srRepo->create(_iTestUserId, DeviceClass::Web, "w", "");
  auto sMobile = _srRepo->create(_iTestUserId, DeviceClass::Mobile, "m", "");
  _srRepo->create(_iTestUserId, DeviceClass::Desktop, "d", "");

  EXPECT_FALSE(_srRepo->revokeDevice(_iTestUserId, DeviceClass::Unknown));
  EXPECT_TRUE(_srRepo->revokeDevice(_iTestUserId, DeviceClass::Web));
  EXPECT_FALSE(_srRepo->isLive(sWeb));
  EXPECT_TRUE(_srRepo->isLive(sMobile));

  EXPECT_EQ(_srRepo->revokeAll(_iTestUserId), 2);
  EXPECT_TRUE(_srRepo->listLive(_iTestUserId).empty());
  EXPECT_EQ(_srRepo->revokeAll(_iTestUserId), 0);
}

TEST_F(SessionRepositoryTest, RevokeIsIdempotent) {
  auto sId = _srRepo->create(_iTestUserId, DeviceClass::Web, "w", "");
  _srRepo->revoke(sId);
  _srRepo->revoke(sId);
  EXPECT_FALSE(_srRepo->isLive(sId));
}

TEST_F(SessionRepositoryTest, ExpireAndPurge) {
  auto sId = _srRepo->create(_iTestUserId, DeviceClass::Web, "w", "");
  const auto tpNow = std::chrono::system_clock::now();

  EXPECT_EQ(_srRepo->expireCreatedBefore(tpNow - std::chrono::hours(1)), 0);
  EXPECT_EQ(_srRepo->expireCreatedBefore(tpNow + std::chrono::minutes(1)), 1);
  EXPECT_FALSE(_srRepo->isLive(sId));

  EXPECT_EQ(_srRepo->purgeRevokedBefore(tpNow - std::chrono::hours(1)), 0);
  EXPECT_EQ(_srRepo->purgeRevokedBefore(tpNow + std::chrono::minutes(1)), 1);
}

TEST_F(SessionRepositoryTest, ConcurrentCreatesLeaveExactlyOneLive) {
  const int iThreadCount = 4;
  std::vector<std::string> vIds(iThreadCount * 5);
  std::vector<std::thread> vThreads;
  for (int t = 0; t < iThreadCount; ++t) {
    vThreads.emplace_back([this, t, &vIds]() {
      for (int i = 0; i < 5; ++i) {
        vIds[static_cast<size_t>(t * 5 + i)] =
            _srRepo->create(_iTestUserId, DeviceClass::Web, "w", "");
      }
    });
  }
  for (auto& th : vThreads) {
    th.join();
  }

  int iLive = 0;
  for (const auto& sId : vIds) {
    if (_srRepo->isLive(sId)) ++iLive;
  }
  EXPECT_EQ(iLive, 1);
  EXPECT_EQ(_srRepo->listLive(_iTestUserId).size(), 1u);
}
