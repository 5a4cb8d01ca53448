#include <gtest/gtest.h>
#include "core/description_fetcher.hpp"
#include "core/netcast_scanner.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <thread>

using namespace testing_fakes;

// Every request hangs for the full delay and then fails like a timeout.
class SlowRequester : public HttpRequester {
public:
    explicit SlowRequester(std::chrono::milliseconds delay) : m_delay(delay) {}

    bool request(const std::string&, const std::string&, const std::vector<std::string>&,
                 const std::string&, HttpResponse&, std::string& outError) override {
        std::this_thread::sleep_for(m_delay);
        outError = "Operation timed out";
        return false;
    }

private:
    std::chrono::milliseconds m_delay;
};

static const char* MOVED_LOCATION = "http://192.168.1.240:1914/udap/api/data?target=netrcu.xml";

class NetcastScannerTest : public ::testing::Test {
protected:
    FakeNetwork network;
    FakeRequester requester;
    DescriptionFetcher fetcher{&requester};

    ScannerOptions fastOptions(int attempts = 3, int intervalMs = 20) {
        ScannerOptions options;
        options.attempts = attempts;
        options.searchIntervalMs = intervalMs;
        return options;
    }

    std::unique_ptr<NetcastScanner> makeScanner(std::vector<NetworkAdapter> adapters,
                                                ScannerOptions options) {
        return std::make_unique<NetcastScanner>(options, &fetcher, network.factory(),
                                                fixedAdapters(std::move(adapters)));
    }

    std::unique_ptr<NetcastScanner> makeDefaultScanner() {
        return makeScanner({adapter("eth0", {"192.168.1.5"}, true, true)}, fastOptions());
    }
};

TEST_F(NetcastScannerTest, DefaultInterfaceBindsOneWildcardListener) {
    auto scanner = makeDefaultScanner();
    scanner->setup();

    EXPECT_EQ(scanner->activeListenerCount(), 1u);
    EXPECT_EQ(network.created, std::vector<std::string>{netcast::WILDCARD_SOURCE});
}

TEST_F(NetcastScannerTest, FailedListenerIsDroppedOthersSurvive) {
    network.failingSources = {"1.2.3.4"};
    auto scanner = makeScanner({
        adapter("eth0", {"192.168.1.5"}, false, true),
        adapter("tun0", {"1.2.3.4"}, false, true),
    }, fastOptions());

    scanner->setup();

    EXPECT_EQ(scanner->activeListenerCount(), 1u);
    EXPECT_EQ(network.started, std::vector<std::string>{"192.168.1.5"});
    EXPECT_EQ(network.searches, std::vector<std::string>{"192.168.1.5"});
}

TEST_F(NetcastScannerTest, ThrowingListenerDoesNotEscapeSetup) {
    network.throwOnStart = true;
    auto scanner = makeDefaultScanner();

    EXPECT_NO_THROW(scanner->setup());
    EXPECT_EQ(scanner->activeListenerCount(), 0u);
    EXPECT_TRUE(scanner->discover().empty());
}

TEST_F(NetcastScannerTest, SetupIsIdempotent) {
    auto scanner = makeDefaultScanner();

    scanner->setup();
    scanner->setup();
    scanner->discover();

    EXPECT_EQ(network.count(network.created), 1u);
    EXPECT_EQ(network.count(network.started), 1u);
}

TEST_F(NetcastScannerTest, ConcurrentSetupBindsOnce) {
    auto scanner = makeScanner({
        adapter("eth0", {"192.168.1.5"}, false, true),
        adapter("wlan0", {"10.0.0.5"}, false, true),
    }, fastOptions());

    std::thread first([&]() { scanner->setup(); });
    std::thread second([&]() { scanner->setup(); });
    first.join();
    second.join();

    EXPECT_EQ(network.count(network.created), 2u);
    EXPECT_EQ(scanner->activeListenerCount(), 2u);
}

TEST_F(NetcastScannerTest, SetupSearchesOnceAfterListenersAreReady) {
    auto scanner = makeScanner({
        adapter("eth0", {"192.168.1.5"}, false, true),
        adapter("wlan0", {"10.0.0.5"}, false, true),
    }, fastOptions());

    scanner->setup();
    EXPECT_EQ(network.count(network.searches), 2u);
}

TEST_F(NetcastScannerTest, DiscoverSearchesEveryAttempt) {
    auto scanner = makeDefaultScanner();
    scanner->discover();

    // One burst from setup plus one per attempt.
    EXPECT_EQ(network.count(network.searches), 4u);
}

TEST_F(NetcastScannerTest, RepeatedRepliesMergeIntoOneRecord) {
    requester.respond(TV_LOCATION, 200, descriptionXml("MockLGModelName"));
    network.setReplies({ssdpReply("1234"), ssdpReply("1234")});

    auto scanner = makeDefaultScanner();
    auto devices = scanner->discover();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].uniqueId, "1234");
    EXPECT_EQ(devices[0].st(), netcast::SSDP_ST);
    EXPECT_EQ(devices[0].location(), TV_LOCATION);
    EXPECT_EQ(devices[0].upnp.at("modelName"), "MockLGModelName");

    auto summaries = scanner->deviceSummaries();
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].id, "1234");
    EXPECT_EQ(summaries[0].host, TV_HOST);
    EXPECT_EQ(summaries[0].name, "MockLGModelName");
}

TEST_F(NetcastScannerTest, DistinctIdsGiveDistinctRecords) {
    requester.respond(TV_LOCATION, 200, descriptionXml("MockLGModelName"));
    network.setReplies({ssdpReply("1234"), ssdpReply("5678", MOVED_LOCATION)});

    auto scanner = makeDefaultScanner();
    auto devices = scanner->discover();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[1].uniqueId, "5678");
    EXPECT_TRUE(devices[1].upnp.empty());
    EXPECT_EQ(devices[1].displayName(), netcast::DEFAULT_NAME);
}

TEST_F(NetcastScannerTest, ReplyWithoutUniqueIdIsDropped) {
    auto reply = ssdpReply("1234");
    reply["USN"] = "uuid";
    network.setReplies({reply});

    auto scanner = makeDefaultScanner();
    EXPECT_TRUE(scanner->discover().empty());
}

TEST_F(NetcastScannerTest, ReplyWithoutHostIsDropped) {
    network.setReplies({ssdpReply("1234", "garbage")});

    auto scanner = makeDefaultScanner();
    EXPECT_TRUE(scanner->discover().empty());
}

TEST_F(NetcastScannerTest, NewHostRefetchesAndDiscardsOldDescription) {
    requester.respond(TV_LOCATION, 200, descriptionXml("MockLGModelName"));
    network.setReplies({ssdpReply("1234")});

    auto scanner = makeDefaultScanner();
    ASSERT_EQ(scanner->discover()[0].upnp.at("modelName"), "MockLGModelName");

    network.setReplies({ssdpReply("1234", MOVED_LOCATION)});
    auto devices = scanner->discover();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].host(), "192.168.1.240");
    EXPECT_GE(requester.callCount(MOVED_LOCATION), 1u);
    EXPECT_TRUE(devices[0].upnp.empty());

    requester.respond(MOVED_LOCATION, 200, descriptionXml("NewModel"));
    devices = scanner->discover();
    EXPECT_EQ(devices[0].upnp.at("modelName"), "NewModel");
}

TEST_F(NetcastScannerTest, SameHostKeepsDescriptionWhenFetchFails) {
    requester.respond(TV_LOCATION, 200, descriptionXml("MockLGModelName"));
    network.setReplies({ssdpReply("1234")});

    auto scanner = makeDefaultScanner();
    scanner->discover();

    requester.respond(TV_LOCATION, 404, "");
    auto devices = scanner->discover();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].upnp.at("modelName"), "MockLGModelName");
}

TEST_F(NetcastScannerTest, SameHostReusesRecordedLocation) {
    const char* otherPath = "http://192.168.1.239:1914/other.xml";
    requester.respond(TV_LOCATION, 200, descriptionXml("MockLGModelName"));
    network.setReplies({ssdpReply("1234")});

    auto scanner = makeDefaultScanner();
    scanner->discover();

    network.setReplies({ssdpReply("1234", otherPath)});
    scanner->scan();
    scanner->processPending();

    EXPECT_EQ(requester.callCount(otherPath), 0u);
    auto devices = scanner->devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].location(), otherPath);
    EXPECT_EQ(devices[0].upnp.at("modelName"), "MockLGModelName");
}

TEST_F(NetcastScannerTest, DiscoverIsBoundedWithoutReplies) {
    auto scanner = makeScanner({adapter("eth0", {"192.168.1.5"}, true, true)}, fastOptions(3, 50));

    auto start = std::chrono::steady_clock::now();
    auto devices = scanner->discover();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(devices.empty());
    EXPECT_GE(elapsed, std::chrono::milliseconds(150));
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(NetcastScannerTest, SlowFetchDoesNotExtendSweep) {
    SlowRequester slow(std::chrono::milliseconds(300));
    DescriptionFetcher slowFetcher(&slow);
    network.setReplies({ssdpReply("1234")});

    NetcastScanner scanner(fastOptions(3, 50), &slowFetcher, network.factory(),
                           fixedAdapters({adapter("eth0", {"192.168.1.5"}, true, true)}));
    scanner.setup();

    auto start = std::chrono::steady_clock::now();
    auto devices = scanner.discover();
    auto elapsed = std::chrono::steady_clock::now() - start;

    // attempts * interval plus one fetch, with some scheduling slack.
    EXPECT_LT(elapsed, std::chrono::milliseconds(3 * 50 + 300 + 200));
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_TRUE(devices[0].upnp.empty());
}

TEST_F(NetcastScannerTest, ConcurrentConsumersKeepLatestReply) {
    std::vector<netcast::SsdpHeaders> replies;
    for (int i = 0; i < 200; i++) {
        replies.push_back(ssdpReply("1234", "http://192.168.1.239:1914/desc" + std::to_string(i) + ".xml"));
    }
    network.setReplies(replies);

    auto scanner = makeDefaultScanner();
    scanner->setup();

    std::thread first([&]() { scanner->processPending(); });
    std::thread second([&]() { scanner->processPending(); });
    first.join();
    second.join();

    auto devices = scanner->devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].location(), "http://192.168.1.239:1914/desc199.xml");
}

TEST_F(NetcastScannerTest, SuccessfulStartCountsAsReady) {
    network.silentStart = true;
    auto scanner = makeScanner({
        adapter("eth0", {"192.168.1.5"}, false, true),
        adapter("wlan0", {"10.0.0.5"}, false, true),
    }, fastOptions());

    scanner->setup();

    EXPECT_EQ(scanner->activeListenerCount(), 2u);
    EXPECT_EQ(network.count(network.searches), 2u);
}

TEST_F(NetcastScannerTest, NoSourcesMeansNoListeners) {
    std::vector<NetworkAdapter> adapters = {adapter("eth1", {}, false, true)};
    adapters[0].ipv6.push_back({"fe80::2", 64});
    auto scanner = makeScanner(adapters, fastOptions(2, 10));

    EXPECT_TRUE(scanner->discover().empty());
    EXPECT_EQ(scanner->activeListenerCount(), 0u);
    EXPECT_EQ(network.count(network.created), 0u);
}

TEST_F(NetcastScannerTest, DestructionStopsListeners) {
    {
        auto scanner = makeScanner({
            adapter("eth0", {"192.168.1.5"}, false, true),
            adapter("wlan0", {"10.0.0.5"}, false, true),
        }, fastOptions());
        scanner->setup();
    }
    EXPECT_EQ(network.count(network.stopped), 2u);
}
