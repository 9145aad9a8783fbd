#include <gtest/gtest.h>
#include "Discovery.hpp"
#include "RecordingTransport.hpp"
#include <algorithm>

using namespace lanchat;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static DiscoveryOptions quietOptions() {
    DiscoveryOptions opts;
    opts.broadcastAddress = "";
    opts.discoveryPort = 0;
    return opts;
}

class DiscoveryTest : public ::testing::Test {
    protected:
        DiscoveryTest() : self(makeIdentity("alice")), bob(makeIdentity("bob")) {}

        std::unique_ptr<DiscoveryService> makeService(DiscoveryOptions opts = quietOptions()) {
            return std::make_unique<DiscoveryService>(io, transport, registry, self, opts);
        }

        boost::asio::io_context io;
        RecordingTransport transport;
        PeerRegistry registry;
        NodeIdentity self;
        NodeIdentity bob;
};

// -----------------------
// ANNOUNCE
// -----------------------
TEST_F(DiscoveryTest, AnnounceBroadcastsAndUnicastsToBootstrapPeers) {
    DiscoveryOptions opts;
    opts.broadcastAddress = "255.255.255.255";
    opts.discoveryPort = 9487;
    opts.bootstrapPeers = {Endpoint{"10.0.0.9", 4000}};
    auto service = makeService(opts);

    service->announce();

    auto hellos = transport.ofKind(MessageKind::HELLO);
    ASSERT_EQ(hellos.size(), 2u);
    EXPECT_EQ(hellos[0].to, (Endpoint{"255.255.255.255", 9487}));
    EXPECT_EQ(hellos[1].to, (Endpoint{"10.0.0.9", 4000}));

    Message hello = hellos[0].decoded();
    EXPECT_EQ(hello.sender, self.id);
    EXPECT_EQ(hello.senderName, "alice");
    EXPECT_TRUE(hello.payload.empty());
    EXPECT_EQ(service->hellosSent(), 2u);
}

TEST_F(DiscoveryTest, AnnounceAlsoHitsOwnPortWithoutDiscoverySocket) {
    DiscoveryOptions opts;
    opts.broadcastAddress = "192.168.1.255";
    opts.discoveryPort = 9487;
    opts.localPort = 40000;
    opts.broadcastToLocalPort = true;
    auto service = makeService(opts);

    service->announce();

    auto hellos = transport.ofKind(MessageKind::HELLO);
    ASSERT_EQ(hellos.size(), 2u);
    EXPECT_EQ(hellos[1].to, (Endpoint{"192.168.1.255", 40000}));
}

TEST_F(DiscoveryTest, NoBroadcastAddressNoBroadcast) {
    auto service = makeService();
    service->announce();
    EXPECT_TRUE(transport.all().empty());
}

// -----------------------
// HANDSHAKE
// -----------------------
TEST_F(DiscoveryTest, HelloRegistersSenderAndRepliesWelcome) {
    auto service = makeService();
    const Endpoint bobAt{"10.0.0.2", 5000};

    service->handleHello(makeMessage(MessageKind::HELLO, bob), bobAt);

    auto peer = registry.find(bob.id);
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->displayName, "bob");
    EXPECT_EQ(peer->endpoint, bobAt);

    auto welcomes = transport.ofKind(MessageKind::WELCOME);
    ASSERT_EQ(welcomes.size(), 1u);
    EXPECT_EQ(welcomes[0].to, bobAt);
    EXPECT_EQ(welcomes[0].decoded().sender, self.id);

    // nobody else known, so no peer list
    EXPECT_TRUE(transport.ofKind(MessageKind::PEER_LIST).empty());
}

TEST_F(DiscoveryTest, WelcomeRegistersSender) {
    auto service = makeService();
    service->handleWelcome(makeMessage(MessageKind::WELCOME, bob), Endpoint{"10.0.0.2", 5000});

    EXPECT_TRUE(registry.contains(bob.id));
    EXPECT_TRUE(transport.all().empty());
}

TEST_F(DiscoveryTest, ReannounceFromNewAddressOverwrites) {
    auto service = makeService();
    service->handleHello(makeMessage(MessageKind::HELLO, bob), Endpoint{"10.0.0.2", 5000});
    service->handleHello(makeMessage(MessageKind::HELLO, bob), Endpoint{"10.0.0.7", 6000});

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find(bob.id)->endpoint, (Endpoint{"10.0.0.7", 6000}));
}

TEST_F(DiscoveryTest, RestartAtSameAddressReplacesOldRecord) {
    auto service = makeService();
    service->handleHello(makeMessage(MessageKind::HELLO, bob), Endpoint{"10.0.0.2", 5000});

    // bob restarts with a fresh id on the same ip:port
    auto bobAgain = makeIdentity("bob");
    service->handleHello(makeMessage(MessageKind::HELLO, bobAgain), Endpoint{"10.0.0.2", 5000});

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(registry.contains(bob.id));
    EXPECT_TRUE(registry.contains(bobAgain.id));
}

// -----------------------
// PEER LIST GOSSIP
// -----------------------
TEST_F(DiscoveryTest, HelloIsAnsweredWithListOfOthers) {
    auto carol = makeIdentity("carol");
    registry.upsert(makePeerInfo(carol, "10.0.0.3", 5000));
    auto service = makeService();

    service->handleHello(makeMessage(MessageKind::HELLO, bob), Endpoint{"10.0.0.2", 5000});

    auto lists = transport.ofKind(MessageKind::PEER_LIST);
    ASSERT_EQ(lists.size(), 1u);
    EXPECT_EQ(lists[0].to, (Endpoint{"10.0.0.2", 5000}));

    auto entries = DiscoveryService::parsePeerList(lists[0].decoded().payload);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, carol.id);
    EXPECT_EQ(entries[0].second, (Endpoint{"10.0.0.3", 5000}));
}

TEST_F(DiscoveryTest, PeerListSharingCanBeDisabled) {
    registry.upsert(makePeerInfo(makeIdentity("carol"), "10.0.0.3", 5000));
    auto opts = quietOptions();
    opts.sharePeerList = false;
    auto service = makeService(opts);

    service->handleHello(makeMessage(MessageKind::HELLO, bob), Endpoint{"10.0.0.2", 5000});

    EXPECT_TRUE(transport.ofKind(MessageKind::PEER_LIST).empty());
    EXPECT_EQ(transport.ofKind(MessageKind::WELCOME).size(), 1u);
}

TEST_F(DiscoveryTest, PeerListTriggersHellosToUnknownPeersOnly) {
    auto carol = makeIdentity("carol");
    auto dave = makeIdentity("dave");
    registry.upsert(makePeerInfo(bob, "10.0.0.2", 5000));
    registry.upsert(makePeerInfo(dave, "10.0.0.4", 5000));
    auto service = makeService();

    std::vector<PeerInfo> listed = {
        makePeerInfo(carol, "10.0.0.3", 5000),  // unknown
        makePeerInfo(dave, "10.0.0.4", 5000),   // already known
        makePeerInfo(self, "10.0.0.1", 5000),   // ourselves
    };
    auto payloads = DiscoveryService::encodePeerList(listed, 1000);
    ASSERT_EQ(payloads.size(), 1u);

    service->handlePeerList(makeMessage(MessageKind::PEER_LIST, bob, payloads[0]), Endpoint{"10.0.0.2", 5000});

    auto hellos = transport.ofKind(MessageKind::HELLO);
    ASSERT_EQ(hellos.size(), 1u);
    EXPECT_EQ(hellos[0].to, (Endpoint{"10.0.0.3", 5000}));

    // carol only joins after answering the hello
    EXPECT_FALSE(registry.contains(carol.id));
}

TEST(PeerListCodecTest, SplitsAtBudget) {
    std::vector<PeerInfo> peers;
    for (int i = 0; i < 10; ++i) {
        peers.push_back(makePeerInfo(makeIdentity("p"), "10.0.0." + std::to_string(i), 5000));
    }

    // one entry is 32 hex + '@' + "10.0.0.N:5000" = 46 bytes
    auto payloads = DiscoveryService::encodePeerList(peers, 100);
    ASSERT_EQ(payloads.size(), 5u);

    size_t total = 0;
    for (const auto& payload : payloads) {
        EXPECT_LE(payload.size(), 100u);
        total += DiscoveryService::parsePeerList(payload).size();
    }
    EXPECT_EQ(total, peers.size());
}

TEST(PeerListCodecTest, MalformedEntriesAreSkipped) {
    auto bob = makeIdentity("bob");
    const std::string good = Identity::toHex(bob.id) + "@10.0.0.2:5000";
    const std::string payload = "garbage," + good + ",abcd@10.0.0.3:1,"
                              + Identity::toHex(bob.id) + "@not-an-ip:5,"
                              + Identity::toHex(bob.id) + "@10.0.0.4";

    auto entries = DiscoveryService::parsePeerList(payload);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, bob.id);
    EXPECT_EQ(entries[0].second.port, 5000);
}

TEST(PeerListCodecTest, EmptyPayload) {
    EXPECT_TRUE(DiscoveryService::parsePeerList("").empty());
    EXPECT_TRUE(DiscoveryService::encodePeerList({}, 1000).empty());
}
