#include "errors.hpp"
#include "listen_session.hpp"
#include "session_registry.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>

TEST(SessionRegistry, CreateAndRelease) {
    SessionRegistry registry;
    SessionHandle a = registry.create("models/en", {"hey"}, marker_model());
    SessionHandle b = registry.create("models/en", {"hey"}, marker_model());
    EXPECT_NE(a, 0u);
    EXPECT_NE(a, b);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains(a));

    EXPECT_TRUE(registry.release(a));
    EXPECT_FALSE(registry.contains(a));
    EXPECT_FALSE(registry.release(a));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistry, ReusedSlotGetsNewHandle) {
    SessionRegistry registry;
    SessionHandle first = registry.create("m", {}, marker_model());
    registry.release(first);
    SessionHandle second = registry.create("m", {}, marker_model());

    EXPECT_NE(first, second);
    EXPECT_EQ(first & 0xFFFFFFFFu, second & 0xFFFFFFFFu);
    EXPECT_FALSE(registry.contains(first));
    EXPECT_TRUE(registry.contains(second));
}

TEST(SessionRegistry, UnknownHandles) {
    SessionRegistry registry;
    EXPECT_FALSE(registry.contains(0));
    EXPECT_FALSE(registry.contains(12345));
    EXPECT_FALSE(registry.stop(7));
    EXPECT_THROW(registry.lease(7), MurmurError);
}

TEST(SessionRegistry, LeaseIsExclusiveAndParksModel) {
    SessionRegistry registry;
    SessionHandle h = registry.create("models/en", {"hey"}, marker_model());
    {
        SessionLease lease = registry.lease(h);
        EXPECT_TRUE(registry.listening(h));
        EXPECT_EQ(lease.model_path(), "models/en");
        EXPECT_THROW(registry.lease(h), MurmurError);

        auto model = lease.take_model();
        ASSERT_NE(model, nullptr);
        lease.give_back(std::move(model));
    }
    EXPECT_FALSE(registry.listening(h));

    SessionLease again = registry.lease(h);
    EXPECT_NE(again.take_model(), nullptr);
}

TEST(SessionRegistry, ModelNotGivenBackIsGone) {
    SessionRegistry registry;
    SessionHandle h = registry.create("models/en", {}, marker_model());
    {
        SessionLease lease = registry.lease(h);
        lease.take_model();
    }
    SessionLease again = registry.lease(h);
    EXPECT_EQ(again.take_model(), nullptr);
}

TEST(SessionRegistry, StopBeforeAttachIsApplied) {
    SessionRegistry registry;
    SessionHandle h = registry.create("models/en", {"hey"}, marker_model());
    SessionLease lease = registry.lease(h);
    EXPECT_TRUE(registry.stop(h));

    SessionConfig cfg;
    cfg.listen_duration_ms = 0;
    cfg.poll_interval_ms = 5;
    ListenSession session(std::make_unique<ScriptedSource>(std::vector<AudioFrame>{}), lease.take_model(), {"hey"},
                          cfg);
    lease.attach(&session);
    EXPECT_EQ(session.run(), "");
    lease.give_back(session.release_model());
}

TEST(SessionRegistry, ReleaseStopsListeningSession) {
    SessionRegistry registry;
    SessionHandle h = registry.create("models/en", {"hey"}, marker_model());
    SessionLease lease = registry.lease(h);

    SessionConfig cfg;
    cfg.poll_interval_ms = 5;
    ListenSession session(std::make_unique<ScriptedSource>(std::vector<AudioFrame>{}), lease.take_model(), {"hey"},
                          cfg);
    lease.attach(&session);
    EXPECT_TRUE(registry.release(h));
    EXPECT_EQ(session.run(), "");
    lease.give_back(session.release_model());
    EXPECT_FALSE(registry.contains(h));
}
