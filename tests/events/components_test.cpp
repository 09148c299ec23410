#include "mx/events/components.hpp"
#include "mx/events/event_bus.hpp"
#include "mx/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>

using mx::archive::UploadError;
using mx::events::EventBus;
using mx::events::LoggerComponent;
using mx::events::ReporterComponent;
using mx::events::StatsComponent;
using mx::events::UploadFailedEvent;
using mx::events::UploadQueuedEvent;
using mx::events::UploadSucceededEvent;

TEST(StatsComponentTest, CountsOutcomesByKind) {
    EventBus bus;
    StatsComponent stats(bus);

    bus.emit(UploadQueuedEvent{"a.mp4"});
    bus.emit(UploadQueuedEvent{"b.mp4"});
    bus.emit(UploadQueuedEvent{"c.mp4"});
    bus.emit(UploadSucceededEvent{"a.mp4", "https://archive.test/a", 1024, std::chrono::milliseconds{20}});
    bus.emit(UploadFailedEvent{"b.mp4", UploadError::validation("duplicate file"), "pending"});
    bus.emit(UploadFailedEvent{"c.mp4", UploadError::auth(), "pending"});

    const auto& s = stats.get_stats();
    EXPECT_EQ(s.queued.load(), 3u);
    EXPECT_EQ(s.uploaded.load(), 1u);
    EXPECT_EQ(s.bytes_uploaded.load(), 1024u);
    EXPECT_EQ(s.failed.load(), 2u);
    EXPECT_EQ(s.validation_failures.load(), 1u);
    EXPECT_EQ(s.auth_failures.load(), 1u);
    EXPECT_EQ(s.transport_failures.load(), 0u);
}

TEST(ReporterComponentTest, WritesSuccessToOutAndFailureToErr) {
    EventBus bus;
    std::ostringstream out;
    std::ostringstream err;
    ReporterComponent reporter(bus, out, err);

    bus.emit(UploadSucceededEvent{"videos/a.mp4", "https://archive.test/a", 10, std::chrono::milliseconds{1}});
    bus.emit(UploadFailedEvent{"videos/b.mp4", UploadError::validation("duplicate file"), "pending"});

    EXPECT_EQ(out.str(), "[videos/a.mp4] Uploaded: https://archive.test/a\n");
    EXPECT_EQ(err.str(), "[videos/b.mp4] Error: duplicate file\n");
}

TEST(ComponentTest, UnsubscribesOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        StatsComponent stats(bus);
        EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 2u);
    }
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadSucceededEvent>(), 0u);

    EXPECT_NO_THROW(bus.emit(UploadFailedEvent{"a.mp4", UploadError::auth(), "pending"}));
}
