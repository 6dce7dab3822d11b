#include <gtest/gtest.h>
#include "cirrus/events/event_bus.hpp"
#include "cirrus/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cirrus::events;

TEST(EventBus, DeliversTypedEvents) {
    EventBus bus;

    std::string received_block;
    std::uint64_t received_index = 0;

    bus.subscribe<BlockCompleted>([&](const BlockCompleted& e) {
        received_block = e.block_id;
        received_index = e.index;
    });

    BlockCompleted event;
    event.block_id = "block-7";
    event.index = 7;
    bus.emit(event);

    EXPECT_EQ(received_block, "block-7");
    EXPECT_EQ(received_index, 7u);
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int progress_count = 0;
    int rejected_count = 0;

    bus.subscribe<TransferProgressed>([&](const TransferProgressed&) { progress_count++; });
    bus.subscribe<TransferRejected>([&](const TransferRejected&) { rejected_count++; });

    bus.emit(TransferProgressed{});
    bus.emit(TransferRejected{"Invalid file path: /nope"});
    bus.emit(TransferProgressed{});

    EXPECT_EQ(progress_count, 2);
    EXPECT_EQ(rejected_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<TransferFinished>([&](const TransferFinished&) { count++; });

    bus.emit(TransferFinished{});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<TransferFinished>(id);

    bus.emit(TransferFinished{});
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<TransferFinished>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<CreateFolderRequested>([](const CreateFolderRequested&) {
        throw std::runtime_error("subscriber failure");
    });
    bus.subscribe<CreateFolderRequested>([&](const CreateFolderRequested&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(CreateFolderRequested{}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, HandlerMayReenterBus) {
    EventBus bus;

    int finished = 0;
    bus.subscribe<FinalizeTransferRequested>([&](const FinalizeTransferRequested& e) {
        TransferFinished done;
        done.id = e.id;
        bus.emit(done);
    });
    bus.subscribe<TransferFinished>([&](const TransferFinished&) { finished++; });

    FinalizeTransferRequested request;
    request.id = "transfer-1";
    bus.emit(request);

    EXPECT_EQ(finished, 1);
}

TEST(EventBus, ConcurrentSubscribeAndEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> subscribers;
    for (int i = 0; i < 10; ++i) {
        subscribers.emplace_back([&bus, &count]() {
            bus.subscribe<BlockCompleted>([&count](const BlockCompleted&) { count++; });
        });
    }
    for (auto& t : subscribers) {
        t.join();
    }

    std::vector<std::thread> emitters;
    for (int i = 0; i < 20; ++i) {
        emitters.emplace_back([&bus]() { bus.emit(BlockCompleted{}); });
    }
    for (auto& t : emitters) {
        t.join();
    }

    EXPECT_EQ(count, 200);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<ThumbnailCompleted>([](const ThumbnailCompleted&) {});
    bus.subscribe<InitFileUploadRequested>([](const InitFileUploadRequested&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<ThumbnailCompleted>(), 0u);
    EXPECT_EQ(bus.subscriber_count<InitFileUploadRequested>(), 0u);
}
