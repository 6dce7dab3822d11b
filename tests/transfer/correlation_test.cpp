#include "cirrus/transfer/correlation.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace cirrus::transfer;
using cirrus::ErrorKind;
using cirrus::Ok;
using cirrus::TransferError;

namespace {

FolderResponse folder(const std::string& id) {
    return FolderResponse{id};
}

} // namespace

TEST(CorrelationTest, ReplyDeliveredBeforeWaitIsKept) {
    ReplyTable<FolderResponse> table("folders");

    auto ticket = table.open("t-1");
    EXPECT_TRUE(table.has_slot("t-1"));
    EXPECT_EQ(table.deliver("t-1", Ok<FolderResponse, TransferError>(folder("srv-1"))), DeliveryStatus::Delivered);
    EXPECT_EQ(table.size(), 0u);

    auto reply = table.wait(ticket, std::chrono::milliseconds(10), "unused");
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().folder_id, "srv-1");
}

TEST(CorrelationTest, CrossThreadDelivery) {
    ReplyTable<FolderResponse> table("folders");
    auto ticket = table.open("t-2");

    std::thread responder([&table]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        table.deliver("t-2", Ok<FolderResponse, TransferError>(folder("srv-2")));
    });

    auto reply = table.wait(ticket, std::chrono::seconds(5), "unused");
    responder.join();
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().folder_id, "srv-2");
}

TEST(CorrelationTest, TimeoutRemovesSlotAndLateReplyFindsNothing) {
    ReplyTable<UploadUrlsResponse> table("upload-urls");
    auto ticket = table.open("t-3");

    auto reply = table.wait(ticket, std::chrono::milliseconds(20), "Timeout waiting for presigned URLs");
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().kind, ErrorKind::Timeout);
    EXPECT_EQ(reply.error().message, "Timeout waiting for presigned URLs");

    EXPECT_FALSE(table.has_slot("t-3"));
    EXPECT_EQ(table.deliver("t-3", Ok<UploadUrlsResponse, TransferError>(UploadUrlsResponse{})), DeliveryStatus::NoSlot);
}

TEST(CorrelationTest, ExplicitErrorResolvesSlot) {
    ReplyTable<UploadUrlsResponse> table("upload-urls");
    auto ticket = table.open("t-4");

    EXPECT_EQ(table.fail("t-4", TransferError{ErrorKind::Negotiation, "Quota exceeded"}), DeliveryStatus::Delivered);
    auto reply = table.wait(ticket, std::chrono::seconds(1), "unused");
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().kind, ErrorKind::Negotiation);
    EXPECT_EQ(reply.error().message, "Quota exceeded");
}

TEST(CorrelationTest, AbandonedTicketReportsReceiverGone) {
    ReplyTable<FolderResponse> table("folders");
    {
        auto ticket = table.open("t-5");
    }
    EXPECT_EQ(table.deliver("t-5", Ok<FolderResponse, TransferError>(folder("x"))), DeliveryStatus::ReceiverGone);
    EXPECT_EQ(table.deliver("t-5", Ok<FolderResponse, TransferError>(folder("x"))), DeliveryStatus::NoSlot);
}

TEST(CorrelationTest, ReopenSupersedesOlderSlot) {
    ReplyTable<FolderResponse> table("folders");
    auto first = table.open("t-6");
    auto second = table.open("t-6");
    EXPECT_EQ(table.size(), 1u);

    auto stale = table.wait(first, std::chrono::milliseconds(10), "unused");
    ASSERT_TRUE(stale.is_error());
    EXPECT_EQ(stale.error().kind, ErrorKind::Orphaned);

    table.deliver("t-6", Ok<FolderResponse, TransferError>(folder("fresh")));
    auto reply = table.wait(second, std::chrono::milliseconds(10), "unused");
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().folder_id, "fresh");
}

TEST(CorrelationTest, CloseResolvesOpenSlotsAndLaterOpens) {
    CorrelationManager manager;
    auto pending = manager.folders().open("t-7");
    EXPECT_EQ(manager.outstanding(), 1u);

    const TransferError closed{ErrorKind::Negotiation, "Channel closed before receiving response"};
    EXPECT_EQ(manager.close_all(closed), 1u);
    EXPECT_EQ(manager.outstanding(), 0u);

    auto reply = manager.folders().wait(pending, std::chrono::milliseconds(10), "unused");
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().message, "Channel closed before receiving response");

    auto late = manager.upload_urls().open("t-8");
    auto late_reply = manager.upload_urls().wait(late, std::chrono::seconds(5), "unused");
    ASSERT_TRUE(late_reply.is_error());
    EXPECT_EQ(late_reply.error().kind, ErrorKind::Negotiation);
}

TEST(CorrelationTest, AwaitExternalAllowsSynchronousReply) {
    ReplyTable<FolderResponse> table("folders");
    int emitted = 0;

    auto reply = CorrelationManager::await_external(table, "t-9", [&]() {
        ++emitted;
        table.deliver("t-9", Ok<FolderResponse, TransferError>(folder("sync")));
    }, std::chrono::seconds(1), "Timeout waiting for folder creation");

    EXPECT_EQ(emitted, 1);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().folder_id, "sync");
}

TEST(CorrelationTest, FailAllForOnlyTouchesThatId) {
    CorrelationManager manager;
    auto a = manager.upload_urls().open("a");
    auto b = manager.upload_urls().open("b");

    manager.fail_all_for("a", TransferError{ErrorKind::Cancelled, "Cancelled by user"});
    EXPECT_FALSE(manager.upload_urls().has_slot("a"));
    EXPECT_TRUE(manager.upload_urls().has_slot("b"));

    auto reply = manager.upload_urls().wait(a, std::chrono::milliseconds(10), "unused");
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().kind, ErrorKind::Cancelled);
}
