#include "cirrus/transfer/protocol.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace cirrus::transfer;
using cirrus::EngineConfig;
using cirrus::events::EventBus;
using cirrus::testing::RecordingUploadClient;
using cirrus::testing::create_temp_dir;
using cirrus::testing::write_file;
using protocol::json;

namespace {

json valid_upload_urls() {
    return json::parse(R"({
        "file_id": "f-1",
        "revision_id": "r-1",
        "total_blocks": 2,
        "block_size": 4194304,
        "content_key": "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=",
        "upload_urls": [
            {"url": "https://b/1", "block_id": "b1", "index": 1, "expires_in": 60},
            {"url": "https://b/0", "block_id": "b0", "index": 0}
        ],
        "thumbnail": {"id": "t-1", "url": "https://t/1", "expires_in": 60, "content_key": "k"}
    })");
}

} // namespace

TEST(ProtocolTest, EventsUseTypedEnvelope) {
    cirrus::events::InitFileUploadRequested init;
    init.id = "transfer-1";
    init.name = "a.txt";
    init.size = 12;
    init.mime_type = "text/plain";

    const json encoded = protocol::encode(init);
    EXPECT_EQ(encoded["type"], "init-file-upload");
    EXPECT_TRUE(encoded["timestamp"].is_number_integer());
    EXPECT_EQ(encoded["payload"]["id"], "transfer-1");
    EXPECT_EQ(encoded["payload"]["size"], 12);
    EXPECT_TRUE(encoded["payload"]["xattrs"].is_null());
    EXPECT_TRUE(encoded["payload"]["modified_date"].is_null());
    EXPECT_EQ(encoded["payload"]["needs_thumbnail"], false);
}

TEST(ProtocolTest, ProgressOmitsUnsetFields) {
    cirrus::events::TransferProgressed progress;
    progress.id = "transfer-2";
    progress.kind = ItemKind::Folder;
    progress.progress = 0.3f;
    progress.status = "processing";

    json encoded = protocol::encode(progress);
    EXPECT_EQ(encoded["type"], "transfer-progress");
    EXPECT_EQ(encoded["payload"]["type"], "folder");
    EXPECT_FALSE(encoded["payload"].contains("speed"));
    EXPECT_FALSE(encoded["payload"].contains("message"));

    progress.speed = 2048.0;
    progress.remaining_time = 7;
    encoded = protocol::encode(progress);
    EXPECT_DOUBLE_EQ(encoded["payload"]["speed"].get<double>(), 2048.0);
    EXPECT_EQ(encoded["payload"]["remaining_time"], 7);
}

TEST(ProtocolTest, FinishedAndRejectedNames) {
    cirrus::events::TransferFinished finished;
    finished.id = "transfer-3";
    finished.status = cirrus::events::TransferOutcome::Failed;
    finished.message = "Cancelled by user";
    const json encoded = protocol::encode(finished);
    EXPECT_EQ(encoded["type"], "transfer-complete");
    EXPECT_EQ(encoded["payload"]["status"], "failed");
    EXPECT_FALSE(encoded["payload"].contains("file_id"));

    const json rejected = protocol::encode(cirrus::events::TransferRejected{"Invalid file path: x"});
    EXPECT_EQ(rejected["type"], "transfer-error");
    EXPECT_EQ(rejected["payload"]["message"], "Invalid file path: x");
}

TEST(ProtocolTest, DetailedStatusKeys) {
    DetailedQueueStatus status;
    status.summary.queue_size = 1;
    status.queue_items.push_back(QueuedItemSummary{"transfer-4", ItemKind::File, "n.txt", 2, "p"});
    status.pending_folders = {"/data/x"};
    status.folder_mappings = {{"/data/x", "srv-x"}};
    status.block_notices = 3;

    const json encoded = protocol::encode(status);
    EXPECT_EQ(encoded["queue_size"], 1);
    EXPECT_TRUE(encoded["processing"].is_null());
    EXPECT_EQ(encoded["queue_items"][0]["type"], "file");
    EXPECT_EQ(encoded["queue_items"][0]["depth"], 2);
    EXPECT_EQ(encoded["pending_folder_paths"][0], "/data/x");
    EXPECT_EQ(encoded["folder_mappings"]["/data/x"], "srv-x");
    EXPECT_EQ(encoded["block_completion_sent_count"], 3);
    EXPECT_EQ(encoded["outstanding_requests"], 0);
}

TEST(ProtocolTest, ParseUploadUrls) {
    auto parsed = protocol::parse_upload_urls(valid_upload_urls());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const auto& value = parsed.value();
    EXPECT_EQ(value.file_id, "f-1");
    EXPECT_EQ(value.block_size, 4194304u);
    ASSERT_EQ(value.upload_urls.size(), 2u);
    EXPECT_EQ(value.upload_urls[0].index, 1u);
    EXPECT_EQ(value.upload_urls[1].expires_in, 0u);
    ASSERT_TRUE(value.thumbnail.has_value());
    EXPECT_EQ(value.thumbnail->id, "t-1");
}

TEST(ProtocolTest, ParseUploadUrlsRejectsMissingFields) {
    json broken = valid_upload_urls();
    broken.erase("content_key");
    auto parsed = protocol::parse_upload_urls(broken);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().rfind("Malformed upload-urls-response", 0), 0u);

    json wrong_type = valid_upload_urls();
    wrong_type["block_size"] = "big";
    EXPECT_TRUE(protocol::parse_upload_urls(wrong_type).is_error());
}

TEST(ProtocolTest, ParseFinalizeComplete) {
    auto parsed = protocol::parse_finalize_complete(json::parse(
        R"({"type":"finalize-transfer-complete","transfer_id":"t","file_id":"f","success":false,"error":"hash mismatch"})"));
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().transfer_id, "t");
    EXPECT_FALSE(parsed.value().success);
    EXPECT_EQ(parsed.value().error.value_or(""), "hash mismatch");
    EXPECT_TRUE(parsed.value().parent_id.empty());
}

class DispatcherTest : public ::testing::Test {
protected:
    EventBus bus_;
    RecordingUploadClient uploader_;
    TransferEngine engine_{EngineConfig{}, bus_, uploader_};
    protocol::MessageDispatcher dispatcher_{engine_};
};

TEST_F(DispatcherTest, RejectsInvalidInput) {
    auto not_json = dispatcher_.dispatch_line("{not json");
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error(), "Invalid JSON input");

    EXPECT_TRUE(dispatcher_.dispatch_line(R"({"no_type":1})").is_error());

    auto unknown = dispatcher_.dispatch_line(R"({"type":"format-disk"})");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error(), "Unknown message type: format-disk");

    auto malformed = dispatcher_.dispatch_line(R"({"type":"cancel"})");
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error().rfind("Malformed cancel", 0), 0u);
}

TEST_F(DispatcherTest, CommandsAnswerWithResults) {
    const auto dir = create_temp_dir("dispatch");
    write_file(dir / "queued.txt", std::string("payload"));

    json select = {
        {"type", "select-files"},
        {"paths", {(dir / "queued.txt").string(), (dir / "nope.txt").string()}},
        {"share_id", "share"},
        {"parent_id", "root"}
    };
    auto selected = dispatcher_.dispatch(select);
    ASSERT_TRUE(selected.is_ok());
    ASSERT_TRUE(selected.value().has_value());
    const json& result = *selected.value();
    EXPECT_EQ(result["type"], "command-result");
    EXPECT_EQ(result["command"], "select-files");
    ASSERT_EQ(result["result"]["queued"].size(), 1u);
    const std::string id = result["result"]["queued"][0].get<std::string>();

    auto status = dispatcher_.dispatch_line(R"({"type":"queue-status"})");
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ((*status.value())["result"]["queue_size"], 1);

    auto paused = dispatcher_.dispatch_line(R"({"type":"pause"})");
    EXPECT_EQ((*paused.value())["result"]["paused"], true);
    EXPECT_TRUE(engine_.queue_status().paused);

    auto cancelled = dispatcher_.dispatch(json{{"type", "cancel"}, {"id", id}});
    ASSERT_TRUE(cancelled.is_ok());
    EXPECT_EQ((*cancelled.value())["result"]["cancelled"], true);

    auto none = dispatcher_.dispatch_line(R"({"type":"cancel-all"})");
    EXPECT_EQ((*none.value())["result"]["cancelled_count"], 0);

    auto health = dispatcher_.dispatch_line(R"({"type":"health"})");
    EXPECT_EQ((*health.value())["result"]["status"], "healthy");

    auto repair = dispatcher_.dispatch_line(R"({"type":"repair-folders"})");
    EXPECT_EQ((*repair.value())["result"]["repaired_count"], 0);

    std::filesystem::remove_all(dir);
}

TEST_F(DispatcherTest, RepliesWithoutSlotAreAccepted) {
    auto folder = dispatcher_.dispatch_line(
        R"({"type":"folder-created-response","transfer_id":"transfer-x","response":{"folder_id":"srv"}})");
    ASSERT_TRUE(folder.is_ok());
    EXPECT_FALSE(folder.value().has_value());

    auto error = dispatcher_.dispatch_line(
        R"({"type":"upload-error-response","transfer_id":"transfer-x","error":"denied"})");
    ASSERT_TRUE(error.is_ok());

    auto bad_reply = dispatcher_.dispatch_line(
        R"({"type":"upload-urls-response","transfer_id":"transfer-x","response":{"file_id":"f"}})");
    EXPECT_TRUE(bad_reply.is_error());
}
