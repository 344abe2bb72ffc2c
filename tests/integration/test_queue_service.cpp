/**
 * @file test_queue_service.cpp
 * @brief Integration test: QueueService over an in-process gRPC server
 */

#include <gtest/gtest.h>
#include <memqueue/core/errors.hpp>
#include <memqueue/core/memory_store.hpp>
#include <memqueue/services/queue_service.hpp>
#include <memqueue/utils/logger.hpp>

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <memory>
#include <stdexcept>
#include <string>

using namespace memqueue;

namespace {

// Every call throws Error
template<typename Error>
class FailingStore : public core::KeyValueStore {
public:
    std::optional<std::string> get(const std::string&) override { fail(); }
    void set(const std::string&, const std::string&) override { fail(); }
    bool add(const std::string&, const std::string&) override { fail(); }
    bool append(const std::string&, const std::string&) override { fail(); }
    bool remove(const std::string&) override { fail(); }
    void flushAll() override { fail(); }

private:
    [[noreturn]] static void fail() { throw Error("cache failure"); }
};

// Serves a queue over the given store and returns the status of one Put
grpc::StatusCode putStatusWith(std::shared_ptr<core::KeyValueStore> store) {
    services::QueueServiceImpl service(std::make_shared<core::MemQueue>(std::move(store)));

    int port = 0;
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
    builder.RegisterService(&service);
    auto server = builder.BuildAndStart();
    if (!server) {
        return grpc::StatusCode::UNKNOWN;
    }

    auto stub = proto::QueueService::NewStub(grpc::CreateChannel(
        "127.0.0.1:" + std::to_string(port), grpc::InsecureChannelCredentials()));

    grpc::ClientContext ctx;
    proto::PutRequest request;
    request.set_queue("jobs");
    request.set_payload("x");
    proto::PutResponse response;
    grpc::StatusCode code = stub->Put(&ctx, request, &response).error_code();

    server->Shutdown();
    return code;
}

}  // namespace

class QueueServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        store_ = std::make_shared<core::MemoryStore>();
        service_ = std::make_unique<services::QueueServiceImpl>(
            std::make_shared<core::MemQueue>(store_));

        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_TRUE(server_ != nullptr);
        ASSERT_GT(port, 0);

        stub_ = proto::QueueService::NewStub(grpc::CreateChannel(
            "127.0.0.1:" + std::to_string(port), grpc::InsecureChannelCredentials()));
    }

    void TearDown() override {
        if (server_) {
            server_->Shutdown();
        }
        utils::Logger::instance().setLevel(utils::LogLevel::INFO);
    }

    std::string put(const std::string& queue, const std::string& payload,
                    const std::string& client = "") {
        grpc::ClientContext ctx;
        proto::PutRequest request;
        request.set_queue(queue);
        request.set_payload(payload);
        request.set_client_id(client);
        proto::PutResponse response;
        grpc::Status status = stub_->Put(&ctx, request, &response);
        EXPECT_TRUE(status.ok()) << status.error_message();
        return response.message_key();
    }

    proto::MessageResponse next(const std::string& queue, const std::string& client) {
        grpc::ClientContext ctx;
        proto::NextRequest request;
        request.set_queue(queue);
        request.set_client_id(client);
        proto::MessageResponse response;
        grpc::Status status = stub_->Next(&ctx, request, &response);
        EXPECT_TRUE(status.ok()) << status.error_message();
        return response;
    }

    std::shared_ptr<core::MemoryStore> store_;
    std::unique_ptr<services::QueueServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<proto::QueueService::Stub> stub_;
};

// =============================================================================
// Happy path
// =============================================================================

TEST_F(QueueServiceTest, PutThenGet) {
    std::string key = put("jobs", "hello", "producer");
    EXPECT_EQ(key.rfind("jobs_producer_", 0), 0u) << key;

    grpc::ClientContext ctx;
    proto::GetRequest request;
    request.set_queue("jobs");
    request.set_message_key(key);
    proto::MessageResponse response;
    ASSERT_TRUE(stub_->Get(&ctx, request, &response).ok());
    EXPECT_TRUE(response.found());
    EXPECT_EQ(response.payload(), "hello");
}

TEST_F(QueueServiceTest, EmptyClientIdUsesDefault) {
    std::string key = put("jobs", "hello");
    EXPECT_EQ(key.rfind("jobs_UnknownClient_", 0), 0u) << key;
}

TEST_F(QueueServiceTest, GetMissingIsNotFound) {
    grpc::ClientContext ctx;
    proto::GetRequest request;
    request.set_queue("jobs");
    request.set_message_key("jobs_none_0_0");
    proto::MessageResponse response;
    ASSERT_TRUE(stub_->Get(&ctx, request, &response).ok());
    EXPECT_FALSE(response.found());
}

TEST_F(QueueServiceTest, NextWalksQueue) {
    put("jobs", "a");
    put("jobs", "b");

    auto first = next("jobs", "c1");
    EXPECT_TRUE(first.found());
    EXPECT_EQ(first.payload(), "a");
    EXPECT_EQ(next("jobs", "c1").payload(), "b");
    EXPECT_FALSE(next("jobs", "c1").found());
}

TEST_F(QueueServiceTest, LastListDeletePurge) {
    std::string k1 = put("jobs", "one");
    std::string k2 = put("jobs", "two");
    put("jobs", "three");

    {
        grpc::ClientContext ctx;
        proto::LastRequest request;
        request.set_queue("jobs");
        proto::MessageResponse response;
        ASSERT_TRUE(stub_->Last(&ctx, request, &response).ok());
        EXPECT_EQ(response.payload(), "three");
    }
    {
        grpc::ClientContext ctx;
        proto::ListRequest request;
        request.set_queue("jobs");
        proto::ListResponse response;
        ASSERT_TRUE(stub_->List(&ctx, request, &response).ok());
        ASSERT_EQ(response.message_keys_size(), 3);
        EXPECT_EQ(response.message_keys(0), k1);
        EXPECT_EQ(response.message_keys(1), k2);
    }
    {
        grpc::ClientContext ctx;
        proto::DeleteRequest request;
        request.set_queue("jobs");
        request.set_message_key(k1);
        proto::DeleteResponse response;
        ASSERT_TRUE(stub_->Delete(&ctx, request, &response).ok());
        EXPECT_TRUE(response.deleted());
    }
    {
        grpc::ClientContext ctx;
        proto::PurgeRequest request;
        request.set_queue("jobs");
        proto::PurgeResponse response;
        ASSERT_TRUE(stub_->Purge(&ctx, request, &response).ok());
        EXPECT_EQ(response.deleted_count(), 2u);
    }
}

TEST_F(QueueServiceTest, CheckQueueAndClientIds) {
    {
        grpc::ClientContext ctx;
        proto::CheckQueueRequest request;
        request.set_queue("jobs");
        proto::CheckQueueResponse response;
        ASSERT_TRUE(stub_->CheckQueue(&ctx, request, &response).ok());
        EXPECT_EQ(response.last_write(), 0.0);
    }

    put("jobs", "x");

    {
        grpc::ClientContext ctx;
        proto::CheckQueueRequest request;
        request.set_queue("jobs");
        proto::CheckQueueResponse response;
        ASSERT_TRUE(stub_->CheckQueue(&ctx, request, &response).ok());
        EXPECT_GT(response.last_write(), 0.0);
    }
    {
        grpc::ClientContext ctx;
        proto::CreateClientIdRequest request;
        proto::CreateClientIdResponse response;
        ASSERT_TRUE(stub_->CreateClientId(&ctx, request, &response).ok());
        EXPECT_EQ(response.client_id().size(), 36u);
    }
}

// =============================================================================
// Error mapping
// =============================================================================

TEST_F(QueueServiceTest, EmptyQueueNameIsInvalidArgument) {
    grpc::ClientContext ctx;
    proto::PutRequest request;
    request.set_payload("x");
    proto::PutResponse response;
    EXPECT_EQ(stub_->Put(&ctx, request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(QueueServiceTest, CorruptMarkerIsDataLoss) {
    store_->set("jobs", "garbage");

    grpc::ClientContext ctx;
    proto::CheckQueueRequest request;
    request.set_queue("jobs");
    proto::CheckQueueResponse response;
    EXPECT_EQ(stub_->CheckQueue(&ctx, request, &response).error_code(),
              grpc::StatusCode::DATA_LOSS);
}

TEST(QueueServiceFailureTest, CacheFailureIsUnavailable) {
    EXPECT_EQ(putStatusWith(std::make_shared<FailingStore<core::CacheError>>()),
              grpc::StatusCode::UNAVAILABLE);
}

TEST(QueueServiceFailureTest, UnexpectedErrorIsInternal) {
    EXPECT_EQ(putStatusWith(std::make_shared<FailingStore<std::runtime_error>>()),
              grpc::StatusCode::INTERNAL);
}

TEST_F(QueueServiceTest, DelimiterInClientIdIsInvalidArgument) {
    grpc::ClientContext ctx;
    proto::PutRequest request;
    request.set_queue("jobs");
    request.set_payload("x");
    request.set_client_id("a,b");
    proto::PutResponse response;
    EXPECT_EQ(stub_->Put(&ctx, request, &response).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}
