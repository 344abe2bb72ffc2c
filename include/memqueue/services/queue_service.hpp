/**
 * @file queue_service.hpp
 * @brief gRPC front end of a MemQueue.
 *
 * Lets applications without a cache client use a queue through the
 * memqueued daemon. Each RPC is one MemQueue call.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/mem_queue.hpp"
#include "memqueue/services/export.hpp"

#include <grpcpp/grpcpp.h>

#include <functional>
#include <memory>

// Generated gRPC service base
#include "memqueue/proto/memqueue.grpc.pb.h"

namespace memqueue {
namespace services {

/**
 * @class QueueServiceImpl
 * @brief Callback-API implementation of memqueue.proto.QueueService.
 *
 * Error mapping:
 * - core::CacheError         -> UNAVAILABLE
 * - core::CorruptStateError  -> DATA_LOSS
 * - core::NotSupportedError  -> UNIMPLEMENTED
 * - std::invalid_argument    -> INVALID_ARGUMENT
 *
 * Usage:
 * @code
 * auto queue = std::make_shared<core::MemQueue>(store, config);
 * QueueServiceImpl service(queue);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:7711", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class MEMQUEUE_SERVICES_API QueueServiceImpl final : public proto::QueueService::CallbackService {
public:
    static constexpr int DEFAULT_LIST_WINDOW = 10;
    static constexpr int DEFAULT_PURGE_WINDOW = 30;

    explicit QueueServiceImpl(std::shared_ptr<core::MemQueue> queue);
    ~QueueServiceImpl() override = default;

    grpc::ServerUnaryReactor* Put(grpc::CallbackServerContext* context,
                                  const proto::PutRequest* request,
                                  proto::PutResponse* response) override;

    grpc::ServerUnaryReactor* Get(grpc::CallbackServerContext* context,
                                  const proto::GetRequest* request,
                                  proto::MessageResponse* response) override;

    grpc::ServerUnaryReactor* Last(grpc::CallbackServerContext* context,
                                   const proto::LastRequest* request,
                                   proto::MessageResponse* response) override;

    grpc::ServerUnaryReactor* Next(grpc::CallbackServerContext* context,
                                   const proto::NextRequest* request,
                                   proto::MessageResponse* response) override;

    grpc::ServerUnaryReactor* List(grpc::CallbackServerContext* context,
                                   const proto::ListRequest* request,
                                   proto::ListResponse* response) override;

    grpc::ServerUnaryReactor* Delete(grpc::CallbackServerContext* context,
                                     const proto::DeleteRequest* request,
                                     proto::DeleteResponse* response) override;

    grpc::ServerUnaryReactor* Purge(grpc::CallbackServerContext* context,
                                    const proto::PurgeRequest* request,
                                    proto::PurgeResponse* response) override;

    grpc::ServerUnaryReactor* CheckQueue(grpc::CallbackServerContext* context,
                                         const proto::CheckQueueRequest* request,
                                         proto::CheckQueueResponse* response) override;

    grpc::ServerUnaryReactor* CreateClientId(grpc::CallbackServerContext* context,
                                             const proto::CreateClientIdRequest* request,
                                             proto::CreateClientIdResponse* response) override;

private:
    std::shared_ptr<core::MemQueue> queue_;

    /**
     * @brief Run @p handler and finish the call with its mapped status.
     */
    static grpc::ServerUnaryReactor* respond(const char* rpc, std::function<void()> handler);
};

}  // namespace services
}  // namespace memqueue
