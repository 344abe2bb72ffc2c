/**
 * @file queue_service.cpp
 * @brief QueueServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/services/queue_service.hpp"
#include "memqueue/core/errors.hpp"
#include "memqueue/utils/logger.hpp"

#include <stdexcept>

namespace memqueue {
namespace services {

namespace {

const std::string& clientOrDefault(const std::string& clientId) {
    return clientId.empty() ? core::DEFAULT_CLIENT_ID : clientId;
}

void fillMessage(const std::optional<std::string>& payload, proto::MessageResponse* response) {
    response->set_found(payload.has_value());
    if (payload) {
        response->set_payload(*payload);
    }
}

}  // namespace

// =============================================================================
// UnaryReactor - finishes immediately with the handler's outcome
// =============================================================================

class UnaryReactor : public grpc::ServerUnaryReactor {
public:
    UnaryReactor(const char* rpc, const std::function<void()>& handler) {
        grpc::Status status = grpc::Status::OK;
        try {
            handler();
        } catch (const core::CacheError& e) {
            status = grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
        } catch (const core::CorruptStateError& e) {
            status = grpc::Status(grpc::StatusCode::DATA_LOSS, e.what());
        } catch (const core::NotSupportedError& e) {
            status = grpc::Status(grpc::StatusCode::UNIMPLEMENTED, e.what());
        } catch (const std::invalid_argument& e) {
            status = grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
        } catch (const std::exception& e) {
            status = grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }

        if (!status.ok()) {
            LOG_WARN("QueueService", "{} failed: {}", rpc, status.error_message());
        }
        Finish(status);
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// QueueServiceImpl
// =============================================================================

QueueServiceImpl::QueueServiceImpl(std::shared_ptr<core::MemQueue> queue)
    : queue_(std::move(queue))
{
    if (!queue_) {
        throw std::invalid_argument("QueueServiceImpl needs a queue");
    }
    LOG_INFO("QueueService", "Created queue service");
}

grpc::ServerUnaryReactor* QueueServiceImpl::respond(const char* rpc,
                                                    std::function<void()> handler) {
    return new UnaryReactor(rpc, handler);
}

grpc::ServerUnaryReactor* QueueServiceImpl::Put(grpc::CallbackServerContext* context,
                                                const proto::PutRequest* request,
                                                proto::PutResponse* response) {
    return respond("Put", [this, request, response]() {
        response->set_message_key(queue_->put(request->queue(), request->payload(),
                                              clientOrDefault(request->client_id())));
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::Get(grpc::CallbackServerContext* context,
                                                const proto::GetRequest* request,
                                                proto::MessageResponse* response) {
    return respond("Get", [this, request, response]() {
        fillMessage(queue_->get(request->queue(), request->message_key(),
                                clientOrDefault(request->client_id())),
                    response);
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::Last(grpc::CallbackServerContext* context,
                                                 const proto::LastRequest* request,
                                                 proto::MessageResponse* response) {
    return respond("Last", [this, request, response]() {
        fillMessage(queue_->last(request->queue(), clientOrDefault(request->client_id())),
                    response);
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::Next(grpc::CallbackServerContext* context,
                                                 const proto::NextRequest* request,
                                                 proto::MessageResponse* response) {
    return respond("Next", [this, request, response]() {
        fillMessage(queue_->nextmsg(request->queue(), clientOrDefault(request->client_id())),
                    response);
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::List(grpc::CallbackServerContext* context,
                                                 const proto::ListRequest* request,
                                                 proto::ListResponse* response) {
    return respond("List", [this, request, response]() {
        int window = request->window_minutes() > 0 ? request->window_minutes()
                                                   : DEFAULT_LIST_WINDOW;
        for (auto& key : queue_->listMessages(request->queue(), window,
                                              clientOrDefault(request->client_id()))) {
            response->add_message_keys(std::move(key));
        }
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::Delete(grpc::CallbackServerContext* context,
                                                   const proto::DeleteRequest* request,
                                                   proto::DeleteResponse* response) {
    return respond("Delete", [this, request, response]() {
        response->set_deleted(queue_->remove(request->queue(), request->message_key()));
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::Purge(grpc::CallbackServerContext* context,
                                                  const proto::PurgeRequest* request,
                                                  proto::PurgeResponse* response) {
    return respond("Purge", [this, request, response]() {
        int window = request->window_minutes() > 0 ? request->window_minutes()
                                                   : DEFAULT_PURGE_WINDOW;
        response->set_deleted_count(queue_->purgeQueue(request->queue(), window,
                                                       clientOrDefault(request->client_id())));
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::CheckQueue(grpc::CallbackServerContext* context,
                                                       const proto::CheckQueueRequest* request,
                                                       proto::CheckQueueResponse* response) {
    return respond("CheckQueue", [this, request, response]() {
        response->set_last_write(queue_->checkQueue(request->queue()));
    });
}

grpc::ServerUnaryReactor* QueueServiceImpl::CreateClientId(
    grpc::CallbackServerContext* context,
    const proto::CreateClientIdRequest* request,
    proto::CreateClientIdResponse* response) {

    return respond("CreateClientId", [response]() {
        response->set_client_id(core::MemQueue::createClientID());
    });
}

}  // namespace services
}  // namespace memqueue
