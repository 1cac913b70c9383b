/**
 * @file PendingRequests.cpp
 * @brief Proxy request tracking implementation
 */

#include "PendingRequests.h"
#include "Log.h"

namespace BLEBridge { namespace ESPHome {

using namespace RNS;

PendingRequests::PendingRequests() {
}

void PendingRequests::add(PendingRequest request) {
    add(std::move(request), Utilities::OS::time());
}

void PendingRequests::add(PendingRequest request, double now) {
    request.started_at = now;
    if (request.timeout <= 0) {
        request.timeout = Timing::DEFAULT_OPERATION_TIMEOUT;
    }

    TRACE("PendingRequests: Added " + std::string(requestTypeToString(request.type)) +
          " for " + addressToString(request.address) + ", depth: " +
          std::to_string(_requests.size() + 1));

    _requests.push_back(std::move(request));
}

void PendingRequests::finish(PendingRequest& request, OperationResult result, const std::string& detail) {
    if (request.type == RequestType::GET_SERVICES) {
        if (request.on_services) {
            request.on_services(result, detail, request.services);
        }
    } else if (request.on_result) {
        request.on_result(result, detail);
    }
}

bool PendingRequests::complete(RequestType type, uint64_t address, uint16_t handle,
                               OperationResult result, const std::string& detail) {
    bool match_handle = (type == RequestType::WRITE || type == RequestType::NOTIFY);

    for (auto it = _requests.begin(); it != _requests.end(); ++it) {
        if (it->type != type || it->address != address) {
            continue;
        }
        if (match_handle && it->handle != handle) {
            continue;
        }

        PendingRequest request = std::move(*it);
        _requests.erase(it);

        TRACE("PendingRequests: Completed " + std::string(requestTypeToString(type)) +
              " for " + addressToString(address) + " in " +
              std::to_string(static_cast<int>((Utilities::OS::time() - request.started_at) * 1000)) +
              "ms, result: " + resultToString(result));

        finish(request, result, detail);
        return true;
    }
    return false;
}

bool PendingRequests::appendServices(uint64_t address, const std::vector<GATTService>& services) {
    for (auto& request : _requests) {
        if (request.type == RequestType::GET_SERVICES && request.address == address) {
            request.services.insert(request.services.end(), services.begin(), services.end());
            return true;
        }
    }
    return false;
}

bool PendingRequests::completeServices(uint64_t address, OperationResult result, const std::string& detail) {
    return complete(RequestType::GET_SERVICES, address, 0, result, detail);
}

bool PendingRequests::failForHandle(uint64_t address, uint16_t handle, const std::string& detail) {
    for (auto it = _requests.begin(); it != _requests.end(); ++it) {
        if (it->address != address || it->handle != handle) {
            continue;
        }
        if (it->type != RequestType::WRITE && it->type != RequestType::NOTIFY) {
            continue;
        }
        PendingRequest request = std::move(*it);
        _requests.erase(it);
        finish(request, OperationResult::ERROR, detail);
        return true;
    }
    return complete(RequestType::GET_SERVICES, address, 0, OperationResult::ERROR, detail);
}

bool PendingRequests::has(RequestType type, uint64_t address) const {
    for (const auto& request : _requests) {
        if (request.type == type && request.address == address) {
            return true;
        }
    }
    return false;
}

size_t PendingRequests::checkTimeouts() {
    return checkTimeouts(Utilities::OS::time());
}

size_t PendingRequests::checkTimeouts(double now) {
    std::vector<PendingRequest> expired;

    for (auto it = _requests.begin(); it != _requests.end();) {
        if (now - it->started_at > it->timeout) {
            expired.push_back(std::move(*it));
            it = _requests.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& request : expired) {
        WARNING("PendingRequests: " + std::string(requestTypeToString(request.type)) +
                " for " + addressToString(request.address) + " timed out after " +
                std::to_string(static_cast<int>((now - request.started_at) * 1000)) + "ms");
        finish(request, OperationResult::TIMEOUT, "timed out");
    }

    return expired.size();
}

void PendingRequests::finishMatching(const std::function<bool(const PendingRequest&)>& match,
                                     OperationResult result, const std::string& detail) {
    std::vector<PendingRequest> cancelled;

    for (auto it = _requests.begin(); it != _requests.end();) {
        if (match(*it)) {
            cancelled.push_back(std::move(*it));
            it = _requests.erase(it);
        } else {
            ++it;
        }
    }

    for (auto& request : cancelled) {
        finish(request, result, detail);
    }
}

void PendingRequests::clearForAddress(uint64_t address, OperationResult result, const std::string& detail) {
    finishMatching([address](const PendingRequest& request) {
        return request.address == address;
    }, result, detail);

    TRACE("PendingRequests: Cleared requests for " + addressToString(address));
}

void PendingRequests::clearType(RequestType type, uint64_t address, OperationResult result,
                                const std::string& detail) {
    finishMatching([type, address](const PendingRequest& request) {
        return request.type == type && request.address == address;
    }, result, detail);
}

void PendingRequests::clear(OperationResult result, const std::string& detail) {
    finishMatching([](const PendingRequest&) { return true; }, result, detail);

    TRACE("PendingRequests: Cleared all requests");
}

}} // namespace BLEBridge::ESPHome
