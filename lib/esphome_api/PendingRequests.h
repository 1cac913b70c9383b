/**
 * @file PendingRequests.h
 * @brief Tracks proxy requests awaiting a response, with per-request timeouts
 *
 * The native API answers Bluetooth requests asynchronously and identifies
 * the answer only by device address (and GATT handle). Each request sent
 * to the proxy is recorded here; the response handler completes the oldest
 * matching entry, and checkTimeouts() from the main loop fails entries
 * whose deadline has passed.
 *
 * Callbacks are always invoked after the entry has been removed, so they
 * may freely add or cancel other requests.
 */
#pragma once

#include "APITypes.h"
#include "Utilities/OS.h"

#include <deque>
#include <vector>
#include <functional>

namespace BLEBridge { namespace ESPHome {

struct PendingRequest {
    RequestType type = RequestType::DEVICE_CONNECT;
    uint64_t address = 0;
    uint16_t handle = 0;                // WRITE and NOTIFY only
    double timeout = Timing::DEFAULT_OPERATION_TIMEOUT;

    // Exactly one of these is set; GET_SERVICES uses on_services
    Callbacks::OnResult on_result;
    Callbacks::OnServices on_services;

    // Internal tracking
    double started_at = 0;
    std::vector<GATTService> services;  // accumulated GET_SERVICES responses
};

class PendingRequests {
public:
    PendingRequests();

    /**
     * @brief Record a request that has been sent to the proxy
     *
     * @param request Request to track; started_at is stamped here
     */
    void add(PendingRequest request);
    void add(PendingRequest request, double now);

    /**
     * @brief Complete the oldest request matching type and address
     *
     * For WRITE and NOTIFY the handle must match as well.
     *
     * @return true if a request was completed
     */
    bool complete(RequestType type, uint64_t address, uint16_t handle,
                  OperationResult result, const std::string& detail = std::string());

    /**
     * @brief Append services to an in-flight GET_SERVICES request
     * @return true if a matching request exists
     */
    bool appendServices(uint64_t address, const std::vector<GATTService>& services);

    /**
     * @brief Complete an in-flight GET_SERVICES request with its accumulated services
     */
    bool completeServices(uint64_t address, OperationResult result,
                          const std::string& detail = std::string());

    /**
     * @brief Fail the request a GATT error refers to
     *
     * Matches WRITE/NOTIFY on (address, handle) first, then GET_SERVICES on address.
     */
    bool failForHandle(uint64_t address, uint16_t handle, const std::string& detail);

    bool has(RequestType type, uint64_t address) const;

    /**
     * @brief Fail every request whose deadline has passed
     * @return Number of requests timed out
     */
    size_t checkTimeouts();
    size_t checkTimeouts(double now);

    /**
     * @brief Cancel all requests for one device address
     *
     * Call this when a device connection is terminated to fail orphaned requests.
     */
    void clearForAddress(uint64_t address, OperationResult result,
                         const std::string& detail = std::string());

    /**
     * @brief Cancel all requests of one type for one device address
     */
    void clearType(RequestType type, uint64_t address, OperationResult result,
                   const std::string& detail = std::string());

    /**
     * @brief Cancel everything (link lost or transport stopped)
     */
    void clear(OperationResult result, const std::string& detail = std::string());

    size_t depth() const { return _requests.size(); }

private:
    static void finish(PendingRequest& request, OperationResult result, const std::string& detail);
    void finishMatching(const std::function<bool(const PendingRequest&)>& match,
                        OperationResult result, const std::string& detail);

    std::deque<PendingRequest> _requests;
};

}} // namespace BLEBridge::ESPHome
