/**
 * @file BLEHandleResolver.h
 * @brief Resolves characteristic UUIDs to attribute handles
 *
 * Lookups run against the session's current ServiceCatalog snapshot. On a
 * miss the resolver runs service discovery exactly once, swaps the new
 * snapshot in, and searches again. A second miss is final.
 *
 * Discovery runs without the session mutex held; only the snapshot swap is
 * done under the lock, so notification dispatch is not blocked by the
 * discovery round trips.
 */
#pragma once

#include "BLETypes.h"
#include "BLEUUID.h"
#include "BLEServiceCatalog.h"
#include "BLETransport.h"

#include <mutex>

namespace GattLink { namespace BLE {

class BLEHandleResolver {
public:
    /**
     * @param transport Backend used for discovery
     * @param mutex Session mutex guarding the snapshot pointer
     */
    BLEHandleResolver(IBLETransport& transport, std::recursive_mutex& mutex);

    /**
     * @brief Resolve a characteristic
     *
     * @param characteristic Characteristic UUID
     * @param service Service scope (nullptr = any service)
     * @return The matching characteristic
     * @throws CharacteristicNotFoundError if nothing matches after one refresh
     * @throws AmbiguousCharacteristicError for several matches under
     *         AmbiguityPolicy::REJECT
     * @throws TransportError if discovery fails
     */
    Characteristic resolve(const BLEUUID& characteristic, const BLEUUID* service = nullptr);

    /**
     * @brief Run discovery and replace the snapshot unconditionally
     *
     * @throws TransportError if discovery fails (snapshot is kept)
     */
    ServiceCatalog::Ptr refresh();

    /**
     * @brief Get the current snapshot (never null)
     */
    ServiceCatalog::Ptr snapshot() const;

    /**
     * @brief Drop the cached snapshot
     */
    void reset();

    void setAmbiguityPolicy(AmbiguityPolicy policy);
    AmbiguityPolicy getAmbiguityPolicy() const;

    void setRefreshOnMiss(bool enabled);

    /**
     * @brief Number of snapshots swapped in by discovery
     */
    uint32_t refreshCount() const;

private:
    /**
     * @brief Search one snapshot
     * @return true if found, false on a miss
     */
    bool lookup(const ServiceCatalog& catalog, const BLEUUID& characteristic,
                const BLEUUID* service, Characteristic& found) const;

    static std::string describe(const BLEUUID& characteristic, const BLEUUID* service);

    IBLETransport& _transport;
    std::recursive_mutex& _mutex;

    ServiceCatalog::Ptr _catalog;
    AmbiguityPolicy _ambiguity_policy = AmbiguityPolicy::REJECT;
    bool _refresh_on_miss = true;
    uint32_t _refresh_count = 0;
};

}} // namespace GattLink::BLE
