/*
 *    Copyright 2015 United States Government as represented by NASA
 *       Marshall Space Flight Center. All Rights Reserved.
 *
 *    Released under the NASA Open Source Software Agreement version 1.3;
 *    You may obtain a copy of the Agreement at:
 * 
 *        http://ti.arc.nasa.gov/opensource/nosa/
 * 
 *    The subject software is provided "AS IS" WITHOUT ANY WARRANTY of any kind,
 *    either expressed, implied or statutory and this agreement does not,
 *    in any manner, constitute an endorsement by government agency of any
 *    results, designs or products resulting from use of the subject software.
 *    See the Agreement for the specific language governing permissions and
 *    limitations.
 */

#ifndef _BUNDLE_ROUTER_H_
#define _BUNDLE_ROUTER_H_

#include <string>

#include <oasys/debug/Logger.h>
#include <oasys/util/StringBuffer.h>

#include "bundling/Bundle.h"
#include "contacts/Neighbor.h"

namespace skydtn {

/**
 * The BundleRouter makes the next hop decision for a bundle.
 *
 * A router only ever sees a snapshot of the node's neighbor table and
 * must not keep references into it. Given the same bundle and the same
 * snapshot a router always picks the same neighbor.
 *
 * To support trying different routing policies, the base class has a
 * factory that selects the implementation by name at boot time from
 * BundleRouter::config_.type_.
 */
class BundleRouter : public oasys::Logger {
public:
    /**
     * Factory method to create the correct subclass of BundleRouter
     * for the given type. Returns NULL for an unknown type, or for
     * the energy router when validate_config() fails.
     */
    static BundleRouter* create_router(const char* type);

    /**
     * Config variables. These must be static since they're set by
     * the config parser before any router objects are created.
     */
    static struct Config {
        Config();

        /// The routing algorithm type
        std::string type_;

        /// Weight of the link quality in a neighbor's score
        double quality_weight_;

        /// Weight of the energy estimate in a neighbor's score
        double energy_weight_;

        /// Link quality below which a neighbor is assumed to be short
        /// on power
        double low_quality_threshold_;

        /// Energy score given to a neighbor assumed short on power
        double penalized_energy_score_;

        /// Known battery percentage below which the penalty applies
        double low_battery_pct_;
    } config_;

    /**
     * Check the scoring configuration: both weights non-negative and
     * summing to 1, thresholds and the penalized score in range.
     *
     * @return SKYDTN_SUCCESS or SKYDTN_EVALIDATION, with the reason
     *         appended to errbuf if one is given
     */
    static int validate_config(oasys::StringBuffer* errbuf = NULL);

    virtual ~BundleRouter();

    /**
     * Choose the next hop for the bundle among the active neighbors
     * in the snapshot.
     *
     * @return SKYDTN_SUCCESS with the neighbor id in *next_hop, or
     *         SKYDTN_ENOROUTE if no active neighbor is eligible
     */
    virtual int select_next_hop(const Bundle&           bundle,
                                const NeighborSnapshot& neighbors,
                                std::string*            next_hop) = 0;

    /**
     * Format the given StringBuffer with current routing info.
     */
    virtual void get_routing_state(oasys::StringBuffer* buf) = 0;

    /**
     * Hook for telemetry reporting a neighbor's battery level. The
     * default implementation ignores it.
     */
    virtual void update_energy(const std::string& neighbor_id,
                               double battery_pct);

    /// Router type name
    const std::string& name() const { return name_; }

protected:
    BundleRouter(const char* classname, const std::string& name);

    /**
     * Find an active neighbor whose endpoint is the bundle's
     * destination.
     */
    static const Neighbor* find_direct(const Bundle&           bundle,
                                       const NeighborSnapshot& neighbors);

    /// True if the snapshot has at least one active neighbor
    static bool any_active(const NeighborSnapshot& neighbors);

    std::string name_;
};

} // namespace skydtn

#endif /* _BUNDLE_ROUTER_H_ */
