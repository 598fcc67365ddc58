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

#ifndef _ENERGY_AWARE_ROUTER_H_
#define _ENERGY_AWARE_ROUTER_H_

#include <map>

#include <oasys/thread/SpinLock.h>

#include "BundleRouter.h"

namespace skydtn {

/**
 * Router that balances link quality against the neighbor's energy
 * state, steering traffic away from nodes about to lose power.
 *
 * An active neighbor whose endpoint is the destination is always
 * chosen. Otherwise each active neighbor scores
 *
 *   quality_weight * link_quality + energy_weight * energy_score
 *
 * where energy_score is 1, or the penalized score when the link
 * quality is below the low quality threshold (poor links track power
 * starvation) or a battery level reported through update_energy() is
 * below the low battery percentage. The highest score wins; on a tie
 * the neighbor seen first in the snapshot wins.
 */
class EnergyAwareRouter : public BundleRouter {
public:
    EnergyAwareRouter();
    virtual ~EnergyAwareRouter();

    /// Virtual from BundleRouter
    int select_next_hop(const Bundle&           bundle,
                        const NeighborSnapshot& neighbors,
                        std::string*            next_hop);

    /// Virtual from BundleRouter
    void get_routing_state(oasys::StringBuffer* buf);

    /**
     * Record the battery percentage last reported by a neighbor.
     * Virtual from BundleRouter.
     */
    void update_energy(const std::string& neighbor_id, double battery_pct);

    /**
     * Forget the battery level of a neighbor.
     */
    void clear_energy(const std::string& neighbor_id);

    /**
     * Score a single neighbor with the current configuration.
     */
    double score(const Neighbor& neighbor) const;

protected:
    /// Energy estimate for a neighbor in [0,1]
    double energy_score(const Neighbor& neighbor) const;

    typedef std::map<std::string, double> EnergyMap;

    EnergyMap               energy_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _ENERGY_AWARE_ROUTER_H_ */
