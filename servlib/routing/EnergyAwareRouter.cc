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

#ifdef HAVE_CONFIG_H
#  include <skydtn-config.h>
#endif

#include <oasys/debug/Log.h>

#include "EnergyAwareRouter.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
EnergyAwareRouter::EnergyAwareRouter()
    : BundleRouter("EnergyAwareRouter", "energy")
{
}

//----------------------------------------------------------------------
EnergyAwareRouter::~EnergyAwareRouter()
{
}

//----------------------------------------------------------------------
void
EnergyAwareRouter::update_energy(const std::string& neighbor_id,
                                 double battery_pct)
{
    oasys::ScopeLock l(&lock_, "EnergyAwareRouter::update_energy");
    energy_[neighbor_id] = battery_pct;
}

//----------------------------------------------------------------------
void
EnergyAwareRouter::clear_energy(const std::string& neighbor_id)
{
    oasys::ScopeLock l(&lock_, "EnergyAwareRouter::clear_energy");
    energy_.erase(neighbor_id);
}

//----------------------------------------------------------------------
double
EnergyAwareRouter::energy_score(const Neighbor& neighbor) const
{
    if (neighbor.link_quality_ < config_.low_quality_threshold_) {
        return config_.penalized_energy_score_;
    }

    oasys::ScopeLock l(&lock_, "EnergyAwareRouter::energy_score");

    EnergyMap::const_iterator iter = energy_.find(neighbor.id_);
    if (iter != energy_.end() && iter->second < config_.low_battery_pct_) {
        return config_.penalized_energy_score_;
    }

    return 1.0;
}

//----------------------------------------------------------------------
double
EnergyAwareRouter::score(const Neighbor& neighbor) const
{
    return (config_.quality_weight_ * neighbor.link_quality_) +
           (config_.energy_weight_  * energy_score(neighbor));
}

//----------------------------------------------------------------------
int
EnergyAwareRouter::select_next_hop(const Bundle&           bundle,
                                   const NeighborSnapshot& neighbors,
                                   std::string*            next_hop)
{
    const Neighbor* direct = find_direct(bundle, neighbors);
    if (direct != NULL) {
        log_debug("select_next_hop: %s is the destination of bundle %s",
                  direct->id_.c_str(), bundle.id().c_str());
        *next_hop = direct->id_;
        return SKYDTN_SUCCESS;
    }

    const Neighbor* best = NULL;
    double best_score = 0.0;

    NeighborSnapshot::const_iterator iter;
    for (iter = neighbors.begin(); iter != neighbors.end(); ++iter) {
        if (! iter->active_) {
            continue;
        }

        double s = score(*iter);
        log_debug("select_next_hop: bundle %s candidate %s score %.3f",
                  bundle.id().c_str(), iter->id_.c_str(), s);

        // strictly greater so the first seen keeps a tie
        if (best == NULL || s > best_score) {
            best = &(*iter);
            best_score = s;
        }
    }

    if (best == NULL) {
        log_debug("select_next_hop: no active neighbor for bundle %s",
                  bundle.id().c_str());
        return SKYDTN_ENOROUTE;
    }

    *next_hop = best->id_;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
void
EnergyAwareRouter::get_routing_state(oasys::StringBuffer* buf)
{
    buf->appendf("Energy aware router: quality weight %.2f energy weight %.2f "
                 "low quality %.2f penalty %.2f low battery %.1f%%\n",
                 config_.quality_weight_, config_.energy_weight_,
                 config_.low_quality_threshold_,
                 config_.penalized_energy_score_, config_.low_battery_pct_);

    oasys::ScopeLock l(&lock_, "EnergyAwareRouter::get_routing_state");

    buf->appendf("Known battery levels (%zu):\n", energy_.size());
    EnergyMap::const_iterator iter;
    for (iter = energy_.begin(); iter != energy_.end(); ++iter) {
        buf->appendf("  %-16s %.1f%%\n", iter->first.c_str(), iter->second);
    }
}

} // namespace skydtn
