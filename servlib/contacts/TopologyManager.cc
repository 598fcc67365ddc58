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

#include <math.h>

#include <oasys/debug/Log.h>

#include "TopologyManager.h"
#include "bundling/BundleTimestamp.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
double
Position::distance_to(const Position& other) const
{
    double dx = x_ - other.x_;
    double dy = y_ - other.y_;
    double dz = z_ - other.z_;
    return sqrt(dx*dx + dy*dy + dz*dz);
}

//----------------------------------------------------------------------
SatelliteState::SatelliteState()
    : battery_pct_(100.0),
      in_eclipse_(false),
      last_update_millis_(0)
{
}

//----------------------------------------------------------------------
TopologyManager::Params::Params()
    : max_range_km_(5000.0),
      low_battery_pct_(20.0)
{}

TopologyManager::Params TopologyManager::params_;

//----------------------------------------------------------------------
TopologyManager::TopologyManager()
    : Logger("TopologyManager", "/skydtn/contacts/topology")
{
}

//----------------------------------------------------------------------
TopologyManager::~TopologyManager()
{
}

//----------------------------------------------------------------------
void
TopologyManager::update_satellite(const SatelliteState& state)
{
    oasys::ScopeLock l(&lock_, "TopologyManager::update_satellite");

    SatelliteState& entry = satellites_[state.id_];
    entry = state;
    entry.last_update_millis_ = BundleTimestamp::get_current_time_millis();

    log_debug("update %s: pos (%.1f, %.1f, %.1f) battery %.1f%%%s",
              state.id_.c_str(), state.position_.x_, state.position_.y_,
              state.position_.z_, state.battery_pct_,
              state.in_eclipse_ ? " eclipse" : "");
}

//----------------------------------------------------------------------
int
TopologyManager::remove_satellite(const std::string& id)
{
    oasys::ScopeLock l(&lock_, "TopologyManager::remove_satellite");

    if (satellites_.erase(id) == 0) {
        return SKYDTN_ENOTFOUND;
    }
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
TopologyManager::get_satellite(const std::string& id,
                               SatelliteState* state) const
{
    oasys::ScopeLock l(&lock_, "TopologyManager::get_satellite");

    SatelliteMap::const_iterator iter = satellites_.find(id);
    if (iter == satellites_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    *state = iter->second;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
TopologyManager::get_visible_neighbors(const std::string& id,
                                       SatelliteList* neighbors) const
{
    oasys::ScopeLock l(&lock_, "TopologyManager::get_visible_neighbors");

    SatelliteMap::const_iterator self = satellites_.find(id);
    if (self == satellites_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    neighbors->clear();

    SatelliteMap::const_iterator iter;
    for (iter = satellites_.begin(); iter != satellites_.end(); ++iter) {
        if (iter == self) {
            continue;
        }

        double d = self->second.position_.distance_to(iter->second.position_);
        if (d <= params_.max_range_km_) {
            neighbors->push_back(iter->second);
        }
    }

    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
Position
TopologyManager::predict_position(const SatelliteState& state, double dt_secs)
{
    return Position(state.position_.x_ + state.velocity_.x_ * dt_secs,
                    state.position_.y_ + state.velocity_.y_ * dt_secs,
                    state.position_.z_ + state.velocity_.z_ * dt_secs);
}

//----------------------------------------------------------------------
int
TopologyManager::predict_position(const std::string& id, double dt_secs,
                                  Position* position) const
{
    SatelliteState state;
    int err = get_satellite(id, &state);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    *position = predict_position(state, dt_secs);
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
double
TopologyManager::link_quality(double distance_km)
{
    if (params_.max_range_km_ <= 0.0 || distance_km >= params_.max_range_km_) {
        return 0.0;
    }
    if (distance_km <= 0.0) {
        return 1.0;
    }
    return 1.0 - (distance_km / params_.max_range_km_);
}

//----------------------------------------------------------------------
int
TopologyManager::distance(const std::string& a, const std::string& b,
                          double* distance_km) const
{
    oasys::ScopeLock l(&lock_, "TopologyManager::distance");

    SatelliteMap::const_iterator ia = satellites_.find(a);
    SatelliteMap::const_iterator ib = satellites_.find(b);
    if (ia == satellites_.end() || ib == satellites_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    *distance_km = ia->second.position_.distance_to(ib->second.position_);
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
TopologyManager::NetworkStatistics
TopologyManager::get_network_statistics() const
{
    NetworkStatistics stats;

    oasys::ScopeLock l(&lock_, "TopologyManager::get_network_statistics");

    stats.total_ = satellites_.size();

    SatelliteMap::const_iterator iter;
    for (iter = satellites_.begin(); iter != satellites_.end(); ++iter) {
        if (iter->second.battery_pct_ < params_.low_battery_pct_) {
            ++stats.low_battery_count_;
        }
        if (iter->second.in_eclipse_) {
            ++stats.eclipse_count_;
        }
    }

    return stats;
}

//----------------------------------------------------------------------
size_t
TopologyManager::size() const
{
    oasys::ScopeLock l(&lock_, "TopologyManager::size");
    return satellites_.size();
}

//----------------------------------------------------------------------
void
TopologyManager::dump(oasys::StringBuffer* buf) const
{
    oasys::ScopeLock l(&lock_, "TopologyManager::dump");

    buf->appendf("Tracked nodes (%zu), max range %.1f km:\n",
                 satellites_.size(), params_.max_range_km_);

    SatelliteMap::const_iterator iter;
    for (iter = satellites_.begin(); iter != satellites_.end(); ++iter) {
        const SatelliteState& s = iter->second;
        buf->appendf("  %-16s %-32s pos (%.1f, %.1f, %.1f) vel (%.3f, %.3f, %.3f) "
                     "battery %.1f%%%s\n",
                     s.id_.c_str(), s.eid_.c_str(),
                     s.position_.x_, s.position_.y_, s.position_.z_,
                     s.velocity_.x_, s.velocity_.y_, s.velocity_.z_,
                     s.battery_pct_, s.in_eclipse_ ? " eclipse" : "");
    }
}

} // namespace skydtn
