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

#ifndef _TOPOLOGY_MANAGER_H_
#define _TOPOLOGY_MANAGER_H_

#include <map>
#include <string>
#include <vector>

#include <oasys/compat/inttypes.h>
#include <oasys/debug/Logger.h>
#include <oasys/thread/SpinLock.h>
#include <oasys/util/StringBuffer.h>

namespace skydtn {

/**
 * Cartesian position (km) or velocity (km/s).
 */
struct Position {
    Position() : x_(0.0), y_(0.0), z_(0.0) {}
    Position(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double distance_to(const Position& other) const;

    double x_;
    double y_;
    double z_;
};

/**
 * Last known kinematic and power state of a tracked node.
 */
struct SatelliteState {
    SatelliteState();

    std::string id_;
    std::string eid_;
    Position    position_;
    Position    velocity_;
    double      battery_pct_;
    bool        in_eclipse_;
    u_int64_t   last_update_millis_;   ///< stamped by update_satellite
};

typedef std::vector<SatelliteState> SatelliteList;

/**
 * Tracks every known node's position, velocity and battery state and
 * derives which nodes can currently reach each other. Visibility is
 * purely geometric (distance within max_range) and symmetric; power
 * state is left to the router.
 */
class TopologyManager : public oasys::Logger {
public:
    struct Params {
        Params();

        /// Maximum communication range in km
        double max_range_km_;

        /// Battery percentage below which a node counts as low
        double low_battery_pct_;
    };

    static Params params_;

    /**
     * Aggregate counts over all tracked nodes.
     */
    struct NetworkStatistics {
        NetworkStatistics()
            : total_(0), low_battery_count_(0), eclipse_count_(0) {}

        size_t total_;
        size_t low_battery_count_;
        size_t eclipse_count_;
    };

    TopologyManager();
    virtual ~TopologyManager();

    /**
     * Insert or replace the state for state.id_, stamping the update
     * time.
     */
    void update_satellite(const SatelliteState& state);

    /// Forget a node; SKYDTN_ENOTFOUND if not tracked
    int remove_satellite(const std::string& id);

    /// Copy one node's state; SKYDTN_ENOTFOUND if not tracked
    int get_satellite(const std::string& id, SatelliteState* state) const;

    /**
     * All other tracked nodes within max range of the given node, in
     * id order. SKYDTN_ENOTFOUND if the node itself is not tracked.
     */
    int get_visible_neighbors(const std::string& id,
                              SatelliteList* neighbors) const;

    /**
     * Linear extrapolation of a node's position dt_secs into the
     * future from its last known velocity.
     */
    static Position predict_position(const SatelliteState& state,
                                     double dt_secs);

    /// Same as above for a tracked node
    int predict_position(const std::string& id, double dt_secs,
                         Position* position) const;

    /**
     * Link quality implied by a distance: 1 at zero range falling
     * linearly to 0 at max range.
     */
    static double link_quality(double distance_km);

    /// Distance between two tracked nodes; SKYDTN_ENOTFOUND if either is unknown
    int distance(const std::string& a, const std::string& b,
                 double* distance_km) const;

    NetworkStatistics get_network_statistics() const;

    size_t size() const;

    void dump(oasys::StringBuffer* buf) const;

protected:
    typedef std::map<std::string, SatelliteState> SatelliteMap;

    SatelliteMap            satellites_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _TOPOLOGY_MANAGER_H_ */
