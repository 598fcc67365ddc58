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

#ifndef _NEIGHBOR_H_
#define _NEIGHBOR_H_

#include <string>
#include <vector>

#include <oasys/compat/inttypes.h>
#include <oasys/debug/Logger.h>
#include <oasys/thread/SpinLock.h>
#include <oasys/util/StringBuffer.h>

namespace skydtn {

/**
 * Node-local view of a reachable peer. Neighbors come and go with
 * telemetry and link state; they are never persisted and hold no
 * reference to any bundle.
 */
struct Neighbor {
    Neighbor();
    Neighbor(const std::string& id, const std::string& eid, double link_quality);

    /**
     * Clamp a quality score into [0,1].
     */
    static double clamp_quality(double quality);

    std::string id_;                    ///< neighbor node id
    std::string eid_;                   ///< neighbor endpoint id
    double      link_quality_;          ///< 0 (unusable) .. 1 (perfect)
    u_int64_t   last_contact_millis_;   ///< millis since 1/1/2000
    bool        active_;
};

/**
 * A point-in-time copy of a neighbor table, in the order the
 * neighbors were first seen.
 */
typedef std::vector<Neighbor> NeighborSnapshot;

/**
 * The live neighbor table of a node, keyed by neighbor id. All access
 * is serialized; readers such as the router only ever get a snapshot.
 */
class NeighborTable : public oasys::Logger {
public:
    NeighborTable();

    /**
     * Insert a neighbor, or refresh an existing one (endpoint, quality
     * and contact time) and mark it active again.
     *
     * @return true if the neighbor was not known before
     */
    bool add(const std::string& id, const std::string& eid, double link_quality);

    /// Remove a neighbor; SKYDTN_ENOTFOUND if not present
    int remove(const std::string& id);

    /// Set the quality and contact time; SKYDTN_ENOTFOUND if not present
    int update_quality(const std::string& id, double link_quality);

    /// Refresh the contact time only; SKYDTN_ENOTFOUND if not present
    int touch(const std::string& id);

    /// Set the active flag; SKYDTN_ENOTFOUND if not present
    int set_active(const std::string& id, bool active);

    /// Copy one entry; false if not present
    bool find(const std::string& id, Neighbor* neighbor) const;

    /// Copy of the whole table
    void snapshot(NeighborSnapshot* snapshot) const;

    /**
     * Deactivate every active neighbor with no contact in the last
     * max_age_millis.
     *
     * @return number of neighbors deactivated
     */
    size_t mark_stale(u_int64_t max_age_millis);

    size_t size() const;
    size_t active_count() const;

    void dump(oasys::StringBuffer* buf) const;

protected:
    typedef std::vector<Neighbor> NeighborVector;

    /// Locate an entry; lock held
    NeighborVector::iterator lookup(const std::string& id);

    NeighborVector          neighbors_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _NEIGHBOR_H_ */
