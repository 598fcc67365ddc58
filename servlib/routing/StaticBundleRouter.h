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

#ifndef _STATIC_BUNDLE_ROUTER_H_
#define _STATIC_BUNDLE_ROUTER_H_

#include <map>

#include <oasys/thread/SpinLock.h>

#include "BundleRouter.h"

namespace skydtn {

/**
 * Router driven by an operator supplied route table that maps a
 * destination endpoint (or endpoint prefix) to a neighbor id. Routes
 * can be parsed from a configuration file or injected via the command
 * line.
 *
 * An active neighbor whose endpoint is the destination is chosen
 * first, then the exact route, then the longest matching prefix whose
 * neighbor is active, and finally the first active neighbor, so a
 * snapshot with any active neighbor always yields a next hop.
 */
class StaticBundleRouter : public BundleRouter {
public:
    StaticBundleRouter();
    virtual ~StaticBundleRouter();

    /// Virtual from BundleRouter
    int select_next_hop(const Bundle&           bundle,
                        const NeighborSnapshot& neighbors,
                        std::string*            next_hop);

    /// Virtual from BundleRouter
    void get_routing_state(oasys::StringBuffer* buf);

    /**
     * Add (or replace) a route.
     */
    void add_route(const std::string& dest, const std::string& neighbor_id);

    /**
     * Remove a route; SKYDTN_ENOTFOUND if there is none for dest.
     */
    int del_route(const std::string& dest);

    size_t num_routes() const;

protected:
    typedef std::map<std::string, std::string> RouteMap;

    /// Active neighbor with the given id, or NULL
    static const Neighbor* find_active(const NeighborSnapshot& neighbors,
                                       const std::string&      id);

    RouteMap                routes_;
    mutable oasys::SpinLock lock_;
};

} // namespace skydtn

#endif /* _STATIC_BUNDLE_ROUTER_H_ */
