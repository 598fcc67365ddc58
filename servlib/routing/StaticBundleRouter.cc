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

#include "StaticBundleRouter.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
StaticBundleRouter::StaticBundleRouter()
    : BundleRouter("StaticBundleRouter", "static")
{
}

//----------------------------------------------------------------------
StaticBundleRouter::~StaticBundleRouter()
{
}

//----------------------------------------------------------------------
void
StaticBundleRouter::add_route(const std::string& dest,
                              const std::string& neighbor_id)
{
    oasys::ScopeLock l(&lock_, "StaticBundleRouter::add_route");
    routes_[dest] = neighbor_id;
    log_debug("add_route %s -> %s", dest.c_str(), neighbor_id.c_str());
}

//----------------------------------------------------------------------
int
StaticBundleRouter::del_route(const std::string& dest)
{
    oasys::ScopeLock l(&lock_, "StaticBundleRouter::del_route");

    if (routes_.erase(dest) == 0) {
        return SKYDTN_ENOTFOUND;
    }
    log_debug("del_route %s", dest.c_str());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
size_t
StaticBundleRouter::num_routes() const
{
    oasys::ScopeLock l(&lock_, "StaticBundleRouter::num_routes");
    return routes_.size();
}

//----------------------------------------------------------------------
const Neighbor*
StaticBundleRouter::find_active(const NeighborSnapshot& neighbors,
                                const std::string&      id)
{
    NeighborSnapshot::const_iterator iter;
    for (iter = neighbors.begin(); iter != neighbors.end(); ++iter) {
        if (iter->active_ && iter->id_ == id) {
            return &(*iter);
        }
    }
    return NULL;
}

//----------------------------------------------------------------------
int
StaticBundleRouter::select_next_hop(const Bundle&           bundle,
                                    const NeighborSnapshot& neighbors,
                                    std::string*            next_hop)
{
    if (! any_active(neighbors)) {
        return SKYDTN_ENOROUTE;
    }

    const Neighbor* direct = find_direct(bundle, neighbors);
    if (direct != NULL) {
        *next_hop = direct->id_;
        return SKYDTN_SUCCESS;
    }

    {
        oasys::ScopeLock l(&lock_, "StaticBundleRouter::select_next_hop");

        const Neighbor* best = NULL;
        size_t best_len = 0;

        // an exact match is also the longest possible prefix
        RouteMap::const_iterator iter;
        for (iter = routes_.begin(); iter != routes_.end(); ++iter) {
            const std::string& dest = iter->first;
            if (bundle.dest().compare(0, dest.length(), dest) != 0) {
                continue;
            }

            if (best != NULL && dest.length() <= best_len) {
                continue;
            }

            const Neighbor* n = find_active(neighbors, iter->second);
            if (n == NULL) {
                log_debug("select_next_hop: route %s -> %s not active",
                          dest.c_str(), iter->second.c_str());
                continue;
            }

            best = n;
            best_len = dest.length();
        }

        if (best != NULL) {
            *next_hop = best->id_;
            return SKYDTN_SUCCESS;
        }
    }

    NeighborSnapshot::const_iterator iter;
    for (iter = neighbors.begin(); iter != neighbors.end(); ++iter) {
        if (iter->active_) {
            log_debug("select_next_hop: no route for %s, falling back to %s",
                      bundle.dest().c_str(), iter->id_.c_str());
            *next_hop = iter->id_;
            return SKYDTN_SUCCESS;
        }
    }

    return SKYDTN_ENOROUTE;
}

//----------------------------------------------------------------------
void
StaticBundleRouter::get_routing_state(oasys::StringBuffer* buf)
{
    oasys::ScopeLock l(&lock_, "StaticBundleRouter::get_routing_state");

    buf->appendf("Static routes (%zu), falling back to any active neighbor:\n",
                 routes_.size());

    RouteMap::const_iterator iter;
    for (iter = routes_.begin(); iter != routes_.end(); ++iter) {
        buf->appendf("  %-32s -> %s\n", iter->first.c_str(), iter->second.c_str());
    }
}

} // namespace skydtn
