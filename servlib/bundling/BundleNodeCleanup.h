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

#ifndef _BUNDLE_NODE_CLEANUP_H_
#define _BUNDLE_NODE_CLEANUP_H_

#include <oasys/debug/Logger.h>
#include <oasys/thread/SpinLock.h>
#include <oasys/thread/Thread.h>
#include <oasys/util/StringBuffer.h>

namespace skydtn {

class BundleNode;

/**
 * Periodic maintenance worker. Every sweep interval it retires
 * expired bundles, ages out silent neighbors and re-drives bundles
 * that are still waiting for a route.
 */
class BundleNodeCleanup : public oasys::Logger,
                          public oasys::Thread
{
public:
    BundleNodeCleanup(BundleNode* parent);

    virtual ~BundleNodeCleanup();

    /**
     * Mark every expired bundle EXPIRED and remove it from the store.
     * Returns the number of bundles removed.
     */
    size_t sweep();

    void get_daemon_stats(oasys::StringBuffer* buf);

protected:
    void run();

    BundleNode* node_;

    /// Serializes concurrent sweeps (thread tick and operator command)
    oasys::SpinLock sweep_lock_;

    struct Stats {
        u_int64_t sweeps_;
        u_int64_t expired_;
    };

    Stats stats_;
};

} // namespace skydtn

#endif /* _BUNDLE_NODE_CLEANUP_H_ */
