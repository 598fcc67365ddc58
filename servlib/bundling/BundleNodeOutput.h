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

#ifndef _BUNDLE_NODE_OUTPUT_H_
#define _BUNDLE_NODE_OUTPUT_H_

#include <string>

#include <oasys/debug/Logger.h>
#include <oasys/thread/Thread.h>
#include <oasys/util/StringBuffer.h>

namespace skydtn {

class BundleNode;

/**
 * Egress worker. Pops bundle ids off the egress queue, asks the
 * router for a next hop and hands the bundle to the transmitter.
 * Bundles without a route stay pending in the store.
 */
class BundleNodeOutput : public oasys::Logger,
                         public oasys::Thread
{
public:
    BundleNodeOutput(BundleNode* parent);

    virtual ~BundleNodeOutput();

    /**
     * Attempt to forward the stored bundle with the given id.
     */
    void handle_bundle(const std::string& bundle_id);

    /**
     * Format the given StringBuffer with the worker statistics.
     */
    void get_daemon_stats(oasys::StringBuffer* buf);

protected:
    void run();

    /// Move a bundle to failed and count it
    void mark_failed(const std::string& bundle_id);

    BundleNode* node_;

    struct Stats {
        u_int64_t bundles_processed_;
        u_int64_t stale_ids_;
    };

    Stats stats_;
};

} // namespace skydtn

#endif /* _BUNDLE_NODE_OUTPUT_H_ */
