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

#ifndef _BUNDLE_NODE_INPUT_H_
#define _BUNDLE_NODE_INPUT_H_

#include <oasys/debug/Logger.h>
#include <oasys/thread/Thread.h>
#include <oasys/util/StringBuffer.h>

#include "Bundle.h"

namespace skydtn {

class BundleNode;

/**
 * Ingress worker. Drains the node's ingress queue, validating each
 * arriving bundle and either delivering it locally or storing it and
 * queueing it for the egress worker.
 */
class BundleNodeInput : public oasys::Logger,
                        public oasys::Thread
{
public:
    BundleNodeInput(BundleNode* parent);

    virtual ~BundleNodeInput();

    /**
     * Process a single arriving bundle. Called from the thread loop
     * and directly by tests.
     */
    void handle_bundle(const SPtr_Bundle& bundle);

    /**
     * Format the given StringBuffer with the worker statistics.
     */
    void get_daemon_stats(oasys::StringBuffer* buf);

protected:
    /**
     * Main thread function that pulls bundles off the ingress queue.
     */
    void run();

    /// The node this worker belongs to
    BundleNode* node_;

    struct Stats {
        u_int64_t bundles_processed_;
    };

    Stats stats_;
};

} // namespace skydtn

#endif /* _BUNDLE_NODE_INPUT_H_ */
