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

#ifndef _BUNDLE_NODE_H_
#define _BUNDLE_NODE_H_

#include <atomic>
#include <set>
#include <string>

#include <oasys/compat/inttypes.h>
#include <oasys/debug/Logger.h>
#include <oasys/thread/SpinLock.h>
#include <oasys/util/StringBuffer.h>

#include "Bundle.h"
#include "BoundedMsgQueue.h"
#include "BundleTransmitter.h"
#include "contacts/Neighbor.h"

namespace skydtn {

class BundleNodeCleanup;
class BundleNodeInput;
class BundleNodeOutput;
class BundleRouter;
class BundleStore;
class TopologyManager;

/**
 * The store-and-forward engine of one node.
 *
 * A node owns one BundleStore (the only writer of custody status),
 * one BundleRouter, a bounded ingress and a bounded egress queue and
 * the live neighbor table. Three worker threads drive the bundle
 * lifecycle: BundleNodeInput processes arriving bundles,
 * BundleNodeOutput routes stored bundles to a next hop and
 * BundleNodeCleanup retires expired bundles.
 *
 * The node id and endpoint are fixed at construction. A node goes
 * through created, started, running, stopping and stopped once; it
 * cannot be restarted.
 */
class BundleNode : public oasys::Logger {
public:
    /**
     * Tunable parameters, read when a node is constructed.
     */
    struct Params {
        Params();

        /// Bound of the ingress queue
        u_int ingress_capacity_;

        /// Bound of the egress queue
        u_int egress_capacity_;

        /// Milliseconds between expiry sweeps
        u_int sweep_interval_ms_;

        /// Seconds without contact before a neighbor goes inactive
        /// (0 to never age neighbors out)
        u_int neighbor_timeout_secs_;

        /// Drop arriving bundles whose id is already stored
        bool suppress_duplicates_;
    };

    static Params params_;

    /**
     * Node lifecycle.
     */
    typedef enum {
        NODE_CREATED = 0,
        NODE_STARTED,
        NODE_RUNNING,
        NODE_STOPPING,
        NODE_STOPPED,
    } state_t;

    static const char* state_to_str(state_t state);

    /**
     * Snapshot returned by get_statistics().
     */
    struct Statistics {
        Statistics();

        std::string node_id_;
        std::string endpoint_;
        state_t     state_;
        size_t      neighbor_count_;
        size_t      ingress_queue_depth_;
        size_t      egress_queue_depth_;
        size_t      stored_bundles_;

        u_int64_t   originated_;        ///< accepted by send_bundle
        u_int64_t   received_;          ///< accepted by receive_bundle
        u_int64_t   delivered_;         ///< delivered to the local endpoint
        u_int64_t   forwarded_;         ///< stored for another hop
        u_int64_t   transmitted_;       ///< handed to the transmitter
        u_int64_t   dropped_;           ///< invalid or unstorable on arrival
        u_int64_t   duplicates_;        ///< already stored on arrival
        u_int64_t   no_route_;          ///< egress attempts without a route
        u_int64_t   failed_;            ///< hop limit or transmit failure
        u_int64_t   expired_;           ///< retired by the sweep
        u_int64_t   bytes_received_;
        u_int64_t   bytes_transmitted_;
    };

    /**
     * Constructor. The node takes ownership of the store and router.
     */
    BundleNode(const std::string& id,
               const std::string& endpoint,
               BundleStore*       store,
               BundleRouter*      router);

    /**
     * Destructor. Stops the workers if they are still running.
     */
    virtual ~BundleNode();

    /**
     * Set the link layer boundary used by egress (not owned).
     */
    void set_transmitter(BundleTransmitter* transmitter);

    /**
     * Set the consumer of locally addressed bundles (not owned).
     */
    void set_local_delivery(LocalDeliveryHandler* handler);

    /**
     * Launch the ingress, egress and expiry workers. Returns without
     * waiting. SKYDTN_ESTATE unless the node was just created,
     * SKYDTN_EINTERNAL if the local clock is before 1/1/2000.
     */
    int start();

    /**
     * Signal the workers to stop, wait for them to exit, then close
     * the queues. Safe to call more than once.
     */
    void stop();

    /**
     * Submit a locally produced bundle. The source is stamped with
     * this node's endpoint (the id stays the one given at creation),
     * the bundle is stored as pending and queued for egress. Never
     * blocks.
     *
     * @return SKYDTN_SUCCESS, SKYDTN_EVALIDATION for an invalid
     *         bundle, SKYDTN_ECAPACITY if the store or the egress
     *         queue cannot take it (the bundle is then not kept)
     */
    int send_bundle(Bundle* bundle);

    /**
     * Hand over a bundle arriving from a link. Never blocks.
     *
     * @return SKYDTN_SUCCESS or SKYDTN_ECAPACITY if the ingress
     *         queue is full or closed
     */
    int receive_bundle(const Bundle& bundle);

    /// @{ Neighbor table maintenance, safe for concurrent callers
    void add_neighbor(const std::string& id, const std::string& eid,
                      double link_quality);
    int  remove_neighbor(const std::string& id);
    int  update_neighbor_quality(const std::string& id, double link_quality);
    int  set_neighbor_active(const std::string& id, bool active);
    /// @}

    /**
     * Bring the neighbor table in line with the nodes the topology
     * manager currently sees within range of this node: visible nodes
     * are added or refreshed with a distance based link quality, and
     * neighbors that dropped out of range are marked inactive.
     *
     * @return SKYDTN_ENOTFOUND if this node is not tracked
     */
    int refresh_neighbors(const TopologyManager& topology);

    /**
     * Queue every pending, unexpired bundle for another egress
     * attempt, highest priority first, until the egress queue is
     * full. Bundles already queued are skipped.
     *
     * @return number of bundles queued
     */
    size_t redrive_pending();

    /**
     * Run one expiry sweep now.
     *
     * @return number of bundles retired
     */
    size_t sweep_expired();

    Statistics get_statistics();

    /**
     * Format the given StringBuffer with the node statistics followed
     * by those of each worker.
     */
    void get_daemon_stats(oasys::StringBuffer* buf);

    /// @{ Accessors
    const std::string&   id()        const { return id_; }
    const std::string&   endpoint()  const { return endpoint_; }
    BundleStore*         store()           { return store_; }
    BundleRouter*        router()          { return router_; }
    const NeighborTable& neighbors() const { return neighbors_; }
    state_t              state();
    bool                 shutting_down() const { return shutting_down_; }
    /// @}

protected:
    friend class BundleNodeCleanup;
    friend class BundleNodeInput;
    friend class BundleNodeOutput;

    typedef BoundedMsgQueue<SPtr_Bundle> IngressQueue;
    typedef BoundedMsgQueue<std::string> EgressQueue;

    /**
     * Put a stored bundle id on the egress queue unless it is already
     * there. Returns false if the queue is full or closed.
     */
    bool enqueue_egress(const std::string& bundle_id);

    /**
     * Called by the egress worker once an id is taken off the queue.
     */
    void egress_dequeued(const std::string& bundle_id);

    /**
     * Stats helpers.
     */
    void incr_stat(u_int64_t Statistics::* field, u_int64_t amount = 1);

    const std::string       id_;
    const std::string       endpoint_;

    BundleStore*            store_;
    BundleRouter*           router_;
    BundleTransmitter*      transmitter_;
    LocalDeliveryHandler*   local_delivery_;

    NeighborTable           neighbors_;

    IngressQueue            ingressq_;
    EgressQueue             egressq_;
    std::set<std::string>   egress_queued_;
    oasys::SpinLock         egress_lock_;

    BundleNodeInput*        input_;
    BundleNodeOutput*       output_;
    BundleNodeCleanup*      cleanup_;

    state_t                 state_;
    oasys::SpinLock         state_lock_;
    std::atomic<bool>       shutting_down_;

    Statistics              stats_;
    oasys::SpinLock         stats_lock_;
};

} // namespace skydtn

#endif /* _BUNDLE_NODE_H_ */
