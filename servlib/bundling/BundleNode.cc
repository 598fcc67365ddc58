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

#include "BundleNode.h"
#include "BundleNodeCleanup.h"
#include "BundleNodeInput.h"
#include "BundleNodeOutput.h"
#include "contacts/TopologyManager.h"
#include "routing/BundleRouter.h"
#include "storage/BundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
BundleNode::Params::Params()
    : ingress_capacity_(1000),
      egress_capacity_(1000),
      sweep_interval_ms_(300000),
      neighbor_timeout_secs_(600),
      suppress_duplicates_(true)
{}

BundleNode::Params BundleNode::params_;

//----------------------------------------------------------------------
const char*
BundleNode::state_to_str(state_t state)
{
    switch (state) {
    case NODE_CREATED:  return "created";
    case NODE_STARTED:  return "started";
    case NODE_RUNNING:  return "running";
    case NODE_STOPPING: return "stopping";
    case NODE_STOPPED:  return "stopped";
    }
    return "(unknown state)";
}

//----------------------------------------------------------------------
BundleNode::Statistics::Statistics()
    : state_(NODE_CREATED),
      neighbor_count_(0),
      ingress_queue_depth_(0),
      egress_queue_depth_(0),
      stored_bundles_(0),
      originated_(0),
      received_(0),
      delivered_(0),
      forwarded_(0),
      transmitted_(0),
      dropped_(0),
      duplicates_(0),
      no_route_(0),
      failed_(0),
      expired_(0),
      bytes_received_(0),
      bytes_transmitted_(0)
{
}

//----------------------------------------------------------------------
BundleNode::BundleNode(const std::string& id,
                       const std::string& endpoint,
                       BundleStore*       store,
                       BundleRouter*      router)
    : Logger("BundleNode", "/skydtn/node/%s", id.c_str()),
      id_(id),
      endpoint_(endpoint),
      store_(store),
      router_(router),
      transmitter_(NULL),
      local_delivery_(NULL),
      ingressq_(params_.ingress_capacity_),
      egressq_(params_.egress_capacity_),
      input_(NULL),
      output_(NULL),
      cleanup_(NULL),
      state_(NODE_CREATED),
      shutting_down_(false)
{
    input_   = new BundleNodeInput(this);
    output_  = new BundleNodeOutput(this);
    cleanup_ = new BundleNodeCleanup(this);
}

//----------------------------------------------------------------------
BundleNode::~BundleNode()
{
    stop();

    delete input_;
    delete output_;
    delete cleanup_;

    delete router_;
    delete store_;
}

//----------------------------------------------------------------------
void
BundleNode::set_transmitter(BundleTransmitter* transmitter)
{
    transmitter_ = transmitter;
}

//----------------------------------------------------------------------
void
BundleNode::set_local_delivery(LocalDeliveryHandler* handler)
{
    local_delivery_ = handler;
}

//----------------------------------------------------------------------
BundleNode::state_t
BundleNode::state()
{
    oasys::ScopeLock l(&state_lock_, "BundleNode::state");
    return state_;
}

//----------------------------------------------------------------------
int
BundleNode::start()
{
    if (! BundleTimestamp::check_local_clock()) {
        log_crit("start: local clock is before the bundle epoch");
        return SKYDTN_EINTERNAL;
    }

    {
        oasys::ScopeLock l(&state_lock_, "BundleNode::start");
        if (state_ != NODE_CREATED) {
            log_err("start: node is %s, cannot start", state_to_str(state_));
            return SKYDTN_ESTATE;
        }
        state_ = NODE_STARTED;
    }

    log_info("starting node %s (%s) with %s router and %s store",
             id_.c_str(), endpoint_.c_str(), router_->name().c_str(),
             store_->type_str());

    input_->start();
    output_->start();
    cleanup_->start();

    oasys::ScopeLock l(&state_lock_, "BundleNode::start");
    state_ = NODE_RUNNING;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
void
BundleNode::stop()
{
    bool join_workers = false;
    {
        oasys::ScopeLock l(&state_lock_, "BundleNode::stop");
        if (state_ == NODE_STOPPING || state_ == NODE_STOPPED) {
            return;
        }
        join_workers = (state_ != NODE_CREATED);
        state_ = NODE_STOPPING;
    }

    log_info("stopping node %s", id_.c_str());

    shutting_down_ = true;

    if (join_workers) {
        input_->set_should_stop();
        output_->set_should_stop();
        cleanup_->set_should_stop();

        input_->join();
        output_->join();
        cleanup_->join();
    }

    ingressq_.close();
    egressq_.close();

    oasys::ScopeLock l(&state_lock_, "BundleNode::stop");
    state_ = NODE_STOPPED;
    log_info("node %s stopped", id_.c_str());
}

//----------------------------------------------------------------------
int
BundleNode::send_bundle(Bundle* bundle)
{
    bundle->stamp_source(endpoint_);

    int err = store_->store(*bundle);
    if (err != SKYDTN_SUCCESS) {
        log_info("send_bundle: store rejected *%p: %s",
                 bundle, skydtn_strerror(err));
        return err;
    }

    if (! enqueue_egress(bundle->id())) {
        log_notice("send_bundle: egress queue full, rejecting *%p", bundle);
        err = store_->del(bundle->id());
        if (err != SKYDTN_SUCCESS) {
            log_err("send_bundle: error removing rejected bundle %s: %s",
                    bundle->id().c_str(), skydtn_strerror(err));
        }
        return SKYDTN_ECAPACITY;
    }

    incr_stat(&Statistics::originated_);
    log_debug("send_bundle: queued *%p", bundle);
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
BundleNode::receive_bundle(const Bundle& bundle)
{
    if (! ingressq_.try_push(bundle.clone())) {
        log_notice("receive_bundle: ingress queue full, refusing bundle %s",
                   bundle.id().c_str());
        return SKYDTN_ECAPACITY;
    }

    incr_stat(&Statistics::received_);
    incr_stat(&Statistics::bytes_received_, bundle.size());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
bool
BundleNode::enqueue_egress(const std::string& bundle_id)
{
    oasys::ScopeLock l(&egress_lock_, "BundleNode::enqueue_egress");

    if (egress_queued_.find(bundle_id) != egress_queued_.end()) {
        return true;
    }

    if (! egressq_.try_push(bundle_id)) {
        return false;
    }

    egress_queued_.insert(bundle_id);
    return true;
}

//----------------------------------------------------------------------
void
BundleNode::egress_dequeued(const std::string& bundle_id)
{
    oasys::ScopeLock l(&egress_lock_, "BundleNode::egress_dequeued");
    egress_queued_.erase(bundle_id);
}

//----------------------------------------------------------------------
void
BundleNode::add_neighbor(const std::string& id, const std::string& eid,
                         double link_quality)
{
    neighbors_.add(id, eid, link_quality);

    size_t n = redrive_pending();
    if (n != 0) {
        log_debug("add_neighbor %s: requeued %zu pending bundles", id.c_str(), n);
    }
}

//----------------------------------------------------------------------
int
BundleNode::remove_neighbor(const std::string& id)
{
    return neighbors_.remove(id);
}

//----------------------------------------------------------------------
int
BundleNode::update_neighbor_quality(const std::string& id, double link_quality)
{
    int err = neighbors_.update_quality(id, link_quality);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    Neighbor neighbor;
    if (neighbors_.find(id, &neighbor) && neighbor.active_) {
        redrive_pending();
    }
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
BundleNode::set_neighbor_active(const std::string& id, bool active)
{
    int err = neighbors_.set_active(id, active);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    if (active) {
        redrive_pending();
    }
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
BundleNode::refresh_neighbors(const TopologyManager& topology)
{
    SatelliteState self;
    int err = topology.get_satellite(id_, &self);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    SatelliteList visible;
    err = topology.get_visible_neighbors(id_, &visible);
    if (err != SKYDTN_SUCCESS) {
        return err;
    }

    std::set<std::string> seen;
    SatelliteList::const_iterator iter;
    for (iter = visible.begin(); iter != visible.end(); ++iter) {
        double d = self.position_.distance_to(iter->position_);
        neighbors_.add(iter->id_, iter->eid_, TopologyManager::link_quality(d));
        router_->update_energy(iter->id_, iter->battery_pct_);
        seen.insert(iter->id_);
    }

    NeighborSnapshot current;
    neighbors_.snapshot(&current);
    NeighborSnapshot::const_iterator n;
    for (n = current.begin(); n != current.end(); ++n) {
        if (n->active_ && seen.find(n->id_) == seen.end()) {
            log_debug("refresh_neighbors: %s out of range", n->id_.c_str());
            if (neighbors_.set_active(n->id_, false) != SKYDTN_SUCCESS) {
                log_debug("refresh_neighbors: %s removed concurrently",
                          n->id_.c_str());
            }
        }
    }

    if (! visible.empty()) {
        redrive_pending();
    }
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
size_t
BundleNode::redrive_pending()
{
    BundleFilter filter;
    filter.set_status(BUNDLE_PENDING)
          .set_order(BundleFilter::ORDER_PRIORITY);

    BundleList pending;
    int err = store_->list(filter, &pending);
    if (err != SKYDTN_SUCCESS) {
        log_err("redrive_pending: error listing pending bundles: %s",
                skydtn_strerror(err));
        return 0;
    }

    size_t count = 0;
    BundleList::const_iterator iter;
    for (iter = pending.begin(); iter != pending.end(); ++iter) {
        if (iter->is_expired()) {
            continue;
        }

        if (! enqueue_egress(iter->id())) {
            log_debug("redrive_pending: egress queue full after %zu bundles", count);
            break;
        }
        ++count;
    }

    return count;
}

//----------------------------------------------------------------------
size_t
BundleNode::sweep_expired()
{
    return cleanup_->sweep();
}

//----------------------------------------------------------------------
void
BundleNode::incr_stat(u_int64_t Statistics::* field, u_int64_t amount)
{
    oasys::ScopeLock l(&stats_lock_, "BundleNode::incr_stat");
    stats_.*field += amount;
}

//----------------------------------------------------------------------
BundleNode::Statistics
BundleNode::get_statistics()
{
    Statistics stats;
    {
        oasys::ScopeLock l(&stats_lock_, "BundleNode::get_statistics");
        stats = stats_;
    }

    stats.node_id_             = id_;
    stats.endpoint_            = endpoint_;
    stats.state_               = state();
    stats.neighbor_count_      = neighbors_.size();
    stats.ingress_queue_depth_ = ingressq_.size();
    stats.egress_queue_depth_  = egressq_.size();
    stats.stored_bundles_      = store_->count();
    return stats;
}

//----------------------------------------------------------------------
void
BundleNode::get_daemon_stats(oasys::StringBuffer* buf)
{
    Statistics stats = get_statistics();

    buf->appendf("node %s (%s) %s: %zu neighbors (%zu active) -- "
                 "ingress %zu/%zu -- egress %zu/%zu -- %zu stored\n",
                 stats.node_id_.c_str(), stats.endpoint_.c_str(),
                 state_to_str(stats.state_), stats.neighbor_count_,
                 neighbors_.active_count(),
                 stats.ingress_queue_depth_, ingressq_.capacity(),
                 stats.egress_queue_depth_, egressq_.capacity(),
                 stats.stored_bundles_);
    buf->appendf("%" PRIu64 " originated -- "
                 "%" PRIu64 " received -- "
                 "%" PRIu64 " delivered -- "
                 "%" PRIu64 " forwarded -- "
                 "%" PRIu64 " transmitted\n",
                 stats.originated_, stats.received_, stats.delivered_,
                 stats.forwarded_, stats.transmitted_);
    buf->appendf("%" PRIu64 " dropped -- "
                 "%" PRIu64 " duplicates -- "
                 "%" PRIu64 " no route -- "
                 "%" PRIu64 " failed -- "
                 "%" PRIu64 " expired\n",
                 stats.dropped_, stats.duplicates_, stats.no_route_,
                 stats.failed_, stats.expired_);
    buf->appendf("%" PRIu64 " bytes received -- %" PRIu64 " bytes transmitted\n",
                 stats.bytes_received_, stats.bytes_transmitted_);

    input_->get_daemon_stats(buf);
    output_->get_daemon_stats(buf);
    cleanup_->get_daemon_stats(buf);
}

} // namespace skydtn
