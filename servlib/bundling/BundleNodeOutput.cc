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

#include <pthread.h>
#include <string.h>
#include <exception>

#include <oasys/compat/inttypes.h>

#include "BundleNode.h"
#include "BundleNodeOutput.h"
#include "routing/BundleRouter.h"
#include "storage/BundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
BundleNodeOutput::BundleNodeOutput(BundleNode* parent)
    : Logger("BundleNodeOutput", "/skydtn/node/%s/output", parent->id().c_str()),
      Thread("BundleNodeOutput", CREATE_JOINABLE),
      node_(parent)
{
    memset(&stats_, 0, sizeof(stats_));
}

//----------------------------------------------------------------------
BundleNodeOutput::~BundleNodeOutput()
{
}

//----------------------------------------------------------------------
void
BundleNodeOutput::get_daemon_stats(oasys::StringBuffer* buf)
{
    buf->appendf("BundleNodeOutput: %zu pending (max: %zu) -- "
                 "%" PRIu64 " processed -- %" PRIu64 " stale\n",
                 node_->egressq_.size(),
                 node_->egressq_.max_size(),
                 stats_.bundles_processed_,
                 stats_.stale_ids_);
}

//----------------------------------------------------------------------
void
BundleNodeOutput::handle_bundle(const std::string& bundle_id)
{
    ++stats_.bundles_processed_;

    BundleStore* store = node_->store_;

    Bundle bundle;
    int err = store->retrieve(bundle_id, &bundle);
    if (err == SKYDTN_ENOTFOUND) {
        log_debug("bundle %s no longer stored", bundle_id.c_str());
        ++stats_.stale_ids_;
        return;
    } else if (err != SKYDTN_SUCCESS) {
        log_err("error retrieving bundle %s: %s",
                bundle_id.c_str(), skydtn_strerror(err));
        return;
    }

    bundle_status_t status;
    err = store->get_status(bundle_id, &status);
    if (err != SKYDTN_SUCCESS || status != BUNDLE_PENDING) {
        ++stats_.stale_ids_;
        return;
    }

    if (bundle.is_expired()) {
        // left for the expiry sweep
        return;
    }

    NeighborSnapshot neighbors;
    node_->neighbors_.snapshot(&neighbors);

    std::string next_hop;
    err = node_->router_->select_next_hop(bundle, neighbors, &next_hop);
    if (err == SKYDTN_ENOROUTE) {
        log_debug("no route for *%p, leaving it pending", &bundle);
        node_->incr_stat(&BundleNode::Statistics::no_route_);
        return;
    } else if (err != SKYDTN_SUCCESS) {
        log_err("router error for bundle %s: %s",
                bundle_id.c_str(), skydtn_strerror(err));
        return;
    }

    bundle.increment_hop(node_->id());
    if (bundle.exceeds_hop_limit()) {
        log_notice("bundle %s exceeded the hop limit (%" PRIu64 " hops)",
                   bundle_id.c_str(), bundle.hop_count());
        mark_failed(bundle_id);
        return;
    }

    err = store->update_status(bundle_id, BUNDLE_IN_TRANSIT);
    if (err != SKYDTN_SUCCESS) {
        log_err("error marking bundle %s in transit: %s",
                bundle_id.c_str(), skydtn_strerror(err));
        return;
    }

    log_debug("forwarding *%p to %s", &bundle, next_hop.c_str());

    if (node_->transmitter_ != NULL) {
        err = node_->transmitter_->transmit(next_hop, bundle);
        if (err != SKYDTN_SUCCESS) {
            log_warn("transmit of bundle %s to %s failed: %s",
                     bundle_id.c_str(), next_hop.c_str(), skydtn_strerror(err));
            mark_failed(bundle_id);
            return;
        }

        // a completed transmission counts as contact with the next hop
        if (node_->neighbors_.touch(next_hop) != SKYDTN_SUCCESS) {
            log_debug("next hop %s left the neighbor table during transmit",
                      next_hop.c_str());
        }
    }

    node_->incr_stat(&BundleNode::Statistics::transmitted_);
    node_->incr_stat(&BundleNode::Statistics::bytes_transmitted_, bundle.size());
}

//----------------------------------------------------------------------
void
BundleNodeOutput::mark_failed(const std::string& bundle_id)
{
    int err = node_->store_->update_status(bundle_id, BUNDLE_FAILED);
    if (err != SKYDTN_SUCCESS) {
        log_err("error marking bundle %s failed: %s",
                bundle_id.c_str(), skydtn_strerror(err));
    }
    node_->incr_stat(&BundleNode::Statistics::failed_);
}

//----------------------------------------------------------------------
void
BundleNodeOutput::run()
{
    char threadname[16] = "Node-Output";
    pthread_setname_np(pthread_self(), threadname);

    std::string bundle_id;

    while (1) {
        if (should_stop() || node_->shutting_down()) {
            break;
        }

        if (node_->egressq_.try_pop(&bundle_id)) {
            node_->egress_dequeued(bundle_id);

            try {
                handle_bundle(bundle_id);
            } catch (const std::exception& e) {
                log_err("exception forwarding bundle %s: %s",
                        bundle_id.c_str(), e.what());
            }
            continue;
        } else {
            node_->egressq_.wait_for_millisecs(100);
        }
    }

    log_always("BundleNodeOutput thread stopped");
}

} // namespace skydtn
