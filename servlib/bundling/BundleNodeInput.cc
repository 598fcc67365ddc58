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
#include "BundleNodeInput.h"
#include "storage/BundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
BundleNodeInput::BundleNodeInput(BundleNode* parent)
    : Logger("BundleNodeInput", "/skydtn/node/%s/input", parent->id().c_str()),
      Thread("BundleNodeInput", CREATE_JOINABLE),
      node_(parent)
{
    memset(&stats_, 0, sizeof(stats_));
}

//----------------------------------------------------------------------
BundleNodeInput::~BundleNodeInput()
{
}

//----------------------------------------------------------------------
void
BundleNodeInput::get_daemon_stats(oasys::StringBuffer* buf)
{
    buf->appendf("BundleNodeInput: %zu pending (max: %zu) -- "
                 "%" PRIu64 " processed\n",
                 node_->ingressq_.size(),
                 node_->ingressq_.max_size(),
                 stats_.bundles_processed_);
}

//----------------------------------------------------------------------
void
BundleNodeInput::handle_bundle(const SPtr_Bundle& bundle)
{
    ++stats_.bundles_processed_;

    oasys::StaticStringBuffer<256> errbuf;
    if (bundle->validate(&errbuf) != SKYDTN_SUCCESS) {
        log_notice("dropping invalid bundle %s: %s",
                   bundle->id().c_str(), errbuf.c_str());
        node_->incr_stat(&BundleNode::Statistics::dropped_);
        return;
    }

    BundleStore* store = node_->store_;

    if (BundleNode::params_.suppress_duplicates_) {
        bundle_status_t status;
        if (store->get_status(bundle->id(), &status) == SKYDTN_SUCCESS) {
            log_debug("ignoring duplicate bundle %s (already %s)",
                      bundle->id().c_str(), bundle_status_to_str(status));
            node_->incr_stat(&BundleNode::Statistics::duplicates_);
            return;
        }
    }

    bool local = (bundle->dest() == node_->endpoint());

    int err = store->store(*bundle);
    if (err != SKYDTN_SUCCESS && ! local) {
        log_notice("dropping bundle %s, store failed: %s",
                   bundle->id().c_str(), skydtn_strerror(err));
        node_->incr_stat(&BundleNode::Statistics::dropped_);
        return;
    }

    if (local) {
        if (err != SKYDTN_SUCCESS) {
            // no record is kept, the consumer still gets the bundle
            log_notice("store failed for local bundle %s (%s), "
                       "delivering without a record",
                       bundle->id().c_str(), skydtn_strerror(err));
        } else {
            err = store->update_status(bundle->id(), BUNDLE_DELIVERED);
            if (err != SKYDTN_SUCCESS) {
                log_err("error marking bundle %s delivered: %s",
                        bundle->id().c_str(), skydtn_strerror(err));
            }
        }

        log_info("delivered bundle *%p", bundle.get());
        node_->incr_stat(&BundleNode::Statistics::delivered_);

        if (node_->local_delivery_ != NULL) {
            node_->local_delivery_->deliver_bundle(*bundle);
        }
        return;
    }

    node_->incr_stat(&BundleNode::Statistics::forwarded_);

    if (! node_->enqueue_egress(bundle->id())) {
        // stays pending in the store until the next re-drive
        log_notice("egress queue full, bundle %s left pending",
                   bundle->id().c_str());
    }
}

//----------------------------------------------------------------------
void
BundleNodeInput::run()
{
    char threadname[16] = "Node-Input";
    pthread_setname_np(pthread_self(), threadname);

    SPtr_Bundle bundle;

    while (1) {
        if (should_stop() || node_->shutting_down()) {
            break;
        }

        if (node_->ingressq_.try_pop(&bundle)) {
            try {
                handle_bundle(bundle);
            } catch (const std::exception& e) {
                log_err("exception handling bundle %s: %s",
                        bundle->id().c_str(), e.what());
            }

            bundle.reset();
            continue;
        } else {
            node_->ingressq_.wait_for_millisecs(100);
        }
    }

    log_always("BundleNodeInput thread stopped");
}

} // namespace skydtn
