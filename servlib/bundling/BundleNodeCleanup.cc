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
#include <unistd.h>

#include <oasys/compat/inttypes.h>
#include <oasys/util/Time.h>

#include "BundleNode.h"
#include "BundleNodeCleanup.h"
#include "storage/BundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
BundleNodeCleanup::BundleNodeCleanup(BundleNode* parent)
    : Logger("BundleNodeCleanup", "/skydtn/node/%s/cleanup", parent->id().c_str()),
      Thread("BundleNodeCleanup", CREATE_JOINABLE),
      node_(parent)
{
    memset(&stats_, 0, sizeof(stats_));
}

//----------------------------------------------------------------------
BundleNodeCleanup::~BundleNodeCleanup()
{
}

//----------------------------------------------------------------------
void
BundleNodeCleanup::get_daemon_stats(oasys::StringBuffer* buf)
{
    buf->appendf("BundleNodeCleanup: %" PRIu64 " sweeps -- "
                 "%" PRIu64 " bundles expired\n",
                 stats_.sweeps_, stats_.expired_);
}

//----------------------------------------------------------------------
size_t
BundleNodeCleanup::sweep()
{
    oasys::ScopeLock l(&sweep_lock_, "BundleNodeCleanup::sweep");

    BundleStore* store = node_->store_;

    BundleList bundles;
    int err = store->list(BundleFilter(), &bundles);
    if (err != SKYDTN_SUCCESS) {
        log_err("sweep: error listing bundles: %s", skydtn_strerror(err));
        return 0;
    }

    size_t count = 0;
    BundleList::const_iterator iter;
    for (iter = bundles.begin(); iter != bundles.end(); ++iter) {
        if (! iter->is_expired()) {
            continue;
        }

        bundle_status_t status;
        if (store->get_status(iter->id(), &status) == SKYDTN_SUCCESS &&
            ! bundle_status_is_terminal(status))
        {
            err = store->update_status(iter->id(), BUNDLE_EXPIRED);
            if (err != SKYDTN_SUCCESS) {
                log_debug("sweep: could not mark bundle %s expired: %s",
                          iter->id().c_str(), skydtn_strerror(err));
            }
        }

        err = store->del(iter->id());
        if (err == SKYDTN_SUCCESS) {
            log_info("sweep: expired bundle *%p", &(*iter));
            ++count;
        } else if (err != SKYDTN_ENOTFOUND) {
            log_err("sweep: error removing bundle %s: %s",
                    iter->id().c_str(), skydtn_strerror(err));
        }
    }

    ++stats_.sweeps_;
    stats_.expired_ += count;
    node_->incr_stat(&BundleNode::Statistics::expired_, count);

    log_debug("sweep: %zu of %zu stored bundles expired", count, bundles.size());
    return count;
}

//----------------------------------------------------------------------
void
BundleNodeCleanup::run()
{
    char threadname[16] = "Node-Cleanup";
    pthread_setname_np(pthread_self(), threadname);

    oasys::Time last_sweep;
    last_sweep.get_time();

    while (1) {
        if (should_stop() || node_->shutting_down()) {
            break;
        }

        usleep(100000);

        if (last_sweep.elapsed_ms() < BundleNode::params_.sweep_interval_ms_) {
            continue;
        }
        last_sweep.get_time();

        sweep();

        u_int timeout = BundleNode::params_.neighbor_timeout_secs_;
        if (timeout != 0) {
            size_t stale = node_->neighbors_.mark_stale((u_int64_t)timeout * 1000);
            if (stale != 0) {
                log_info("%zu neighbors went silent", stale);
            }
        }

        node_->redrive_pending();
    }

    log_always("BundleNodeCleanup thread stopped");
}

} // namespace skydtn
