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

#include "MemoryBundleStore.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
MemoryBundleStore::MemoryBundleStore(u_int max_bundles)
    : BundleStore("MemoryBundleStore", "/skydtn/storage/memory"),
      max_bundles_(max_bundles),
      total_bytes_(0),
      evicted_(0)
{
}

//----------------------------------------------------------------------
MemoryBundleStore::~MemoryBundleStore()
{
}

//----------------------------------------------------------------------
int
MemoryBundleStore::store(const Bundle& bundle)
{
    oasys::StringBuffer errbuf;
    if (bundle.validate(&errbuf) != SKYDTN_SUCCESS) {
        log_debug("store: rejecting *%p: %s", &bundle, errbuf.c_str());
        return SKYDTN_EVALIDATION;
    }

    oasys::ScopeLock l(&lock_, "MemoryBundleStore::store");

    if (bundles_.find(bundle.id()) != bundles_.end()) {
        log_debug("store: bundle %s already stored", bundle.id().c_str());
        return SKYDTN_EVALIDATION;
    }

    if (max_bundles_ != 0 && bundles_.size() >= max_bundles_) {
        if (! make_room(bundle.priority())) {
            log_warn("store: full at %zu bundles, rejecting *%p",
                     bundles_.size(), &bundle);
            return SKYDTN_ECAPACITY;
        }
    }

    bundles_[bundle.id()] = StoredBundle(bundle, BUNDLE_PENDING);
    total_bytes_ += bundle.size();

    log_debug("store: added *%p", &bundle);
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
bool
MemoryBundleStore::make_room(u_int8_t priority)
{
    StoredMap::iterator iter;

    // expired copies go first, then anything already terminal
    size_t removed = 0;
    iter = bundles_.begin();
    while (iter != bundles_.end()) {
        StoredMap::iterator cur = iter++;
        if (cur->second.bundle_.is_expired() ||
            bundle_status_is_terminal(cur->second.status_))
        {
            log_debug("make_room: evicting %s bundle %s",
                      bundle_status_to_str(cur->second.status_),
                      cur->first.c_str());
            erase(cur);
            ++removed;
        }
    }

    if (removed != 0) {
        evicted_ += removed;
        return true;
    }

    // otherwise the oldest of the lowest priority
    StoredMap::iterator victim = bundles_.end();
    for (iter = bundles_.begin(); iter != bundles_.end(); ++iter) {
        if (victim == bundles_.end()) {
            victim = iter;
            continue;
        }

        const Bundle& cand = iter->second.bundle_;
        const Bundle& best = victim->second.bundle_;
        if (cand.priority() < best.priority() ||
            (cand.priority() == best.priority() &&
             cand.creation_ts() < best.creation_ts()))
        {
            victim = iter;
        }
    }

    if (victim == bundles_.end() ||
        victim->second.bundle_.priority() > priority)
    {
        return false;
    }

    log_notice("make_room: evicting %s priority bundle %s",
               Bundle::prioritytoa(victim->second.bundle_.priority()),
               victim->first.c_str());
    erase(victim);
    ++evicted_;
    return true;
}

//----------------------------------------------------------------------
void
MemoryBundleStore::erase(StoredMap::iterator iter)
{
    total_bytes_ -= iter->second.bundle_.size();
    bundles_.erase(iter);
}

//----------------------------------------------------------------------
int
MemoryBundleStore::retrieve(const std::string& id, Bundle* bundle)
{
    oasys::ScopeLock l(&lock_, "MemoryBundleStore::retrieve");

    StoredMap::iterator iter = bundles_.find(id);
    if (iter == bundles_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    *bundle = iter->second.bundle_;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
MemoryBundleStore::del(const std::string& id)
{
    oasys::ScopeLock l(&lock_, "MemoryBundleStore::del");

    StoredMap::iterator iter = bundles_.find(id);
    if (iter == bundles_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    erase(iter);
    log_debug("del: removed bundle %s", id.c_str());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
MemoryBundleStore::list(const BundleFilter& filter, BundleList* bundles)
{
    u_int64_t now = BundleTimestamp::get_current_time_millis();
    std::vector<const StoredBundle*> matched;

    oasys::ScopeLock l(&lock_, "MemoryBundleStore::list");

    StoredMap::const_iterator iter;
    for (iter = bundles_.begin(); iter != bundles_.end(); ++iter) {
        if (filter.matches(iter->second, now)) {
            matched.push_back(&iter->second);

            if (filter.order_ == BundleFilter::ORDER_NONE &&
                filter.limit_ != 0 && matched.size() >= filter.limit_) {
                break;
            }
        }
    }

    filter.finish(&matched);

    bundles->clear();
    bundles->reserve(matched.size());
    for (size_t i = 0; i < matched.size(); ++i) {
        bundles->push_back(matched[i]->bundle_);
    }

    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
MemoryBundleStore::update_status(const std::string& id, bundle_status_t status)
{
    oasys::ScopeLock l(&lock_, "MemoryBundleStore::update_status");

    StoredMap::iterator iter = bundles_.find(id);
    if (iter == bundles_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    bundle_status_t cur = iter->second.status_;
    if (! bundle_status_transition_ok(cur, status)) {
        log_warn("update_status: bundle %s cannot go from %s to %s",
                 id.c_str(), bundle_status_to_str(cur),
                 bundle_status_to_str(status));
        return SKYDTN_EVALIDATION;
    }

    iter->second.status_ = status;
    log_debug("update_status: bundle %s %s -> %s", id.c_str(),
              bundle_status_to_str(cur), bundle_status_to_str(status));
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
MemoryBundleStore::get_status(const std::string& id, bundle_status_t* status)
{
    oasys::ScopeLock l(&lock_, "MemoryBundleStore::get_status");

    StoredMap::iterator iter = bundles_.find(id);
    if (iter == bundles_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    *status = iter->second.status_;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
size_t
MemoryBundleStore::count()
{
    oasys::ScopeLock l(&lock_, "MemoryBundleStore::count");
    return bundles_.size();
}

//----------------------------------------------------------------------
u_int64_t
MemoryBundleStore::total_bytes()
{
    oasys::ScopeLock l(&lock_, "MemoryBundleStore::total_bytes");
    return total_bytes_;
}

} // namespace skydtn
