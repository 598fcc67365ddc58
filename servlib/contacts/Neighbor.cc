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

#include "Neighbor.h"
#include "bundling/BundleTimestamp.h"
#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
Neighbor::Neighbor()
    : link_quality_(0.0),
      last_contact_millis_(0),
      active_(false)
{
}

//----------------------------------------------------------------------
Neighbor::Neighbor(const std::string& id, const std::string& eid,
                   double link_quality)
    : id_(id),
      eid_(eid),
      link_quality_(clamp_quality(link_quality)),
      last_contact_millis_(BundleTimestamp::get_current_time_millis()),
      active_(true)
{
}

//----------------------------------------------------------------------
double
Neighbor::clamp_quality(double quality)
{
    if (quality < 0.0) return 0.0;
    if (quality > 1.0) return 1.0;
    return quality;
}

//----------------------------------------------------------------------
NeighborTable::NeighborTable()
    : Logger("NeighborTable", "/skydtn/contacts/neighbors")
{
}

//----------------------------------------------------------------------
NeighborTable::NeighborVector::iterator
NeighborTable::lookup(const std::string& id)
{
    NeighborVector::iterator iter;
    for (iter = neighbors_.begin(); iter != neighbors_.end(); ++iter) {
        if (iter->id_ == id) {
            break;
        }
    }
    return iter;
}

//----------------------------------------------------------------------
bool
NeighborTable::add(const std::string& id, const std::string& eid,
                   double link_quality)
{
    oasys::ScopeLock l(&lock_, "NeighborTable::add");

    NeighborVector::iterator iter = lookup(id);
    if (iter == neighbors_.end()) {
        neighbors_.push_back(Neighbor(id, eid, link_quality));
        log_debug("added neighbor %s (%s) quality %.2f",
                  id.c_str(), eid.c_str(), neighbors_.back().link_quality_);
        return true;
    }

    iter->eid_                 = eid;
    iter->link_quality_        = Neighbor::clamp_quality(link_quality);
    iter->last_contact_millis_ = BundleTimestamp::get_current_time_millis();
    iter->active_              = true;
    log_debug("refreshed neighbor %s (%s) quality %.2f",
              id.c_str(), eid.c_str(), iter->link_quality_);
    return false;
}

//----------------------------------------------------------------------
int
NeighborTable::remove(const std::string& id)
{
    oasys::ScopeLock l(&lock_, "NeighborTable::remove");

    NeighborVector::iterator iter = lookup(id);
    if (iter == neighbors_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    neighbors_.erase(iter);
    log_debug("removed neighbor %s", id.c_str());
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
NeighborTable::update_quality(const std::string& id, double link_quality)
{
    oasys::ScopeLock l(&lock_, "NeighborTable::update_quality");

    NeighborVector::iterator iter = lookup(id);
    if (iter == neighbors_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    iter->link_quality_        = Neighbor::clamp_quality(link_quality);
    iter->last_contact_millis_ = BundleTimestamp::get_current_time_millis();
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
NeighborTable::touch(const std::string& id)
{
    oasys::ScopeLock l(&lock_, "NeighborTable::touch");

    NeighborVector::iterator iter = lookup(id);
    if (iter == neighbors_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    iter->last_contact_millis_ = BundleTimestamp::get_current_time_millis();
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
int
NeighborTable::set_active(const std::string& id, bool active)
{
    oasys::ScopeLock l(&lock_, "NeighborTable::set_active");

    NeighborVector::iterator iter = lookup(id);
    if (iter == neighbors_.end()) {
        return SKYDTN_ENOTFOUND;
    }

    iter->active_ = active;
    return SKYDTN_SUCCESS;
}

//----------------------------------------------------------------------
bool
NeighborTable::find(const std::string& id, Neighbor* neighbor) const
{
    oasys::ScopeLock l(&lock_, "NeighborTable::find");

    NeighborVector::const_iterator iter;
    for (iter = neighbors_.begin(); iter != neighbors_.end(); ++iter) {
        if (iter->id_ == id) {
            *neighbor = *iter;
            return true;
        }
    }
    return false;
}

//----------------------------------------------------------------------
void
NeighborTable::snapshot(NeighborSnapshot* snapshot) const
{
    oasys::ScopeLock l(&lock_, "NeighborTable::snapshot");
    *snapshot = neighbors_;
}

//----------------------------------------------------------------------
size_t
NeighborTable::mark_stale(u_int64_t max_age_millis)
{
    u_int64_t now = BundleTimestamp::get_current_time_millis();
    size_t count = 0;

    oasys::ScopeLock l(&lock_, "NeighborTable::mark_stale");

    NeighborVector::iterator iter;
    for (iter = neighbors_.begin(); iter != neighbors_.end(); ++iter) {
        if (iter->active_ && now > iter->last_contact_millis_ &&
            (now - iter->last_contact_millis_) > max_age_millis)
        {
            log_info("neighbor %s: no contact for %" PRIu64 " ms, marking inactive",
                     iter->id_.c_str(), now - iter->last_contact_millis_);
            iter->active_ = false;
            ++count;
        }
    }
    return count;
}

//----------------------------------------------------------------------
size_t
NeighborTable::size() const
{
    oasys::ScopeLock l(&lock_, "NeighborTable::size");
    return neighbors_.size();
}

//----------------------------------------------------------------------
size_t
NeighborTable::active_count() const
{
    oasys::ScopeLock l(&lock_, "NeighborTable::active_count");

    size_t count = 0;
    NeighborVector::const_iterator iter;
    for (iter = neighbors_.begin(); iter != neighbors_.end(); ++iter) {
        if (iter->active_) {
            ++count;
        }
    }
    return count;
}

//----------------------------------------------------------------------
void
NeighborTable::dump(oasys::StringBuffer* buf) const
{
    u_int64_t now = BundleTimestamp::get_current_time_millis();

    oasys::ScopeLock l(&lock_, "NeighborTable::dump");

    buf->appendf("Neighbors (%zu):\n", neighbors_.size());
    NeighborVector::const_iterator iter;
    for (iter = neighbors_.begin(); iter != neighbors_.end(); ++iter) {
        u_int64_t age = (now > iter->last_contact_millis_) ?
                        (now - iter->last_contact_millis_) : 0;
        buf->appendf("  %-16s %-32s quality %.2f %s last contact %" PRIu64 " ms ago\n",
                     iter->id_.c_str(), iter->eid_.c_str(), iter->link_quality_,
                     iter->active_ ? "active  " : "inactive", age);
    }
}

} // namespace skydtn
