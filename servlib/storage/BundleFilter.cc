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

#include <algorithm>
#include <string.h>

#include "BundleFilter.h"
#include "StoredBundle.h"

namespace skydtn {

//----------------------------------------------------------------------
const char*
BundleFilter::order_to_str(order_t order)
{
    switch (order) {
    case ORDER_NONE:     return "none";
    case ORDER_PRIORITY: return "priority";
    case ORDER_AGE:      return "age";
    case ORDER_SIZE:     return "size";
    }
    return "(unknown order)";
}

//----------------------------------------------------------------------
bool
BundleFilter::str_to_order(const char* str, order_t* order)
{
    static const order_t all[] = {
        ORDER_NONE, ORDER_PRIORITY, ORDER_AGE, ORDER_SIZE
    };

    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (strcasecmp(str, order_to_str(all[i])) == 0) {
            *order = all[i];
            return true;
        }
    }
    return false;
}

//----------------------------------------------------------------------
BundleFilter::BundleFilter()
    : has_status_(false),
      status_(BUNDLE_PENDING),
      min_priority_(-1),
      max_age_millis_(0),
      limit_(0),
      order_(ORDER_NONE)
{
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_dest(const std::string& dest)
{
    dest_ = dest;
    return *this;
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_source(const std::string& source)
{
    source_ = source;
    return *this;
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_status(bundle_status_t status)
{
    has_status_ = true;
    status_ = status;
    return *this;
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_min_priority(int priority)
{
    min_priority_ = priority;
    return *this;
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_max_age_millis(u_int64_t max_age)
{
    max_age_millis_ = max_age;
    return *this;
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_limit(size_t limit)
{
    limit_ = limit;
    return *this;
}

//----------------------------------------------------------------------
BundleFilter&
BundleFilter::set_order(order_t order)
{
    order_ = order;
    return *this;
}

//----------------------------------------------------------------------
bool
BundleFilter::matches(const StoredBundle& stored, u_int64_t now_millis) const
{
    const Bundle& b = stored.bundle_;

    if (!dest_.empty() && b.dest() != dest_) {
        return false;
    }
    if (!source_.empty() && b.source() != source_) {
        return false;
    }
    if (has_status_ && stored.status_ != status_) {
        return false;
    }
    if (min_priority_ >= 0 && b.priority() < min_priority_) {
        return false;
    }
    if (max_age_millis_ != 0 && now_millis > stored.stored_millis_ &&
        (now_millis - stored.stored_millis_) > max_age_millis_) {
        return false;
    }
    return true;
}

//----------------------------------------------------------------------
namespace {

bool
higher_priority(const StoredBundle* a, const StoredBundle* b)
{
    if (a->bundle_.priority() != b->bundle_.priority()) {
        return a->bundle_.priority() > b->bundle_.priority();
    }
    return a->bundle_.creation_ts() < b->bundle_.creation_ts();
}

bool
older(const StoredBundle* a, const StoredBundle* b)
{
    return a->bundle_.creation_ts() < b->bundle_.creation_ts();
}

bool
larger(const StoredBundle* a, const StoredBundle* b)
{
    return a->bundle_.size() > b->bundle_.size();
}

} // namespace

//----------------------------------------------------------------------
void
BundleFilter::finish(std::vector<const StoredBundle*>* matched) const
{
    switch (order_) {
    case ORDER_PRIORITY:
        std::stable_sort(matched->begin(), matched->end(), higher_priority);
        break;
    case ORDER_AGE:
        std::stable_sort(matched->begin(), matched->end(), older);
        break;
    case ORDER_SIZE:
        std::stable_sort(matched->begin(), matched->end(), larger);
        break;
    case ORDER_NONE:
        break;
    }

    if (limit_ != 0 && matched->size() > limit_) {
        matched->resize(limit_);
    }
}

} // namespace skydtn
