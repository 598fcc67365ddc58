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

#ifndef _BUNDLE_FILTER_H_
#define _BUNDLE_FILTER_H_

#include <string>
#include <vector>

#include <oasys/compat/inttypes.h>

#include "bundling/BundleStatus.h"

namespace skydtn {

class StoredBundle;

/**
 * Selection criteria for BundleStore::list. Every criterion is
 * optional and all those that are set must match.
 */
struct BundleFilter {
    /**
     * Result ordering.
     */
    typedef enum {
        ORDER_NONE = 0,  ///< unordered snapshot
        ORDER_PRIORITY,  ///< highest priority first
        ORDER_AGE,       ///< oldest creation time first
        ORDER_SIZE,      ///< largest first
    } order_t;

    static const char* order_to_str(order_t order);
    static bool str_to_order(const char* str, order_t* order);

    BundleFilter();

    /// @{ Builder style setters
    BundleFilter& set_dest(const std::string& dest);
    BundleFilter& set_source(const std::string& source);
    BundleFilter& set_status(bundle_status_t status);
    BundleFilter& set_min_priority(int priority);
    BundleFilter& set_max_age_millis(u_int64_t max_age);
    BundleFilter& set_limit(size_t limit);
    BundleFilter& set_order(order_t order);
    /// @}

    /**
     * Check a stored record against every criterion except the limit.
     */
    bool matches(const StoredBundle& stored, u_int64_t now_millis) const;

    /**
     * Order the matching records and cut the result at the limit.
     */
    void finish(std::vector<const StoredBundle*>* matched) const;

    std::string     dest_;              ///< empty for any
    std::string     source_;            ///< empty for any
    bool            has_status_;
    bundle_status_t status_;
    int             min_priority_;      ///< -1 for any
    u_int64_t       max_age_millis_;    ///< stored within this long, 0 for any
    size_t          limit_;             ///< 0 for no limit
    order_t         order_;
};

} // namespace skydtn

#endif /* _BUNDLE_FILTER_H_ */
