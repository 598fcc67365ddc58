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

#include <string.h>

#include "BundleStatus.h"

namespace skydtn {

//----------------------------------------------------------------------
const char*
bundle_status_to_str(bundle_status_t status)
{
    switch(status) {
    case BUNDLE_PENDING:    return "pending";
    case BUNDLE_IN_TRANSIT: return "in_transit";
    case BUNDLE_DELIVERED:  return "delivered";
    case BUNDLE_EXPIRED:    return "expired";
    case BUNDLE_FAILED:     return "failed";
    }

    return "(unknown status)";
}

//----------------------------------------------------------------------
bool
str_to_bundle_status(const char* str, bundle_status_t* status)
{
    static const bundle_status_t all[] = {
        BUNDLE_PENDING, BUNDLE_IN_TRANSIT, BUNDLE_DELIVERED,
        BUNDLE_EXPIRED, BUNDLE_FAILED
    };

    for (size_t i = 0; i < sizeof(all) / sizeof(all[0]); ++i) {
        if (strcasecmp(str, bundle_status_to_str(all[i])) == 0) {
            *status = all[i];
            return true;
        }
    }

    return false;
}

//----------------------------------------------------------------------
bool
bundle_status_is_terminal(bundle_status_t status)
{
    return (status == BUNDLE_DELIVERED ||
            status == BUNDLE_EXPIRED   ||
            status == BUNDLE_FAILED);
}

//----------------------------------------------------------------------
bool
bundle_status_transition_ok(bundle_status_t from, bundle_status_t to)
{
    if (from == to) {
        return true;
    }

    switch (from) {
    case BUNDLE_PENDING:
        return true;

    case BUNDLE_IN_TRANSIT:
        return bundle_status_is_terminal(to);

    default:
        // terminal states are final
        return false;
    }
}

} // namespace skydtn
