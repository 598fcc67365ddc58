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

#include "skydtn_errno.h"

namespace skydtn {

//----------------------------------------------------------------------
const char*
skydtn_strerror(int err)
{
    switch(err) {
    case SKYDTN_SUCCESS:     return "success";
    case SKYDTN_EVALIDATION: return "validation error";
    case SKYDTN_ENOTFOUND:   return "not found";
    case SKYDTN_ECAPACITY:   return "capacity exceeded";
    case SKYDTN_ENOROUTE:    return "no route";
    case SKYDTN_ESTATE:      return "invalid node state";
    case SKYDTN_EINTERNAL:   return "internal error";
    }

    return "(unknown error)";
}

} // namespace skydtn
