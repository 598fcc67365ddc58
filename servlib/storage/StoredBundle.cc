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

#include "StoredBundle.h"

namespace skydtn {

//----------------------------------------------------------------------
StoredBundle::StoredBundle()
    : status_(BUNDLE_PENDING),
      stored_millis_(0)
{
}

//----------------------------------------------------------------------
StoredBundle::StoredBundle(const oasys::Builder& b)
    : bundle_(b),
      status_(BUNDLE_PENDING),
      stored_millis_(0)
{
}

//----------------------------------------------------------------------
StoredBundle::StoredBundle(const Bundle& bundle, bundle_status_t status)
    : bundle_(bundle),
      status_(status),
      stored_millis_(BundleTimestamp::get_current_time_millis())
{
}

//----------------------------------------------------------------------
StoredBundle::~StoredBundle()
{
}

//----------------------------------------------------------------------
void
StoredBundle::serialize(oasys::SerializeAction* a)
{
    u_int32_t status = status_;

    a->process("bundle", &bundle_);
    a->process("status", &status);
    a->process("stored_time", &stored_millis_);

    if (a->action_code() == oasys::Serialize::UNMARSHAL) {
        status_ = (bundle_status_t)status;
    }
}

} // namespace skydtn
