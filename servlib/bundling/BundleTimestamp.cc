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

#include <sys/time.h>
#include <time.h>

#include <oasys/debug/Log.h>
#include <oasys/thread/SpinLock.h>

#include "BundleTimestamp.h"

namespace skydtn {

const u_int64_t BundleTimestamp::TIMEVAL_CONVERSION_SECS = 946684800;

static oasys::SpinLock seqno_lock_;
static u_int64_t       last_seqno_ = 0;

//----------------------------------------------------------------------
u_int64_t
BundleTimestamp::get_current_time_millis()
{
    struct timeval now;
    ::gettimeofday(&now, 0);

    u_int64_t secs = now.tv_sec;
    if (secs < TIMEVAL_CONVERSION_SECS) {
        return 0;
    }

    return ((secs - TIMEVAL_CONVERSION_SECS) * 1000) + (now.tv_usec / 1000);
}

//----------------------------------------------------------------------
BundleTimestamp
BundleTimestamp::now()
{
    oasys::ScopeLock l(&seqno_lock_, "BundleTimestamp::now");

    return BundleTimestamp(get_current_time_millis(), ++last_seqno_);
}

//----------------------------------------------------------------------
bool
BundleTimestamp::check_local_clock()
{
    struct timeval now;
    ::gettimeofday(&now, 0);

    if ((u_int64_t)now.tv_sec < TIMEVAL_CONVERSION_SECS) {
        time_t secs = now.tv_sec;
        log_err_p("/skydtn/bundle/timestamp",
                  "invalid local clock setting: "
                  "current time '%s' is before Jan 1, 2000",
                  ctime(&secs));
        return false;
    }

    return true;
}

} // namespace skydtn
