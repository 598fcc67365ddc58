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

#ifndef _BUNDLETIMESTAMP_H_
#define _BUNDLETIMESTAMP_H_

#include <sys/types.h>

namespace skydtn {

/**
 * Bundle creation timestamp: milliseconds since Jan 1, 2000 (UTC)
 * plus a sequence number to distinguish bundles created within the
 * same millisecond.
 */
struct BundleTimestamp {
    u_int64_t millis_;  ///< Milliseconds since 1/1/2000
    u_int64_t seqno_;   ///< Sequence number

    BundleTimestamp()
        : millis_(0),
          seqno_(0) {}

    BundleTimestamp(u_int64_t millis, u_int64_t seqno)
        : millis_(millis),
          seqno_(seqno) {}

    /**
     * Return the current time in milliseconds since Jan 1, 2000.
     */
    static u_int64_t get_current_time_millis();

    /**
     * Build a timestamp for a newly created bundle, allocating the
     * next process-wide sequence number.
     */
    static BundleTimestamp now();

    /**
     * Check that the local clock setting is valid (i.e. is at least
     * up to date with the protocol epoch).
     */
    static bool check_local_clock();

    bool operator==(const BundleTimestamp& other) const
    {
        return millis_ == other.millis_ && seqno_ == other.seqno_;
    }

    bool operator<(const BundleTimestamp& other) const
    {
        if (millis_ < other.millis_) return true;
        if (millis_ > other.millis_) return false;
        return (seqno_ < other.seqno_);
    }

    /**
     * The number of seconds between 1/1/1970 and 1/1/2000.
     */
    static const u_int64_t TIMEVAL_CONVERSION_SECS;
};

} // namespace skydtn

#endif /* _BUNDLETIMESTAMP_H_ */
