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

#ifndef _BUNDLE_STATUS_H_
#define _BUNDLE_STATUS_H_

namespace skydtn {

/**
 * Custody status of one stored copy of a bundle. The status is
 * node-local bookkeeping kept by the BundleStore and is never part of
 * the Bundle itself.
 *
 * PENDING and IN_TRANSIT are the only non-terminal states.
 */
typedef enum {
    BUNDLE_PENDING = 0,
    BUNDLE_IN_TRANSIT,
    BUNDLE_DELIVERED,
    BUNDLE_EXPIRED,
    BUNDLE_FAILED,
} bundle_status_t;

/**
 * Pretty printer for bundle_status_t.
 */
const char* bundle_status_to_str(bundle_status_t status);

/**
 * Parse a status name as printed by bundle_status_to_str. Returns
 * false if the name is not recognized.
 */
bool str_to_bundle_status(const char* str, bundle_status_t* status);

/**
 * True for delivered, expired and failed.
 */
bool bundle_status_is_terminal(bundle_status_t status);

/**
 * Check whether a copy in status 'from' may move to 'to'. Setting the
 * current status again is always allowed and changes nothing.
 */
bool bundle_status_transition_ok(bundle_status_t from, bundle_status_t to);

} // namespace skydtn

#endif /* _BUNDLE_STATUS_H_ */
