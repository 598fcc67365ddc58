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

#include <oasys/util/UnitTest.h>

#include "bundling/BundleStatus.h"

using namespace skydtn;

DECLARE_TEST(Names) {
    bundle_status_t status;

    CHECK_EQUALSTR(bundle_status_to_str(BUNDLE_PENDING), "pending");
    CHECK_EQUALSTR(bundle_status_to_str(BUNDLE_IN_TRANSIT), "in_transit");

    CHECK(str_to_bundle_status("delivered", &status));
    CHECK_EQUAL(status, BUNDLE_DELIVERED);
    CHECK(str_to_bundle_status("expired", &status));
    CHECK_EQUAL(status, BUNDLE_EXPIRED);
    CHECK(! str_to_bundle_status("lost", &status));

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(Terminal) {
    CHECK(! bundle_status_is_terminal(BUNDLE_PENDING));
    CHECK(! bundle_status_is_terminal(BUNDLE_IN_TRANSIT));
    CHECK(bundle_status_is_terminal(BUNDLE_DELIVERED));
    CHECK(bundle_status_is_terminal(BUNDLE_EXPIRED));
    CHECK(bundle_status_is_terminal(BUNDLE_FAILED));

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(Transitions) {
    CHECK(bundle_status_transition_ok(BUNDLE_PENDING, BUNDLE_IN_TRANSIT));
    CHECK(bundle_status_transition_ok(BUNDLE_PENDING, BUNDLE_DELIVERED));
    CHECK(bundle_status_transition_ok(BUNDLE_PENDING, BUNDLE_EXPIRED));
    CHECK(bundle_status_transition_ok(BUNDLE_IN_TRANSIT, BUNDLE_FAILED));
    CHECK(bundle_status_transition_ok(BUNDLE_IN_TRANSIT, BUNDLE_IN_TRANSIT));
    CHECK(! bundle_status_transition_ok(BUNDLE_IN_TRANSIT, BUNDLE_PENDING));

    // terminal states are final, repeating one is a no-op
    CHECK(bundle_status_transition_ok(BUNDLE_DELIVERED, BUNDLE_DELIVERED));
    CHECK(! bundle_status_transition_ok(BUNDLE_DELIVERED, BUNDLE_PENDING));
    CHECK(! bundle_status_transition_ok(BUNDLE_EXPIRED, BUNDLE_IN_TRANSIT));
    CHECK(! bundle_status_transition_ok(BUNDLE_FAILED, BUNDLE_DELIVERED));

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TESTER(BundleStatusTester) {
    ADD_TEST(Names);
    ADD_TEST(Terminal);
    ADD_TEST(Transitions);
}

DECLARE_TEST_FILE(BundleStatusTester, "bundle status test");
