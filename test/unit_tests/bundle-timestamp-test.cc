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
#include "bundling/BundleTimestamp.h"

using namespace skydtn;

DECLARE_TEST(ClockTest) {
    CHECK(BundleTimestamp::check_local_clock());

    u_int64_t millis = BundleTimestamp::get_current_time_millis();

    // anything after 2020 in the 2000 epoch
    CHECK(millis > 630000000ULL * 1000ULL);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(NowTest) {
    BundleTimestamp prev = BundleTimestamp::now();

    for (int i = 0; i < 100; ++i) {
        BundleTimestamp ts = BundleTimestamp::now();

        CHECK(prev < ts);
        CHECK(! (ts == prev));
        CHECK(ts.millis_ >= prev.millis_);
        prev = ts;
    }

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(OrderTest) {
    BundleTimestamp a(1000, 5), b(1000, 6), c(1001, 0);

    CHECK(a < b);
    CHECK(b < c);
    CHECK(a < c);
    CHECK(! (c < a));
    CHECK(a == BundleTimestamp(1000, 5));

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TESTER(BundleTimestampTester) {
    ADD_TEST(ClockTest);
    ADD_TEST(NowTest);
    ADD_TEST(OrderTest);
}

DECLARE_TEST_FILE(BundleTimestampTester, "bundle timestamp test");
