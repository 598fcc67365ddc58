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

#include <string>

#include <oasys/util/Time.h>
#include <oasys/util/UnitTest.h>

#include "bundling/BoundedMsgQueue.h"

using namespace oasys;
using namespace skydtn;

DECLARE_TEST(Bounded) {
    BoundedMsgQueue<int> q(3);

    CHECK_EQUAL(q.capacity(), 3);
    CHECK(q.try_push(1));
    CHECK(q.try_push(2));
    CHECK(q.try_push(3));
    CHECK(! q.try_push(4));
    CHECK_EQUAL(q.size(), 3);
    CHECK_EQUAL(q.max_size(), 3);

    int v = 0;
    CHECK(q.try_pop(&v));
    CHECK_EQUAL(v, 1);
    CHECK(q.try_push(4));

    CHECK(q.try_pop(&v));
    CHECK_EQUAL(v, 2);
    CHECK(q.try_pop(&v));
    CHECK_EQUAL(v, 3);
    CHECK(q.try_pop(&v));
    CHECK_EQUAL(v, 4);
    CHECK(! q.try_pop(&v));

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Unbounded) {
    BoundedMsgQueue<std::string> q(0);

    for (int i = 0; i < 5000; ++i) {
        CHECK(q.try_push("x"));
    }
    CHECK_EQUAL(q.size(), 5000);

    q.clear();
    CHECK_EQUAL(q.size(), 0);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(WaitAndClose) {
    BoundedMsgQueue<int> q(2);

    Time t;
    t.get_time();
    CHECK(! q.wait_for_millisecs(50));

    CHECK(q.try_push(7));
    CHECK(q.wait_for_millisecs(1000));

    q.close();
    CHECK(q.is_closed());
    CHECK(! q.try_push(8));

    // queued entries still drain after close
    int v = 0;
    CHECK(q.try_pop(&v));
    CHECK_EQUAL(v, 7);

    // a closed queue never blocks
    t.get_time();
    CHECK(! q.wait_for_millisecs(1000));
    CHECK(t.elapsed_ms() < 500);

    return UNIT_TEST_PASSED;
}

DECLARE_TESTER(BoundedMsgQueueTester) {
    ADD_TEST(Bounded);
    ADD_TEST(Unbounded);
    ADD_TEST(WaitAndClose);
}

DECLARE_TEST_FILE(BoundedMsgQueueTester, "bounded message queue test");
