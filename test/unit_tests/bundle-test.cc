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

#include <stdint.h>
#include <unistd.h>

#include <oasys/util/StringBuffer.h>
#include <oasys/util/UnitTest.h>

#include "bundling/Bundle.h"
#include "skydtn_errno.h"

using namespace skydtn;

DECLARE_TEST(CreateDefaults) {
    Bundle b = Bundle::create("dtn://a", "dtn://b", "ping");

    CHECK_EQUAL(b.version(), Bundle::BUNDLE_PROTOCOL_VERSION);
    CHECK_EQUALSTR(b.source(), "dtn://a");
    CHECK_EQUALSTR(b.dest(), "dtn://b");
    CHECK_EQUALSTR(b.report_to(), "dtn://a");
    CHECK_EQUALSTR(b.payload(), "ping");
    CHECK_EQUAL(b.priority(), Bundle::COS_NORMAL);
    CHECK_EQUAL(b.hop_count(), 0);
    CHECK_EQUAL_U64(b.lifetime_millis(),
                    Bundle::params_.default_lifetime_secs_ * 1000);
    CHECK(b.id().size() != 0);
    CHECK(! b.is_expired());
    CHECK_EQUAL(b.validate(), SKYDTN_SUCCESS);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(UniqueIds) {
    Bundle b1 = Bundle::create("dtn://a", "dtn://b", "one");
    Bundle b2 = Bundle::create("dtn://a", "dtn://b", "one");

    CHECK(b1.id() != b2.id());
    CHECK(b1 != b2);
    CHECK(b1 == b1);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(ValidateEndpoints) {
    oasys::StringBuffer errbuf;

    Bundle nosrc = Bundle::create("", "dtn://b", "x");
    CHECK_EQUAL(nosrc.validate(&errbuf), SKYDTN_EVALIDATION);
    CHECK(errbuf.length() != 0);

    Bundle nodst = Bundle::create("dtn://a", "", "x");
    CHECK_EQUAL(nodst.validate(), SKYDTN_EVALIDATION);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(ValidateExpired) {
    Bundle b = Bundle::create("dtn://a", "dtn://b", "x", 1);
    usleep(20000);

    CHECK(b.is_expired());
    CHECK_EQUAL_U64(b.time_to_expiration_millis(), 0);
    CHECK_EQUAL(b.validate(), SKYDTN_EVALIDATION);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(ZeroLifetime) {
    // valid only strictly before creation + lifetime, so a bundle with
    // no lifetime never validates, even within its creation millisecond
    Bundle b = Bundle::create("dtn://a", "dtn://b", "x", 0);

    CHECK_EQUAL(b.validate(), SKYDTN_EVALIDATION);
    CHECK_EQUAL_U64(b.time_to_expiration_millis(), 0);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(HugeLifetime) {
    CHECK_EQUAL_U64(Bundle::lifetime_secs_to_millis(5), 5000);
    CHECK_EQUAL_U64(Bundle::lifetime_secs_to_millis(UINT64_MAX), UINT64_MAX);
    CHECK_EQUAL_U64(Bundle::lifetime_secs_to_millis(UINT64_MAX / 1000 + 1),
                    UINT64_MAX);

    Bundle b = Bundle::create("dtn://a", "dtn://b", "x",
                              Bundle::lifetime_secs_to_millis(UINT64_MAX));
    CHECK_EQUAL_U64(b.expiration_millis(), UINT64_MAX);
    CHECK(! b.is_expired());
    CHECK(b.time_to_expiration_millis() > 0);
    CHECK_EQUAL(b.validate(), SKYDTN_SUCCESS);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(SetPriority) {
    Bundle b = Bundle::create("dtn://a", "dtn://b", "x");

    CHECK_EQUAL(b.set_priority(-1), SKYDTN_EVALIDATION);
    CHECK_EQUAL(b.set_priority(3), SKYDTN_EVALIDATION);
    CHECK_EQUAL(b.priority(), Bundle::COS_NORMAL);

    CHECK_EQUAL(b.set_priority(Bundle::COS_EXPEDITED), SKYDTN_SUCCESS);
    CHECK_EQUAL(b.priority(), Bundle::COS_EXPEDITED);
    CHECK_EQUAL(b.set_priority(Bundle::COS_BULK), SKYDTN_SUCCESS);
    CHECK_EQUAL(b.priority(), Bundle::COS_BULK);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(HopCeiling) {
    u_int64_t saved = Bundle::params_.max_hop_count_;
    Bundle::params_.max_hop_count_ = 2;

    Bundle b = Bundle::create("dtn://a", "dtn://b", "x");

    b.increment_hop("n1");
    CHECK_EQUALSTR(b.prevhop(), "n1");
    CHECK(! b.exceeds_hop_limit());

    b.increment_hop("n2");
    CHECK_EQUAL(b.hop_count(), 2);
    CHECK(! b.exceeds_hop_limit());
    CHECK_EQUAL(b.validate(), SKYDTN_SUCCESS);

    b.increment_hop("n3");
    CHECK_EQUAL(b.hop_count(), 3);
    CHECK_EQUALSTR(b.prevhop(), "n3");
    CHECK(b.exceeds_hop_limit());
    CHECK_EQUAL(b.validate(), SKYDTN_EVALIDATION);

    Bundle::params_.max_hop_count_ = saved;
    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(CloneIsIndependent) {
    Bundle b = Bundle::create("dtn://a", "dtn://b", "payload");
    SPtr_Bundle copy = b.clone();

    CHECK(copy.get() != &b);
    CHECK(copy->same_contents(b));
    CHECK(*copy == b);

    copy->increment_hop("n1");
    CHECK_EQUAL(b.hop_count(), 0);
    CHECK(b.prevhop().empty());
    CHECK(! copy->same_contents(b));

    // transit state changes do not change identity
    CHECK(*copy == b);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TEST(Size) {
    Bundle small = Bundle::create("dtn://a", "dtn://b", "");
    Bundle big   = Bundle::create("dtn://a", "dtn://b", std::string(1000, 'x'));

    CHECK_EQUAL(big.size() - small.size(), 1000);

    return oasys::UNIT_TEST_PASSED;
}

DECLARE_TESTER(BundleTester) {
    ADD_TEST(CreateDefaults);
    ADD_TEST(UniqueIds);
    ADD_TEST(ValidateEndpoints);
    ADD_TEST(ValidateExpired);
    ADD_TEST(ZeroLifetime);
    ADD_TEST(HugeLifetime);
    ADD_TEST(SetPriority);
    ADD_TEST(HopCeiling);
    ADD_TEST(CloneIsIndependent);
    ADD_TEST(Size);
}

DECLARE_TEST_FILE(BundleTester, "bundle test");
