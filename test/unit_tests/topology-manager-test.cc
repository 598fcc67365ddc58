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

#include <math.h>

#include <oasys/util/UnitTest.h>

#include "contacts/TopologyManager.h"
#include "skydtn_errno.h"

using namespace oasys;
using namespace skydtn;

SatelliteState
make_sat(const char* id, double x, double y, double z, double battery = 100.0)
{
    SatelliteState s;
    s.id_          = id;
    s.eid_         = std::string("dtn://") + id;
    s.position_    = Position(x, y, z);
    s.battery_pct_ = battery;
    return s;
}

bool
near(double a, double b)
{
    return fabs(a - b) < 1e-6;
}

DECLARE_TEST(UpdateAndGet) {
    TopologyManager tm;
    SatelliteState s;

    CHECK_EQUAL(tm.get_satellite("a", &s), SKYDTN_ENOTFOUND);

    tm.update_satellite(make_sat("a", 1, 2, 3));
    CHECK_EQUAL(tm.size(), 1);
    CHECK_EQUAL(tm.get_satellite("a", &s), SKYDTN_SUCCESS);
    CHECK(near(s.position_.y_, 2));
    CHECK(s.last_update_millis_ != 0);

    // upsert by id
    tm.update_satellite(make_sat("a", 9, 9, 9));
    CHECK_EQUAL(tm.size(), 1);
    CHECK_EQUAL(tm.get_satellite("a", &s), SKYDTN_SUCCESS);
    CHECK(near(s.position_.x_, 9));

    CHECK_EQUAL(tm.remove_satellite("a"), SKYDTN_SUCCESS);
    CHECK_EQUAL(tm.remove_satellite("a"), SKYDTN_ENOTFOUND);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Visibility) {
    TopologyManager tm;
    SatelliteList l;

    CHECK_EQUAL(tm.get_visible_neighbors("a", &l), SKYDTN_ENOTFOUND);

    tm.update_satellite(make_sat("a", 0, 0, 0));
    tm.update_satellite(make_sat("c", 3000, 4000, 0));     // 5000 km, at the edge
    tm.update_satellite(make_sat("b", 1000, 0, 0));
    tm.update_satellite(make_sat("d", 6000, 0, 0));        // out of range

    CHECK_EQUAL(tm.get_visible_neighbors("a", &l), SKYDTN_SUCCESS);
    CHECK_EQUAL(l.size(), 2);
    CHECK_EQUALSTR(l[0].id_, "b");
    CHECK_EQUALSTR(l[1].id_, "c");

    // symmetric
    CHECK_EQUAL(tm.get_visible_neighbors("c", &l), SKYDTN_SUCCESS);
    bool sees_a = false;
    for (size_t i = 0; i < l.size(); ++i) {
        if (l[i].id_ == "a") sees_a = true;
    }
    CHECK(sees_a);

    double d;
    CHECK_EQUAL(tm.distance("a", "c", &d), SKYDTN_SUCCESS);
    CHECK(near(d, 5000));
    CHECK_EQUAL(tm.distance("a", "zz", &d), SKYDTN_ENOTFOUND);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Predict) {
    TopologyManager tm;

    SatelliteState s = make_sat("a", 100, 0, -50);
    s.velocity_ = Position(7.5, -1, 0);
    tm.update_satellite(s);

    Position p = TopologyManager::predict_position(s, 10);
    CHECK(near(p.x_, 175));
    CHECK(near(p.y_, -10));
    CHECK(near(p.z_, -50));

    Position q;
    CHECK_EQUAL(tm.predict_position("a", 0, &q), SKYDTN_SUCCESS);
    CHECK(near(q.x_, 100));
    CHECK_EQUAL(tm.predict_position("b", 1, &q), SKYDTN_ENOTFOUND);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(LinkQuality) {
    CHECK(near(TopologyManager::link_quality(0), 1.0));
    CHECK(near(TopologyManager::link_quality(2500), 0.5));
    CHECK(near(TopologyManager::link_quality(5000), 0.0));
    CHECK(near(TopologyManager::link_quality(9000), 0.0));

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Statistics) {
    TopologyManager tm;

    SatelliteState dark = make_sat("c", 0, 0, 0, 50);
    dark.in_eclipse_ = true;

    tm.update_satellite(make_sat("a", 0, 0, 0, 90));
    tm.update_satellite(make_sat("b", 0, 0, 0, 10));
    tm.update_satellite(dark);

    TopologyManager::NetworkStatistics stats = tm.get_network_statistics();
    CHECK_EQUAL(stats.total_, 3);
    CHECK_EQUAL(stats.low_battery_count_, 1);
    CHECK_EQUAL(stats.eclipse_count_, 1);

    return UNIT_TEST_PASSED;
}

DECLARE_TESTER(TopologyManagerTester) {
    ADD_TEST(UpdateAndGet);
    ADD_TEST(Visibility);
    ADD_TEST(Predict);
    ADD_TEST(LinkQuality);
    ADD_TEST(Statistics);
}

DECLARE_TEST_FILE(TopologyManagerTester, "topology manager test");
