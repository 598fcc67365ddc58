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

#include "bundling/Bundle.h"
#include "contacts/Neighbor.h"
#include "routing/StaticBundleRouter.h"
#include "skydtn_errno.h"

using namespace oasys;
using namespace skydtn;

NeighborSnapshot
make_neighbors()
{
    NeighborSnapshot n;
    n.push_back(Neighbor("b", "dtn://b", 0.5));
    n.push_back(Neighbor("c", "dtn://c", 0.5));
    n.push_back(Neighbor("d", "dtn://d", 0.5));
    return n;
}

DECLARE_TEST(AddDel) {
    StaticBundleRouter r;

    r.add_route("dtn://ground", "b");
    r.add_route("dtn://ground/ops", "c");
    CHECK_EQUAL(r.num_routes(), 2);

    // replacing keeps one entry per destination
    r.add_route("dtn://ground", "d");
    CHECK_EQUAL(r.num_routes(), 2);

    CHECK_EQUAL(r.del_route("dtn://ground"), SKYDTN_SUCCESS);
    CHECK_EQUAL(r.del_route("dtn://ground"), SKYDTN_ENOTFOUND);
    CHECK_EQUAL(r.num_routes(), 1);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(LongestPrefix) {
    StaticBundleRouter r;
    NeighborSnapshot n = make_neighbors();
    std::string hop;

    r.add_route("dtn://ground", "b");
    r.add_route("dtn://ground/ops", "c");

    Bundle ops = Bundle::create("dtn://a", "dtn://ground/ops/console", "x");
    CHECK_EQUAL(r.select_next_hop(ops, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "c");

    Bundle other = Bundle::create("dtn://a", "dtn://ground/archive", "x");
    CHECK_EQUAL(r.select_next_hop(other, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "b");

    // an inactive next hop falls back to the shorter prefix
    n[1].active_ = false;
    CHECK_EQUAL(r.select_next_hop(ops, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "b");

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(DirectWins) {
    StaticBundleRouter r;
    NeighborSnapshot n = make_neighbors();
    std::string hop;

    r.add_route("dtn://", "b");

    Bundle b = Bundle::create("dtn://a", "dtn://d", "x");
    CHECK_EQUAL(r.select_next_hop(b, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "d");

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Fallback) {
    StaticBundleRouter r;
    NeighborSnapshot n = make_neighbors();
    std::string hop;

    // no route matches: the first active neighbor is used
    Bundle b = Bundle::create("dtn://a", "dtn://unknown", "x");
    n[0].active_ = false;
    CHECK_EQUAL(r.select_next_hop(b, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "c");

    // a route whose neighbor is inactive also falls back
    r.add_route("dtn://unknown", "b");
    CHECK_EQUAL(r.select_next_hop(b, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "c");

    NeighborSnapshot empty;
    CHECK_EQUAL(r.select_next_hop(b, empty, &hop), SKYDTN_ENOROUTE);

    for (size_t i = 0; i < n.size(); ++i) {
        n[i].active_ = false;
    }
    CHECK_EQUAL(r.select_next_hop(b, n, &hop), SKYDTN_ENOROUTE);

    return UNIT_TEST_PASSED;
}

DECLARE_TESTER(StaticRouterTester) {
    ADD_TEST(AddDel);
    ADD_TEST(LongestPrefix);
    ADD_TEST(DirectWins);
    ADD_TEST(Fallback);
}

DECLARE_TEST_FILE(StaticRouterTester, "static router test");
