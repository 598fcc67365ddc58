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

#include <oasys/util/StringBuffer.h>
#include <oasys/util/UnitTest.h>

#include "bundling/Bundle.h"
#include "contacts/Neighbor.h"
#include "routing/BundleRouter.h"
#include "routing/EnergyAwareRouter.h"
#include "skydtn_errno.h"

using namespace oasys;
using namespace skydtn;

Bundle g_bundle;

DECLARE_TEST(Init) {
    g_bundle = Bundle::create("dtn://a", "dtn://far", "ping");
    return UNIT_TEST_PASSED;
}

DECLARE_TEST(Factory) {
    BundleRouter* r = BundleRouter::create_router("energy");
    CHECK(r != NULL);
    CHECK_EQUALSTR(r->name(), "energy");
    CHECK(dynamic_cast<EnergyAwareRouter*>(r) != NULL);
    delete r;

    r = BundleRouter::create_router("static");
    CHECK(r != NULL);
    CHECK_EQUALSTR(r->name(), "static");
    delete r;

    CHECK(BundleRouter::create_router("learned") == NULL);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(NoRoute) {
    EnergyAwareRouter r;
    NeighborSnapshot n;
    std::string hop;

    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_ENOROUTE);

    n.push_back(Neighbor("b", "dtn://b", 0.9));
    n.push_back(Neighbor("c", "dtn://c", 0.9));
    n[0].active_ = false;
    n[1].active_ = false;
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_ENOROUTE);

    n[1].active_ = true;
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "c");

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(BestScore) {
    EnergyAwareRouter r;
    NeighborSnapshot n;
    std::string hop;

    n.push_back(Neighbor("b", "dtn://b", 0.4));
    n.push_back(Neighbor("c", "dtn://c", 0.9));
    n.push_back(Neighbor("d", "dtn://d", 0.6));

    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "c");

    // 0.7 * 0.9 + 0.3 * 1.0
    CHECK(r.score(n[1]) > 0.929 && r.score(n[1]) < 0.931);

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(LowQualityPenalty) {
    EnergyAwareRouter r;
    NeighborSnapshot n;
    std::string hop;

    // both below the quality threshold: 0.7 * q + 0.3 * 0.3
    n.push_back(Neighbor("weak", "dtn://weak", 0.29));
    n.push_back(Neighbor("weaker", "dtn://weaker", 0.25));

    CHECK(r.score(n[0]) > 0.292 && r.score(n[0]) < 0.294);
    CHECK(r.score(n[1]) > 0.264 && r.score(n[1]) < 0.266);
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "weak");

    // above the threshold the full energy score applies
    n[1].link_quality_ = 0.31;
    CHECK(r.score(n[1]) > 0.516 && r.score(n[1]) < 0.518);
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "weaker");

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(LowEnergyNeighbor) {
    EnergyAwareRouter r;
    NeighborSnapshot n;
    std::string hop;

    n.push_back(Neighbor("drained", "dtn://drained", 0.8));
    n.push_back(Neighbor("healthy", "dtn://healthy", 0.8));

    // equal scores: the first one seen wins
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "drained");

    r.update_energy("drained", 10.0);
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "healthy");

    StringBuffer buf;
    r.get_routing_state(&buf);
    CHECK(buf.length() != 0);

    r.clear_energy("drained");
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "drained");

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(DirectNeighbor) {
    EnergyAwareRouter r;
    NeighborSnapshot n;
    std::string hop;

    n.push_back(Neighbor("relay", "dtn://relay", 1.0));
    n.push_back(Neighbor("far", "dtn://far", 0.2));

    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "far");

    return UNIT_TEST_PASSED;
}

DECLARE_TEST(ConfiguredWeights) {
    EnergyAwareRouter r;
    NeighborSnapshot n;
    std::string hop;

    BundleRouter::Config saved = BundleRouter::config_;

    n.push_back(Neighbor("strong", "dtn://strong", 0.9));
    n.push_back(Neighbor("charged", "dtn://charged", 0.5));
    r.update_energy("strong", 5.0);

    // quality only: strong link wins despite its battery
    BundleRouter::config_.quality_weight_ = 1.0;
    BundleRouter::config_.energy_weight_  = 0.0;
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "strong");

    // energy only
    BundleRouter::config_.quality_weight_ = 0.0;
    BundleRouter::config_.energy_weight_  = 1.0;
    CHECK_EQUAL(r.select_next_hop(g_bundle, n, &hop), SKYDTN_SUCCESS);
    CHECK_EQUALSTR(hop, "charged");

    BundleRouter::config_ = saved;
    return UNIT_TEST_PASSED;
}

DECLARE_TEST(InvalidWeights) {
    BundleRouter::Config saved = BundleRouter::config_;
    StringBuffer errbuf;

    CHECK_EQUAL(BundleRouter::validate_config(), SKYDTN_SUCCESS);

    BundleRouter::config_.quality_weight_ = 0.7;
    BundleRouter::config_.energy_weight_  = 0.7;
    CHECK_EQUAL(BundleRouter::validate_config(&errbuf), SKYDTN_EVALIDATION);
    CHECK(errbuf.length() != 0);
    CHECK(BundleRouter::create_router("energy") == NULL);

    // the static router does not score neighbors
    BundleRouter* r = BundleRouter::create_router("static");
    CHECK(r != NULL);
    delete r;

    BundleRouter::config_.quality_weight_ = 1.2;
    BundleRouter::config_.energy_weight_  = -0.2;
    CHECK_EQUAL(BundleRouter::validate_config(), SKYDTN_EVALIDATION);

    // rounding in the configured values is tolerated
    BundleRouter::config_.quality_weight_ = 0.6;
    BundleRouter::config_.energy_weight_  = 0.4000000001;
    CHECK_EQUAL(BundleRouter::validate_config(), SKYDTN_SUCCESS);

    BundleRouter::config_ = saved;
    BundleRouter::config_.low_quality_threshold_ = 1.5;
    CHECK_EQUAL(BundleRouter::validate_config(), SKYDTN_EVALIDATION);

    BundleRouter::config_ = saved;
    return UNIT_TEST_PASSED;
}

DECLARE_TESTER(EnergyAwareRouterTester) {
    ADD_TEST(Init);
    ADD_TEST(Factory);
    ADD_TEST(NoRoute);
    ADD_TEST(BestScore);
    ADD_TEST(LowQualityPenalty);
    ADD_TEST(LowEnergyNeighbor);
    ADD_TEST(DirectNeighbor);
    ADD_TEST(ConfiguredWeights);
    ADD_TEST(InvalidWeights);
}

DECLARE_TEST_FILE(EnergyAwareRouterTester, "energy aware router test");
